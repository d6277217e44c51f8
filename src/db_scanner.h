/**
 * Copyright (C) 2026 Cisco Inc.
 *
 * This program is free software: you can redistribute it and/or  modify
 * it under the terms of the GNU General Public License, version 2,
 * as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef __PC_DB_SCANNER_H__
#define __PC_DB_SCANNER_H__

#include <stdint.h>
#include <string>

#include "digest.h"
#include "mmap_file.h"

namespace pwcheck {

// One line of the breach database. The digest is decoded when the line is
// read, the occurrence count is left as text until it is needed.
// count_ptr points into the mapping and is only valid until the next call
// to BreachDBScanner::Next.
typedef struct _DatabaseEntry {
    Digest digest;
    const char* count_ptr;
    int count_len;
} DatabaseEntry;

// Forward-only cursor over a breach database file of lines
//     <40 hex digest>:<decimal count>\n  (or \r\n)
// The file is memory mapped and read front to back exactly once. To start
// over, construct a new scanner.
class BreachDBScanner {
public:
    // With HEX_CASE_AUTO the case of the first digest letter in the file is
    // enforced on every later line.
    BreachDBScanner(const std::string& db_path, int hex_case = HEX_CASE_AUTO);
    ~BreachDBScanner();

    // SUCCESS after a successful open and map, otherwise the setup error.
    int Status() const;

    // Returns SUCCESS and fills entry, END_OF_DATA at the end of the file,
    // or MALFORMED_DB_ENTRY (a hex letter of the wrong case included). A malformed line is fatal: every later call
    // returns the same error.
    int Next(DatabaseEntry& entry);
    // Decode the decimal count of entry.
    int ParseCount(const DatabaseEntry& entry, uint32_t& count) const;

    // Byte offset of the next line, for progress reporting.
    size_t Offset() const;
    size_t Size() const;
    int64_t LinesScanned() const;
    const uint8_t* GetMapAddr() const;
    const std::string& GetFilePath() const;

    // Release the mapping, the OS advisories and the descriptor.
    void Close();
    bool IsClosed() const;

private:
    int Malformed(const char* line, size_t len, const char* reason);

    MmapFileIO db_file;
    int hex_case;
    int status;
    bool closed;

    const char* base;
    size_t size;
    size_t offset;
    int64_t num_lines;
};

}

#endif
