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

#ifndef __PC_CREDENTIAL_READER_H__
#define __PC_CREDENTIAL_READER_H__

#include <stdint.h>
#include <string>

#include "credential.h"
#include "secure_buffer.h"

namespace pwcheck {

// Reads a password export in csv format, as written by Chromium
// (name,url,username,password) and Firefox ("url","username","password",...).
// Columns are located by the header row; only the password column is
// mandatory. The file is loaded into a SecureBuffer so every copy of the
// plaintext is wiped when the reader goes away.
class CredentialReader : public RowSource {
public:
    explicit CredentialReader(const std::string& csv_path);
    // Parse csv text held in memory. The data is copied.
    CredentialReader(const char* data, size_t len);
    virtual ~CredentialReader();

    // SUCCESS if the file was loaded and the header has a password column.
    int Status() const;
    virtual int Next(CredentialRecord& record);

    // Data rows seen so far, malformed ones included.
    int64_t RowCount() const;
    int64_t MalformedRows() const;

    // "username@url", or whichever of the two is not empty.
    static std::string MakeLabel(const std::string& username, const std::string& url,
        int64_t row);

private:
    int LoadFile(const std::string& path);
    int ParseHeader();
    int ReadField(bool& end_of_record);
    void SkipRecord();
    bool SkipBlankLines();

    int status;
    SecureBuffer content;
    size_t pos;
    // decoded value of the current field
    SecureBuffer field_buff;

    int url_col;
    int username_col;
    int password_col;

    int64_t num_rows;
    int64_t num_malformed;
};

}

#endif
