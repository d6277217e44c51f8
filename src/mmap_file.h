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

#ifndef __PC_MMAP_FILE__
#define __PC_MMAP_FILE__

#include <stdint.h>
#include <string>

#include "file_io.h"

namespace pwcheck {

// Read-only memory mapped file. The whole file is mapped in one piece and
// the OS is told that it will be read sequentially.
class MmapFileIO : public FileIO {
public:
    explicit MmapFileIO(const std::string& fpath);
    ~MmapFileIO();

    // Result of opening the file in the constructor.
    int Status() const;
    // Map the whole file and issue sequential-access advisories. An empty
    // file is "mapped" with a NULL address and zero size.
    int MapFile();
    bool IsMapped() const;
    // Reset the advisories and unmap. Safe to call more than once.
    void UnMapFile();
    const uint8_t* GetMapAddr() const;
    size_t GetMapSize() const;
    bool IsAdvised() const;

private:
    int AdviseSequential();
    void ReleaseAdvice();

    int status;
    bool mmap_file;
    bool advised;
    size_t mmap_size;
    const uint8_t* addr;
};

}
#endif
