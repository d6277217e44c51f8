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

#include <errno.h>
#include <string.h>
#include <sys/mman.h>

#include "error.h"
#include "logger.h"
#include "mmap_file.h"

namespace pwcheck {

MmapFileIO::MmapFileIO(const std::string& fpath)
    : FileIO(fpath, O_RDONLY)
{
    mmap_file = false;
    advised = false;
    mmap_size = 0;
    addr = NULL;

    Logger::Log(LOG_LEVEL_DEBUG, "opening file " + fpath);

    if (Open() < 0) {
        status = GetOpenError();
        Logger::Log(LOG_LEVEL_ERROR, "failed to open file %s: %s",
            fpath.c_str(), PCError::get_error_str(status));
        return;
    }
    status = PCError::SUCCESS;
}

MmapFileIO::~MmapFileIO()
{
    UnMapFile();
}

int MmapFileIO::Status() const
{
    return status;
}

int MmapFileIO::MapFile()
{
    if (status != PCError::SUCCESS)
        return status;
    if (mmap_file)
        return PCError::SUCCESS;

    size_t size;
    int rval = GetFileSize(size);
    if (rval != PCError::SUCCESS)
        return rval;

    if (size == 0) {
        // mmap does not accept zero length
        mmap_file = true;
        mmap_size = 0;
        addr = NULL;
        return PCError::SUCCESS;
    }

    void* ptr = FileIO::MapFile(size, PROT_READ, MAP_SHARED, 0);
    if (ptr == MAP_FAILED) {
        Logger::Log(LOG_LEVEL_ERROR, "mmap (%s) failed errno=%d size=%zu",
            path.c_str(), errno, size);
        return PCError::MMAP_FAILED;
    }

    mmap_file = true;
    mmap_size = size;
    addr = reinterpret_cast<const uint8_t*>(ptr);
    Logger::Log(LOG_LEVEL_DEBUG, "mmap file %s, size=%zu", path.c_str(), size);

    AdviseSequential();
    return PCError::SUCCESS;
}

// Advisories are hints. Failing to set them is logged but not fatal.
int MmapFileIO::AdviseSequential()
{
    int rval = PCError::SUCCESS;
    if (madvise(const_cast<uint8_t*>(addr), mmap_size, MADV_SEQUENTIAL) != 0) {
        Logger::Log(LOG_LEVEL_WARN, "madvise(MADV_SEQUENTIAL) on %s failed: %d %s",
            path.c_str(), errno, strerror(errno));
        rval = PCError::INVALID_ARG;
    }
    if (Advise(0, 0, POSIX_FADV_SEQUENTIAL) != PCError::SUCCESS) {
        Logger::Log(LOG_LEVEL_WARN, "posix_fadvise(SEQUENTIAL) on %s failed", path.c_str());
        rval = PCError::INVALID_ARG;
    }
    advised = true;
    return rval;
}

void MmapFileIO::ReleaseAdvice()
{
    if (!advised)
        return;

    if (addr != NULL && madvise(const_cast<uint8_t*>(addr), mmap_size, MADV_NORMAL) != 0) {
        Logger::Log(LOG_LEVEL_DEBUG, "madvise(MADV_NORMAL) on %s failed: %d",
            path.c_str(), errno);
    }
    if (IsOpen())
        Advise(0, 0, POSIX_FADV_NORMAL);
    advised = false;
}

void MmapFileIO::UnMapFile()
{
    ReleaseAdvice();
    if (mmap_file && addr != NULL) {
        munmap(const_cast<uint8_t*>(addr), mmap_size);
        Logger::Log(LOG_LEVEL_DEBUG, "unmapped file %s", path.c_str());
    }
    addr = NULL;
    mmap_size = 0;
    mmap_file = false;
}

bool MmapFileIO::IsMapped() const
{
    return mmap_file;
}

const uint8_t* MmapFileIO::GetMapAddr() const
{
    return addr;
}

size_t MmapFileIO::GetMapSize() const
{
    return mmap_size;
}

bool MmapFileIO::IsAdvised() const
{
    return advised;
}

}
