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
#include <fcntl.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>

#include "error.h"
#include "file_io.h"
#include "logger.h"

namespace pwcheck {

FileIO::FileIO(const std::string& fpath, int oflags)
    : path(fpath)
    , options(oflags)
{
    fd = -1;
    open_errno = 0;
}

FileIO::~FileIO()
{
    if (fd >= 0)
        close(fd);
}

int FileIO::Open()
{
    if (fd >= 0)
        return fd;

    do {
        fd = open(path.c_str(), options);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        open_errno = errno;
        Logger::Log(LOG_LEVEL_DEBUG, "failed to open file %s: errno %d %s",
            path.c_str(), open_errno, strerror(open_errno));
    } else {
        open_errno = 0;
    }
    return fd;
}

int FileIO::GetOpenError() const
{
    if (open_errno == 0)
        return PCError::SUCCESS;
    return ErrnoToError(open_errno);
}

int FileIO::ErrnoToError(int err)
{
    switch (err) {
    case 0:
        return PCError::SUCCESS;
    case EACCES:
    case EPERM:
        return PCError::NO_PERMISSION;
    case ENOMEM:
        return PCError::NO_MEMORY;
    case EIO:
        return PCError::READ_ERROR;
    default:
        break;
    }
    return PCError::OPEN_FAILURE;
}

int FileIO::GetFileSize(size_t& size) const
{
    if (fd < 0)
        return PCError::NOT_INITIALIZED;

    struct stat st;
    if (fstat(fd, &st) != 0) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to stat %s: errno %d", path.c_str(), errno);
        return PCError::READ_ERROR;
    }
    if (!S_ISREG(st.st_mode)) {
        Logger::Log(LOG_LEVEL_ERROR, "%s is not a regular file", path.c_str());
        return PCError::INVALID_ARG;
    }

    size = static_cast<size_t>(st.st_size);
    return PCError::SUCCESS;
}

// Reads until size bytes are read, end of file is reached or an error
// occurs.
size_t FileIO::RandomRead(void* buff, size_t size, off_t offset)
{
    if (fd < 0 || buff == NULL)
        return 0;

    unsigned char* ptr = reinterpret_cast<unsigned char*>(buff);
    size_t bytes_read = 0;
    while (bytes_read < size) {
        ssize_t nread = pread(fd, ptr + bytes_read, size - bytes_read,
            offset + static_cast<off_t>(bytes_read));
        if (nread < 0) {
            if (errno == EINTR)
                continue;
            Logger::Log(LOG_LEVEL_ERROR, "failed to read %s: errno %d", path.c_str(), errno);
            break;
        }
        if (nread == 0)
            break;
        bytes_read += static_cast<size_t>(nread);
    }

    return bytes_read;
}

int FileIO::Advise(off_t offset, off_t len, int advice)
{
    if (fd < 0)
        return PCError::NOT_INITIALIZED;

    int rval = posix_fadvise(fd, offset, len, advice);
    if (rval != 0) {
        Logger::Log(LOG_LEVEL_DEBUG, "posix_fadvise(%d) on %s failed: %d",
            advice, path.c_str(), rval);
        return PCError::INVALID_ARG;
    }
    return PCError::SUCCESS;
}

void* FileIO::MapFile(size_t size, int prot, int flags, off_t offset)
{
    return mmap(NULL, size, prot, flags, fd, offset);
}

void FileIO::Close()
{
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool FileIO::IsOpen() const
{
    return fd >= 0;
}

const std::string& FileIO::GetFilePath() const
{
    return path;
}

}
