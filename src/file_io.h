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

#ifndef __PC_FILE_IO_H__
#define __PC_FILE_IO_H__

#include <string>

#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>

namespace pwcheck {

// This is the basic read-only file io class
class FileIO
{
public:
    FileIO(const std::string &fpath, int oflags);
    virtual ~FileIO();

    // Returns the file descriptor or -1. The failure reason is kept for
    // GetOpenError.
    int  Open();
    bool IsOpen() const;
    void Close();
    // Maps the errno of the last failed Open to a PCError code.
    int  GetOpenError() const;

    // Size of a regular file. Other file types are rejected.
    int    GetFileSize(size_t &size) const;
    virtual size_t RandomRead(void *buff, size_t size, off_t offset);
    // posix_fadvise on the descriptor. len 0 means to the end of the file.
    int    Advise(off_t offset, off_t len, int advice);

    const std::string& GetFilePath() const;

    static int ErrnoToError(int err);

protected:
    std::string path;
    int options;

    void* MapFile(size_t size, int prot, int flags, off_t offset);

private:
    int fd;
    int open_errno;
};

}

#endif
