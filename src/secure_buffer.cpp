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

#include <stdlib.h>
#include <string.h>

#include <openssl/crypto.h>

#include "error.h"
#include "secure_buffer.h"

namespace pwcheck {

SecureBuffer::SecureBuffer()
    : buff(NULL)
    , data_len(0)
    , buff_len(0)
{
}

SecureBuffer::SecureBuffer(const char* data, size_t len)
    : buff(NULL)
    , data_len(0)
    , buff_len(0)
{
    if (Assign(data, len) != PCError::SUCCESS)
        throw (int)PCError::NO_MEMORY;
}

SecureBuffer::~SecureBuffer()
{
    Wipe();
}

SecureBuffer::SecureBuffer(SecureBuffer&& rhs) noexcept
    : buff(rhs.buff)
    , data_len(rhs.data_len)
    , buff_len(rhs.buff_len)
{
    rhs.buff = NULL;
    rhs.data_len = 0;
    rhs.buff_len = 0;
}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& rhs) noexcept
{
    if (this != &rhs) {
        Wipe();
        buff = rhs.buff;
        data_len = rhs.data_len;
        buff_len = rhs.buff_len;
        rhs.buff = NULL;
        rhs.data_len = 0;
        rhs.buff_len = 0;
    }
    return *this;
}

// Grow to at least size bytes. The old block is cleansed before it is
// freed so no stale copy of the secret is left on the heap.
int SecureBuffer::Reserve(size_t size)
{
    if (size <= buff_len)
        return PCError::SUCCESS;

    size_t new_len = buff_len == 0 ? 32 : buff_len;
    while (new_len < size)
        new_len *= 2;

    uint8_t* new_buff = static_cast<uint8_t*>(malloc(new_len));
    if (new_buff == NULL)
        return PCError::NO_MEMORY;

    if (buff != NULL) {
        memcpy(new_buff, buff, data_len);
        OPENSSL_cleanse(buff, buff_len);
        free(buff);
    }
    buff = new_buff;
    buff_len = new_len;
    return PCError::SUCCESS;
}

int SecureBuffer::Assign(const char* data, size_t len)
{
    Clear();
    return Append(data, len);
}

int SecureBuffer::Append(const char* data, size_t len)
{
    if (len == 0)
        return PCError::SUCCESS;
    if (data == NULL)
        return PCError::INVALID_ARG;

    int rval = Reserve(data_len + len);
    if (rval != PCError::SUCCESS)
        return rval;
    memcpy(buff + data_len, data, len);
    data_len += len;
    return PCError::SUCCESS;
}

int SecureBuffer::Append(char c)
{
    return Append(&c, 1);
}

int SecureBuffer::Resize(size_t len)
{
    int rval = Reserve(len);
    if (rval != PCError::SUCCESS)
        return rval;
    if (len > data_len)
        memset(buff + data_len, 0, len - data_len);
    else if (len < data_len)
        OPENSSL_cleanse(buff + len, data_len - len);
    data_len = len;
    return PCError::SUCCESS;
}

void SecureBuffer::Wipe()
{
    if (buff != NULL) {
        OPENSSL_cleanse(buff, buff_len);
        free(buff);
        buff = NULL;
    }
    data_len = 0;
    buff_len = 0;
}

void SecureBuffer::Clear()
{
    if (buff != NULL && data_len > 0)
        OPENSSL_cleanse(buff, data_len);
    data_len = 0;
}

const uint8_t* SecureBuffer::Data() const
{
    return buff;
}

uint8_t* SecureBuffer::MutableData()
{
    return buff;
}

size_t SecureBuffer::Size() const
{
    return data_len;
}

bool SecureBuffer::Empty() const
{
    return data_len == 0;
}

}
