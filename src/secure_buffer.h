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

#ifndef __PC_SECURE_BUFFER_H__
#define __PC_SECURE_BUFFER_H__

#include <stddef.h>
#include <stdint.h>

namespace pwcheck {

// Heap buffer for plaintext secrets. The backing memory is overwritten
// before it is released, no matter which path releases it: Wipe(),
// reallocation on growth, move assignment or destruction.
// Copying is not allowed.
class SecureBuffer {
public:
    SecureBuffer();
    SecureBuffer(const char* data, size_t len);
    ~SecureBuffer();

    SecureBuffer(SecureBuffer&& rhs) noexcept;
    SecureBuffer& operator=(SecureBuffer&& rhs) noexcept;
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    // Replace the content. Returns PCError::NO_MEMORY on allocation failure.
    int Assign(const char* data, size_t len);
    int Append(const char* data, size_t len);
    int Append(char c);
    // Change the data length, keeping the existing bytes.
    int Resize(size_t len);
    // Zero the bytes and free the memory.
    void Wipe();
    // Zero the bytes but keep the memory for reuse.
    void Clear();

    const uint8_t* Data() const;
    uint8_t* MutableData();
    size_t Size() const;
    bool Empty() const;

private:
    int Reserve(size_t size);

    uint8_t* buff;
    size_t data_len;
    size_t buff_len;
};

}

#endif
