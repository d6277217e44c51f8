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

#include "digest.h"
#include "error.h"

namespace pwcheck {

static const char hex_digits[] = "0123456789abcdef";

int EncodeHex(const Digest& digest, char* buff, int buf_size)
{
    if (buff == NULL || buf_size < PC_DIGEST_HEX_LENGTH + 1)
        return -1;
    for (int i = 0; i < PC_DIGEST_LENGTH; i++) {
        buff[2 * i] = hex_digits[digest[i] >> 4];
        buff[2 * i + 1] = hex_digits[digest[i] & 0x0F];
    }
    buff[PC_DIGEST_HEX_LENGTH] = '\0';
    return PC_DIGEST_HEX_LENGTH;
}

std::string EncodeHex(const Digest& digest)
{
    char buff[PC_DIGEST_HEX_LENGTH + 1];
    EncodeHex(digest, buff, sizeof(buff));
    return std::string(buff, PC_DIGEST_HEX_LENGTH);
}

static inline int hex_to_half_byte(char hex, int hex_case)
{
    switch (hex) {
    case '0':
        return 0;
    case '1':
        return 1;
    case '2':
        return 2;
    case '3':
        return 3;
    case '4':
        return 4;
    case '5':
        return 5;
    case '6':
        return 6;
    case '7':
        return 7;
    case '8':
        return 8;
    case '9':
        return 9;
    case 'a':
    case 'b':
    case 'c':
    case 'd':
    case 'e':
    case 'f':
        if (hex_case == HEX_CASE_UPPER)
            return -1;
        return hex - 'a' + 10;
    case 'A':
    case 'B':
    case 'C':
    case 'D':
    case 'E':
    case 'F':
        if (hex_case == HEX_CASE_LOWER)
            return -1;
        return hex - 'A' + 10;
    default:
        return -1;
    }
}

int DetectHexCase(const char* text, int len)
{
    for (int i = 0; i < len; i++) {
        if (text[i] >= 'a' && text[i] <= 'f')
            return HEX_CASE_LOWER;
        if (text[i] >= 'A' && text[i] <= 'F')
            return HEX_CASE_UPPER;
    }
    return HEX_CASE_AUTO;
}

int DecodeHex(const char* text, int len, Digest& digest, int hex_case)
{
    if (text == NULL || len != PC_DIGEST_HEX_LENGTH)
        return PCError::MALFORMED_DIGEST;
    if (hex_case == HEX_CASE_AUTO)
        hex_case = DetectHexCase(text, len);

    int high_byte, low_byte;
    for (int i = 0; i < PC_DIGEST_LENGTH; i++) {
        high_byte = hex_to_half_byte(text[2 * i], hex_case);
        low_byte = hex_to_half_byte(text[2 * i + 1], hex_case);
        if (high_byte < 0 || low_byte < 0)
            return PCError::MALFORMED_DIGEST;
        digest[i] = static_cast<uint8_t>((high_byte << 4) + low_byte);
    }

    return PCError::SUCCESS;
}

int DecodeHex(const std::string& text, Digest& digest, int hex_case)
{
    return DecodeHex(text.data(), static_cast<int>(text.size()), digest, hex_case);
}

}
