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

#ifndef __PC_DIGEST_H__
#define __PC_DIGEST_H__

#include <array>
#include <stdint.h>
#include <string>

namespace pwcheck {

#define PC_DIGEST_LENGTH     20 // SHA-1
#define PC_DIGEST_HEX_LENGTH 40

// HEX_CASE_AUTO accepts either case but never both: the first letter seen
// fixes the case for the rest of the input.
#define HEX_CASE_AUTO  0
#define HEX_CASE_LOWER 1
#define HEX_CASE_UPPER 2

typedef std::array<uint8_t, PC_DIGEST_LENGTH> Digest;

// Write the 40-character lowercase hex form of digest into buff and
// null-terminate it. Returns the number of hex characters written or -1 if
// buff is too small.
int EncodeHex(const Digest& digest, char* buff, int buf_size);
std::string EncodeHex(const Digest& digest);

// Decode exactly PC_DIGEST_HEX_LENGTH hex characters into digest.
// Returns PCError::MALFORMED_DIGEST if len is not 40 or if any character is
// not a hex digit accepted by hex_case. digest may be partially written on
// failure. Never allocates.
int DecodeHex(const char* text, int len, Digest& digest, int hex_case = HEX_CASE_AUTO);
int DecodeHex(const std::string& text, Digest& digest, int hex_case = HEX_CASE_AUTO);
// Case of the first hex letter in text: HEX_CASE_LOWER, HEX_CASE_UPPER, or
// HEX_CASE_AUTO if text has no letters.
int DetectHexCase(const char* text, int len);

}

#endif
