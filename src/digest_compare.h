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

#ifndef __PC_DIGEST_COMPARE_H__
#define __PC_DIGEST_COMPARE_H__

#include <stdint.h>
#include <string.h>

#include "digest.h"

#if !defined(PWCHECK_NO_SIMD) && defined(__SSE2__)
#include <emmintrin.h>
#define PC_HAVE_SSE2 1
#endif

namespace pwcheck {

// All comparisons are unsigned byte-wise (memcmp order), which is the order
// of the hex text of the breach database.

#define PC_SIMD_LANE_WIDTH 16

// Reference implementation, also used when SSE2 is not available.
inline int DigestCompareScalar(const uint8_t* lhs, const uint8_t* rhs)
{
    for (int i = 0; i < PC_DIGEST_LENGTH; i++) {
        if (lhs[i] != rhs[i])
            return lhs[i] < rhs[i] ? -1 : 1;
    }
    return 0;
}

inline bool DigestEqualScalar(const uint8_t* lhs, const uint8_t* rhs)
{
    return memcmp(lhs, rhs, PC_DIGEST_LENGTH) == 0;
}

#ifdef PC_HAVE_SSE2
// Load the 4 tail bytes as a big-endian word so that integer order equals
// byte order. SSE2 implies a little-endian host.
inline uint32_t digest_tail_word(const uint8_t* p)
{
    uint32_t word;
    memcpy(&word, p + PC_SIMD_LANE_WIDTH, sizeof(word));
    return __builtin_bswap32(word);
}

// First 16 bytes are compared in one lane, the remaining 4 as a scalar word.
inline int DigestCompareSIMD(const uint8_t* lhs, const uint8_t* rhs)
{
    __m128i vl = _mm_loadu_si128(reinterpret_cast<const __m128i*>(lhs));
    __m128i vr = _mm_loadu_si128(reinterpret_cast<const __m128i*>(rhs));
    unsigned int mask = static_cast<unsigned int>(_mm_movemask_epi8(_mm_cmpeq_epi8(vl, vr)));
    if (mask != 0xFFFF) {
        int pos = __builtin_ctz(~mask);
        return lhs[pos] < rhs[pos] ? -1 : 1;
    }

    uint32_t tl = digest_tail_word(lhs);
    uint32_t tr = digest_tail_word(rhs);
    if (tl == tr)
        return 0;
    return tl < tr ? -1 : 1;
}

inline bool DigestEqualSIMD(const uint8_t* lhs, const uint8_t* rhs)
{
    __m128i vl = _mm_loadu_si128(reinterpret_cast<const __m128i*>(lhs));
    __m128i vr = _mm_loadu_si128(reinterpret_cast<const __m128i*>(rhs));
    if (_mm_movemask_epi8(_mm_cmpeq_epi8(vl, vr)) != 0xFFFF)
        return false;
    return memcmp(lhs + PC_SIMD_LANE_WIDTH, rhs + PC_SIMD_LANE_WIDTH,
               PC_DIGEST_LENGTH - PC_SIMD_LANE_WIDTH) == 0;
}
#endif

inline int DigestCompare(const Digest& lhs, const Digest& rhs)
{
#ifdef PC_HAVE_SSE2
    return DigestCompareSIMD(lhs.data(), rhs.data());
#else
    return DigestCompareScalar(lhs.data(), rhs.data());
#endif
}

inline bool DigestEqual(const Digest& lhs, const Digest& rhs)
{
#ifdef PC_HAVE_SSE2
    return DigestEqualSIMD(lhs.data(), rhs.data());
#else
    return DigestEqualScalar(lhs.data(), rhs.data());
#endif
}

inline bool DigestLess(const Digest& lhs, const Digest& rhs)
{
    return DigestCompare(lhs, rhs) < 0;
}

inline const char* DigestCompareImpl()
{
#ifdef PC_HAVE_SSE2
    return "sse2";
#else
    return "scalar";
#endif
}

}

#endif
