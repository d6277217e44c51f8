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

#include <algorithm>
#include <string.h>
#include <vector>

#include <gtest/gtest.h>

#include "../digest_compare.h"
#include "test_util.h"

using namespace pwcheck;

namespace {

static int sign(int val)
{
    return (val > 0) - (val < 0);
}

class DigestCompareTest : public ::testing::Test
{
public:
    DigestCompareTest() {
    }
    virtual ~DigestCompareTest() {
    }

    virtual void SetUp() {
        srand(2026);
    }
    virtual void TearDown() {
    }

    // Same digest with a single byte changed.
    static Digest Flip(const Digest& digest, int pos, uint8_t value) {
        Digest out = digest;
        out[pos] = value;
        return out;
    }

    static void CheckAll(const Digest& lhs, const Digest& rhs) {
        int expected = sign(memcmp(lhs.data(), rhs.data(), PC_DIGEST_LENGTH));
        EXPECT_EQ(sign(DigestCompareScalar(lhs.data(), rhs.data())), expected);
        EXPECT_EQ(sign(DigestCompare(lhs, rhs)), expected);
        EXPECT_EQ(DigestEqual(lhs, rhs), expected == 0);
        EXPECT_EQ(DigestEqualScalar(lhs.data(), rhs.data()), expected == 0);
        EXPECT_EQ(DigestLess(lhs, rhs), expected < 0);
#ifdef PC_HAVE_SSE2
        EXPECT_EQ(sign(DigestCompareSIMD(lhs.data(), rhs.data())), expected);
        EXPECT_EQ(DigestEqualSIMD(lhs.data(), rhs.data()), expected == 0);
#endif
    }
};

TEST_F(DigestCompareTest, equal_test)
{
    Digest digest = make_digest(SHA1_PASSWORD);
    Digest copy = digest;
    EXPECT_EQ(DigestCompare(digest, copy), 0);
    EXPECT_TRUE(DigestEqual(digest, copy));
    EXPECT_FALSE(DigestLess(digest, copy));
    CheckAll(digest, copy);
}

TEST_F(DigestCompareTest, every_position_test)
{
    // A difference in each byte, inside the 16 byte lane and in the tail.
    Digest base = make_digest(SHA1_HELLO);
    for (int pos = 0; pos < PC_DIGEST_LENGTH; pos++) {
        Digest low = Flip(base, pos, 0x00);
        Digest high = Flip(base, pos, 0xFF);
        CheckAll(low, high);
        CheckAll(high, low);
        CheckAll(base, low);
        CheckAll(base, high);
        EXPECT_TRUE(DigestLess(low, high));
        EXPECT_FALSE(DigestLess(high, low));
    }
}

TEST_F(DigestCompareTest, unsigned_order_test)
{
    // 0x80 must sort after 0x7f, a signed byte compare gets this wrong
    Digest base;
    base.fill(0x10);
    for (int pos = 0; pos < PC_DIGEST_LENGTH; pos++) {
        Digest small = Flip(base, pos, 0x7F);
        Digest big = Flip(base, pos, 0x80);
        EXPECT_LT(DigestCompare(small, big), 0);
        EXPECT_GT(DigestCompare(big, small), 0);
        CheckAll(small, big);
    }
}

TEST_F(DigestCompareTest, first_difference_wins_test)
{
    Digest lhs, rhs;
    lhs.fill(0);
    rhs.fill(0);
    lhs[3] = 1;
    rhs[18] = 0xFF;
    EXPECT_GT(DigestCompare(lhs, rhs), 0);
    lhs[3] = 0;
    lhs[17] = 0xFF;
    EXPECT_GT(DigestCompare(lhs, rhs), 0);
    lhs[17] = 0;
    lhs[19] = 0xFF;
    EXPECT_LT(DigestCompare(lhs, rhs), 0);
    CheckAll(lhs, rhs);
}

TEST_F(DigestCompareTest, random_test)
{
    for (int i = 0; i < 2000; i++) {
        Digest lhs, rhs;
        for (int j = 0; j < PC_DIGEST_LENGTH; j++) {
            lhs[j] = static_cast<uint8_t>(rand() % 256);
            // long shared prefixes are common between sorted neighbours
            rhs[j] = (j < i % PC_DIGEST_LENGTH) ? lhs[j] : static_cast<uint8_t>(rand() % 256);
        }
        CheckAll(lhs, rhs);
    }
}

TEST_F(DigestCompareTest, sort_order_test)
{
    const char* sorted_hex[] = {
        SHA1_PASSWORD, SHA1_123456, SHA1_PASS, SHA1_ABC, SHA1_HELLO, SHA1_QWERTY, SHA1_LETMEIN
    };
    std::vector<Digest> digests;
    for (int i = 6; i >= 0; i--)
        digests.push_back(make_digest(sorted_hex[i]));
    std::sort(digests.begin(), digests.end(), DigestLess);
    for (int i = 0; i < 7; i++)
        EXPECT_EQ(EncodeHex(digests[i]), sorted_hex[i]);
}

TEST_F(DigestCompareTest, impl_name_test)
{
#ifdef PC_HAVE_SSE2
    EXPECT_EQ(strcmp(DigestCompareImpl(), "sse2"), 0);
#else
    EXPECT_EQ(strcmp(DigestCompareImpl(), "scalar"), 0);
#endif
}

}
