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

#include <string.h>

#include <gtest/gtest.h>

#include "../digest.h"
#include "../error.h"
#include "test_util.h"

using namespace pwcheck;

namespace {

TEST(DigestTest, EncodeHex_test)
{
    Digest digest;
    for (int i = 0; i < PC_DIGEST_LENGTH; i++)
        digest[i] = static_cast<uint8_t>(i * 13);
    EXPECT_EQ(EncodeHex(digest), "000d1a2734414e5b6875828f9ca9b6c3d0ddeaf7");

    char buff[PC_DIGEST_HEX_LENGTH + 1];
    EXPECT_EQ(EncodeHex(digest, buff, sizeof(buff)), PC_DIGEST_HEX_LENGTH);
    EXPECT_EQ(strcmp(buff, "000d1a2734414e5b6875828f9ca9b6c3d0ddeaf7"), 0);
    EXPECT_EQ(EncodeHex(digest, buff, PC_DIGEST_HEX_LENGTH), -1);
    EXPECT_EQ(EncodeHex(digest, NULL, 100), -1);

    digest.fill(0xFF);
    EXPECT_EQ(EncodeHex(digest), std::string(PC_DIGEST_HEX_LENGTH, 'f'));
}

TEST(DigestTest, DecodeHex_test)
{
    Digest digest;
    EXPECT_EQ(DecodeHex(std::string(SHA1_PASSWORD), digest), PCError::SUCCESS);
    EXPECT_EQ(digest[0], 0x5b);
    EXPECT_EQ(digest[1], 0xaa);
    EXPECT_EQ(digest[19], 0xd8);
    EXPECT_EQ(EncodeHex(digest), SHA1_PASSWORD);

    for (int i = 0; i < 100; i++) {
        Digest in, out;
        for (int j = 0; j < PC_DIGEST_LENGTH; j++)
            in[j] = static_cast<uint8_t>(rand() % 256);
        EXPECT_EQ(DecodeHex(EncodeHex(in), out), PCError::SUCCESS);
        EXPECT_TRUE(in == out);
    }
}

TEST(DigestTest, DecodeHex_length_test)
{
    Digest digest;
    std::string hex(SHA1_PASSWORD);
    EXPECT_EQ(DecodeHex(hex.substr(0, 39), digest), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(hex + "0", digest), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(std::string(), digest), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(NULL, PC_DIGEST_HEX_LENGTH, digest), PCError::MALFORMED_DIGEST);
}

TEST(DigestTest, DecodeHex_invalid_char_test)
{
    Digest digest;
    EXPECT_EQ(DecodeHex(std::string(PC_DIGEST_HEX_LENGTH, 'z'), digest), PCError::MALFORMED_DIGEST);

    std::string hex(SHA1_PASSWORD);
    const char bad[] = { 'g', 'G', ' ', ':', '-', 'x', '\n', '\0' };
    for (size_t i = 0; i < sizeof(bad); i++) {
        std::string text = hex;
        text[39] = bad[i];
        EXPECT_EQ(DecodeHex(text, digest), PCError::MALFORMED_DIGEST);
        text = hex;
        text[0] = bad[i];
        EXPECT_EQ(DecodeHex(text, digest), PCError::MALFORMED_DIGEST);
    }
}

TEST(DigestTest, DecodeHex_case_test)
{
    Digest lower, upper;
    std::string hex(SHA1_PASSWORD);
    std::string hex_upper = "5BAA61E4C9B93F3F0682250B6CF8331B7EE68FD8";

    EXPECT_EQ(DecodeHex(hex, lower), PCError::SUCCESS);
    EXPECT_EQ(DecodeHex(hex_upper, upper), PCError::SUCCESS);
    EXPECT_TRUE(lower == upper);

    EXPECT_EQ(DecodeHex(hex, lower, HEX_CASE_LOWER), PCError::SUCCESS);
    EXPECT_EQ(DecodeHex(hex_upper, upper, HEX_CASE_LOWER), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(hex_upper, upper, HEX_CASE_UPPER), PCError::SUCCESS);
    EXPECT_EQ(DecodeHex(hex, lower, HEX_CASE_UPPER), PCError::MALFORMED_DIGEST);

    // digits only, valid in every mode
    std::string digits(PC_DIGEST_HEX_LENGTH, '7');
    EXPECT_EQ(DecodeHex(digits, lower, HEX_CASE_LOWER), PCError::SUCCESS);
    EXPECT_EQ(DecodeHex(digits, upper, HEX_CASE_UPPER), PCError::SUCCESS);

    // mixed case within one digest
    std::string mixed = hex;
    mixed[2] = 'A';
    EXPECT_EQ(DecodeHex(mixed, lower), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(mixed, lower, HEX_CASE_LOWER), PCError::MALFORMED_DIGEST);
    EXPECT_EQ(DecodeHex(mixed, lower, HEX_CASE_UPPER), PCError::MALFORMED_DIGEST);
}

TEST(DigestTest, DetectHexCase_test)
{
    std::string digits(PC_DIGEST_HEX_LENGTH, '7');
    EXPECT_EQ(DetectHexCase(digits.data(), PC_DIGEST_HEX_LENGTH), HEX_CASE_AUTO);
    EXPECT_EQ(DetectHexCase(SHA1_PASSWORD, PC_DIGEST_HEX_LENGTH), HEX_CASE_LOWER);
    EXPECT_EQ(DetectHexCase("5BAA61E4C9b93f3f0682250b6cf8331b7ee68fd8", PC_DIGEST_HEX_LENGTH),
        HEX_CASE_UPPER);
}

}
