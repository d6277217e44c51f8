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

#include "../error.h"

using namespace pwcheck;

namespace {

TEST(PCErrorTest, error_str_test)
{
    EXPECT_EQ(strcmp(PCError::get_error_str(PCError::SUCCESS), "success"), 0);
    EXPECT_EQ(strcmp(PCError::get_error_str(PCError::DB_ORDER_VIOLATION),
                "database not sorted by digest"), 0);
    EXPECT_EQ(strcmp(PCError::get_error_str(PCError::UNKNOWN_ERROR), "unknown error"), 0);
    EXPECT_EQ(strcmp(PCError::get_error_str(-1), "system error"), 0);
    EXPECT_EQ(strcmp(PCError::get_error_str(PCError::UNKNOWN_ERROR + 1), "invalid error code"), 0);

    for (int err = PCError::SUCCESS; err <= PCError::MAX_ERROR_CODE; err++)
        EXPECT_TRUE(PCError::get_error_str(err) != NULL);
}

TEST(PCErrorTest, category_test)
{
    EXPECT_EQ(PCError::get_error_category(PCError::SUCCESS), PCError::CATEGORY_NONE);
    EXPECT_EQ(PCError::get_error_category(PCError::END_OF_DATA), PCError::CATEGORY_NONE);

    EXPECT_EQ(PCError::get_error_category(PCError::OPEN_FAILURE), PCError::CATEGORY_SETUP);
    EXPECT_EQ(PCError::get_error_category(PCError::NO_PERMISSION), PCError::CATEGORY_SETUP);
    EXPECT_EQ(PCError::get_error_category(PCError::MMAP_FAILED), PCError::CATEGORY_SETUP);
    EXPECT_EQ(PCError::get_error_category(PCError::INVALID_HEADER), PCError::CATEGORY_SETUP);

    EXPECT_EQ(PCError::get_error_category(PCError::MALFORMED_CREDENTIAL_ROW),
              PCError::CATEGORY_RECOVERABLE);
    EXPECT_EQ(PCError::get_error_category(PCError::HASH_FAILURE), PCError::CATEGORY_RECOVERABLE);

    EXPECT_EQ(PCError::get_error_category(PCError::MALFORMED_DIGEST), PCError::CATEGORY_SCAN);
    EXPECT_EQ(PCError::get_error_category(PCError::MALFORMED_DB_ENTRY), PCError::CATEGORY_SCAN);
    EXPECT_EQ(PCError::get_error_category(PCError::DB_ORDER_VIOLATION), PCError::CATEGORY_SCAN);
    EXPECT_EQ(PCError::get_error_category(PCError::IO_FAULT), PCError::CATEGORY_SCAN);

    EXPECT_EQ(PCError::get_error_category(PCError::NO_VALID_CREDENTIALS),
              PCError::CATEGORY_NO_CREDENTIALS);
    EXPECT_EQ(PCError::get_error_category(PCError::INTERRUPTED), PCError::CATEGORY_INTERRUPTED);
    EXPECT_EQ(PCError::get_error_category(PCError::UNKNOWN_ERROR), PCError::CATEGORY_UNKNOWN);
    EXPECT_EQ(PCError::get_error_category(12345), PCError::CATEGORY_UNKNOWN);
}

TEST(PCErrorTest, category_str_test)
{
    EXPECT_EQ(strcmp(PCError::get_category_str(PCError::CATEGORY_SETUP), "setup error"), 0);
    EXPECT_EQ(strcmp(PCError::get_category_str(PCError::CATEGORY_SCAN), "scan error"), 0);
    EXPECT_EQ(strcmp(PCError::get_category_str(100), "invalid category"), 0);
}

TEST(PCErrorTest, is_fatal_test)
{
    EXPECT_FALSE(PCError::is_fatal(PCError::SUCCESS));
    EXPECT_FALSE(PCError::is_fatal(PCError::END_OF_DATA));
    EXPECT_FALSE(PCError::is_fatal(PCError::MALFORMED_CREDENTIAL_ROW));
    EXPECT_FALSE(PCError::is_fatal(PCError::HASH_FAILURE));
    EXPECT_TRUE(PCError::is_fatal(PCError::MALFORMED_DB_ENTRY));
    EXPECT_TRUE(PCError::is_fatal(PCError::OPEN_FAILURE));
    EXPECT_TRUE(PCError::is_fatal(PCError::NO_VALID_CREDENTIALS));
    EXPECT_TRUE(PCError::is_fatal(PCError::INTERRUPTED));
}

}
