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
#include <sys/stat.h>
#include <unistd.h>
#include <string>

#include <gtest/gtest.h>

#include "../credential_reader.h"
#include "../error.h"
#include "test_util.h"

using namespace pwcheck;

namespace {

class CredentialReaderTest : public ::testing::Test
{
public:
    CredentialReaderTest() {
        reader = NULL;
    }
    virtual ~CredentialReaderTest() {
        if(reader != NULL)
            delete reader;
    }

    virtual void SetUp() {
        std::string cmd = std::string("mkdir -p ") + PC_TEST_DIR;
        if(system(cmd.c_str()) != 0) {
        }
    }
    virtual void TearDown() {
        remove_test_files();
    }

    void Open(const std::string& csv) {
        if(reader != NULL)
            delete reader;
        reader = new CredentialReader(csv.data(), csv.size());
    }

    static std::string Secret(const CredentialRecord& record) {
        return std::string(reinterpret_cast<const char*>(record.secret.Data()),
                           record.secret.Size());
    }

protected:
    CredentialReader *reader;
};

TEST_F(CredentialReaderTest, chromium_format_test)
{
    Open("name,url,username,password\n"
         "a.com,https://a.com/,user1,password\n"
         "b.com,https://b.com/,user2,hello\n");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);

    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "user1@https://a.com/");
    EXPECT_EQ(Secret(record), "password");
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "user2@https://b.com/");
    EXPECT_EQ(Secret(record), "hello");
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);
    EXPECT_EQ(reader->RowCount(), 2);
    EXPECT_EQ(reader->MalformedRows(), 0);
}

TEST_F(CredentialReaderTest, firefox_format_test)
{
    Open("\"url\",\"username\",\"password\",\"httpRealm\",\"formActionOrigin\",\"guid\"\r\n"
         "\"https://a.com\",\"user1@a.com\",\"pa,ss \"\"quoted\"\"\",,\"https://a.com\",\"{1}\"\r\n"
         "\"https://b.com\",\"\",\"qwerty\",,\"\",\"{2}\"\r\n");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);

    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "user1@a.com@https://a.com");
    EXPECT_EQ(Secret(record), "pa,ss \"quoted\"");
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "https://b.com");
    EXPECT_EQ(Secret(record), "qwerty");
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);
}

TEST_F(CredentialReaderTest, header_test)
{
    // column names are case insensitive, order does not matter
    Open("Password,UserName\npass,bob\n");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);
    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "bob");
    EXPECT_EQ(Secret(record), "pass");

    Open("\xEF\xBB\xBFurl,username,password\nhttps://c.com,carol,abc\n");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "carol@https://c.com");

    Open("url,username,secret\nhttps://c.com,carol,abc\n");
    EXPECT_EQ(reader->Status(), PCError::INVALID_HEADER);
    EXPECT_EQ(reader->Next(record), PCError::INVALID_HEADER);

    Open("");
    EXPECT_EQ(reader->Status(), PCError::INVALID_HEADER);
    Open("\n\n");
    EXPECT_EQ(reader->Status(), PCError::INVALID_HEADER);
    Open("\"url,username,password\n");
    EXPECT_EQ(reader->Status(), PCError::INVALID_HEADER);
}

TEST_F(CredentialReaderTest, malformed_row_test)
{
    Open("url,username,password\n"
         "https://a.com,short\n"
         "https://b.com,bob,\n"
         "https://c.com,\"carol\"x,pass\n"
         "https://d.com,dave,letmein\n"
         "https://e.com,eve,\"unterminated\n");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);

    CredentialRecord record;
    // missing password column
    EXPECT_EQ(reader->Next(record), PCError::MALFORMED_CREDENTIAL_ROW);
    // empty password is a valid row
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "bob@https://b.com");
    EXPECT_TRUE(record.secret.Empty());
    // garbage after closing quote
    EXPECT_EQ(reader->Next(record), PCError::MALFORMED_CREDENTIAL_ROW);
    // the source is still usable
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "dave@https://d.com");
    EXPECT_EQ(Secret(record), "letmein");
    EXPECT_EQ(reader->Next(record), PCError::MALFORMED_CREDENTIAL_ROW);
    EXPECT_TRUE(record.secret.Empty());
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);

    EXPECT_EQ(reader->RowCount(), 5);
    EXPECT_EQ(reader->MalformedRows(), 3);
}

TEST_F(CredentialReaderTest, line_ending_test)
{
    Open("username,password\r\n\r\nalice,pass\r\n\nbob,hello");
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);

    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "alice");
    EXPECT_EQ(Secret(record), "pass");
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(record.account_label, "bob");
    EXPECT_EQ(Secret(record), "hello");
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);
}

TEST_F(CredentialReaderTest, raw_bytes_test)
{
    // secrets are not decoded, any byte sequence is kept as is
    std::string csv = "password\n";
    csv += "p\xC3\xA4ss\n";
    csv += "\xFF\xFE\x01\n";
    Open(csv);
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);

    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(Secret(record), "p\xC3\xA4ss");
    EXPECT_EQ(record.account_label, "row 1");
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(Secret(record), "\xFF\xFE\x01");
    EXPECT_EQ(record.account_label, "row 2");
}

TEST_F(CredentialReaderTest, MakeLabel_test)
{
    EXPECT_EQ(CredentialReader::MakeLabel("user", "site", 1), "user@site");
    EXPECT_EQ(CredentialReader::MakeLabel("user", "", 1), "user");
    EXPECT_EQ(CredentialReader::MakeLabel("", "site", 1), "site");
    EXPECT_EQ(CredentialReader::MakeLabel("", "", 7), "row 7");
}

TEST_F(CredentialReaderTest, file_test)
{
    std::string path = test_file_path("_passwords.csv");
    write_test_file(path, "name,url,username,password\na.com,https://a.com,user1,password\n");

    reader = new CredentialReader(path);
    ASSERT_EQ(reader->Status(), PCError::SUCCESS);
    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::SUCCESS);
    EXPECT_EQ(Secret(record), "password");
    EXPECT_EQ(reader->Next(record), PCError::END_OF_DATA);
}

TEST_F(CredentialReaderTest, file_open_error_test)
{
    reader = new CredentialReader(test_file_path("_does_not_exist.csv"));
    EXPECT_EQ(reader->Status(), PCError::OPEN_FAILURE);

    CredentialRecord record;
    EXPECT_EQ(reader->Next(record), PCError::OPEN_FAILURE);

    delete reader;
    reader = new CredentialReader(std::string(PC_TEST_DIR));
    EXPECT_EQ(reader->Status(), PCError::INVALID_ARG);
}

TEST_F(CredentialReaderTest, file_permission_test)
{
    if (geteuid() == 0)
        GTEST_SKIP() << "root ignores file permissions";

    std::string path = test_file_path("_no_access.csv");
    write_test_file(path, "password\nabc\n");
    chmod(path.c_str(), 0);
    reader = new CredentialReader(path);
    EXPECT_EQ(reader->Status(), PCError::NO_PERMISSION);
}

}
