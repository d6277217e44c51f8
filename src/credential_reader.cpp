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

#include <ctype.h>
#include <string.h>

#include "credential_reader.h"
#include "error.h"
#include "file_io.h"
#include "logger.h"
#include "pwcheck_consts.h"

#define UTF8_BOM     "\xEF\xBB\xBF"
#define UTF8_BOM_LEN 3

namespace pwcheck {

CredentialReader::CredentialReader(const std::string& csv_path)
    : pos(0)
    , url_col(-1)
    , username_col(-1)
    , password_col(-1)
    , num_rows(0)
    , num_malformed(0)
{
    status = LoadFile(csv_path);
    if (status == PCError::SUCCESS)
        status = ParseHeader();
}

CredentialReader::CredentialReader(const char* data, size_t len)
    : pos(0)
    , url_col(-1)
    , username_col(-1)
    , password_col(-1)
    , num_rows(0)
    , num_malformed(0)
{
    status = content.Assign(data, len);
    if (status == PCError::SUCCESS)
        status = ParseHeader();
}

CredentialReader::~CredentialReader()
{
}

int CredentialReader::LoadFile(const std::string& path)
{
    FileIO csv_file(path, O_RDONLY);
    if (csv_file.Open() < 0) {
        int rval = csv_file.GetOpenError();
        Logger::Log(LOG_LEVEL_ERROR, "failed to open password file %s: %s",
            path.c_str(), PCError::get_error_str(rval));
        return rval;
    }

    size_t size;
    int rval = csv_file.GetFileSize(size);
    if (rval != PCError::SUCCESS)
        return rval;
    if (size > PCConsts::MAX_CREDENTIAL_FILE_SIZE) {
        Logger::Log(LOG_LEVEL_ERROR, "password file %s is too large: %zu bytes",
            path.c_str(), size);
        return PCError::INVALID_ARG;
    }

    rval = content.Resize(size);
    if (rval != PCError::SUCCESS)
        return rval;
    if (size > 0 && csv_file.RandomRead(content.MutableData(), size, 0) != size) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to read password file %s", path.c_str());
        content.Wipe();
        return PCError::READ_ERROR;
    }

    Logger::Log(LOG_LEVEL_DEBUG, "loaded password file %s: %zu bytes", path.c_str(), size);
    return PCError::SUCCESS;
}

int CredentialReader::Status() const
{
    return status;
}

int64_t CredentialReader::RowCount() const
{
    return num_rows;
}

int64_t CredentialReader::MalformedRows() const
{
    return num_malformed;
}

std::string CredentialReader::MakeLabel(const std::string& username, const std::string& url,
    int64_t row)
{
    if (!username.empty() && !url.empty())
        return username + PCConsts::DEFAULT_LABEL_SEPARATOR + url;
    if (!username.empty())
        return username;
    if (!url.empty())
        return url;
    return "row " + std::to_string(row);
}

// Move past the end of the current line.
void CredentialReader::SkipRecord()
{
    const char* data = reinterpret_cast<const char*>(content.Data());
    size_t len = content.Size();
    while (pos < len && data[pos] != '\n')
        pos++;
    if (pos < len)
        pos++;
}

// Returns false at the end of the data.
bool CredentialReader::SkipBlankLines()
{
    const char* data = reinterpret_cast<const char*>(content.Data());
    size_t len = content.Size();
    while (pos < len) {
        if (data[pos] == '\n')
            pos++;
        else if (data[pos] == '\r' && pos + 1 < len && data[pos + 1] == '\n')
            pos += 2;
        else
            break;
    }
    return pos < len;
}

// Decode the field starting at pos into field_buff and move pos past its
// delimiter. end_of_record is set if the field was the last of its record.
// A quoting error skips the rest of the record and returns
// MALFORMED_CREDENTIAL_ROW.
int CredentialReader::ReadField(bool& end_of_record)
{
    const char* data = reinterpret_cast<const char*>(content.Data());
    size_t len = content.Size();
    int rval;

    field_buff.Clear();
    end_of_record = false;

    if (pos < len && data[pos] == '"') {
        pos++;
        for (;;) {
            if (pos >= len) {
                // unterminated quote
                end_of_record = true;
                return PCError::MALFORMED_CREDENTIAL_ROW;
            }
            const char* quote = static_cast<const char*>(memchr(data + pos, '"', len - pos));
            size_t run = (quote == NULL) ? len - pos : static_cast<size_t>(quote - (data + pos));
            rval = field_buff.Append(data + pos, run);
            if (rval != PCError::SUCCESS)
                return rval;
            pos += run;
            if (quote == NULL)
                continue;

            pos++;
            if (pos < len && data[pos] == '"') {
                // escaped quote
                rval = field_buff.Append('"');
                if (rval != PCError::SUCCESS)
                    return rval;
                pos++;
                continue;
            }
            break;
        }

        if (pos >= len) {
            end_of_record = true;
        } else if (data[pos] == ',') {
            pos++;
        } else if (data[pos] == '\n') {
            pos++;
            end_of_record = true;
        } else if (data[pos] == '\r' && pos + 1 < len && data[pos + 1] == '\n') {
            pos += 2;
            end_of_record = true;
        } else {
            SkipRecord();
            end_of_record = true;
            return PCError::MALFORMED_CREDENTIAL_ROW;
        }
        return PCError::SUCCESS;
    }

    size_t start = pos;
    while (pos < len && data[pos] != ',' && data[pos] != '\n')
        pos++;
    size_t field_len = pos - start;
    if (pos >= len) {
        end_of_record = true;
    } else if (data[pos] == ',') {
        pos++;
    } else {
        pos++;
        end_of_record = true;
    }
    if (end_of_record && field_len > 0 && data[start + field_len - 1] == '\r')
        field_len--;

    return field_buff.Append(data + start, field_len);
}

int CredentialReader::ParseHeader()
{
    const char* data = reinterpret_cast<const char*>(content.Data());
    if (content.Size() >= UTF8_BOM_LEN && memcmp(data, UTF8_BOM, UTF8_BOM_LEN) == 0)
        pos = UTF8_BOM_LEN;

    if (!SkipBlankLines()) {
        Logger::Log(LOG_LEVEL_ERROR, "password file is empty");
        return PCError::INVALID_HEADER;
    }

    bool end_of_record = false;
    int col = 0;
    while (!end_of_record) {
        int rval = ReadField(end_of_record);
        if (rval != PCError::SUCCESS) {
            Logger::Log(LOG_LEVEL_ERROR, "failed to parse password file header: %s",
                PCError::get_error_str(rval));
            return rval == PCError::MALFORMED_CREDENTIAL_ROW ? PCError::INVALID_HEADER : rval;
        }

        std::string name(reinterpret_cast<const char*>(field_buff.Data()), field_buff.Size());
        for (size_t i = 0; i < name.size(); i++)
            name[i] = static_cast<char>(tolower(static_cast<unsigned char>(name[i])));

        if (name == "url" && url_col < 0)
            url_col = col;
        else if (name == "username" && username_col < 0)
            username_col = col;
        else if (name == "password" && password_col < 0)
            password_col = col;
        col++;
    }
    field_buff.Clear();

    if (password_col < 0) {
        Logger::Log(LOG_LEVEL_ERROR, "password file header has no password column");
        return PCError::INVALID_HEADER;
    }

    Logger::Log(LOG_LEVEL_DEBUG, "password file columns: url=%d username=%d password=%d",
        url_col, username_col, password_col);
    return PCError::SUCCESS;
}

int CredentialReader::Next(CredentialRecord& record)
{
    if (status != PCError::SUCCESS)
        return status;
    if (!SkipBlankLines())
        return PCError::END_OF_DATA;

    num_rows++;
    record.account_label.clear();
    record.secret.Clear();

    std::string url;
    std::string username;
    bool have_password = false;
    const char* reason = NULL;
    bool end_of_record = false;
    int col = 0;
    while (!end_of_record) {
        int rval = ReadField(end_of_record);
        if (rval == PCError::MALFORMED_CREDENTIAL_ROW) {
            reason = "quoting error";
            break;
        }
        if (rval != PCError::SUCCESS) {
            status = rval;
            field_buff.Wipe();
            record.secret.Wipe();
            return rval;
        }

        const char* value = reinterpret_cast<const char*>(field_buff.Data());
        if (col == password_col) {
            rval = record.secret.Assign(value, field_buff.Size());
            if (rval != PCError::SUCCESS) {
                status = rval;
                field_buff.Wipe();
                return rval;
            }
            have_password = true;
        } else if (col == url_col) {
            url.assign(value == NULL ? "" : value, field_buff.Size());
        } else if (col == username_col) {
            username.assign(value == NULL ? "" : value, field_buff.Size());
        }
        col++;
    }
    field_buff.Clear();

    // An empty password is hashed like any other.
    if (reason == NULL && !have_password)
        reason = "missing password column";

    if (reason != NULL) {
        record.secret.Wipe();
        num_malformed++;
        Logger::Log(LOG_LEVEL_WARN, "skipping credential row %lld: %s",
            static_cast<long long>(num_rows), reason);
        return PCError::MALFORMED_CREDENTIAL_ROW;
    }

    record.account_label = MakeLabel(username, url, num_rows);
    return PCError::SUCCESS;
}

}
