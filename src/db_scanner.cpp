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

#include "db_scanner.h"
#include "error.h"
#include "logger.h"
#include "pwcheck_consts.h"

#define MAX_LOGGED_LINE 64

namespace pwcheck {

BreachDBScanner::BreachDBScanner(const std::string& db_path, int hcase)
    : db_file(db_path)
    , hex_case(hcase)
    , closed(false)
    , base(NULL)
    , size(0)
    , offset(0)
    , num_lines(0)
{
    status = db_file.Status();
    if (status != PCError::SUCCESS)
        return;

    status = db_file.MapFile();
    if (status != PCError::SUCCESS) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to map breach database %s: %s",
            db_path.c_str(), PCError::get_error_str(status));
        db_file.Close();
        return;
    }

    base = reinterpret_cast<const char*>(db_file.GetMapAddr());
    size = db_file.GetMapSize();
    Logger::Log(LOG_LEVEL_DEBUG, "breach database %s: %zu bytes", db_path.c_str(), size);
}

BreachDBScanner::~BreachDBScanner()
{
    Close();
}

int BreachDBScanner::Status() const
{
    return status;
}

int BreachDBScanner::Malformed(const char* line, size_t len, const char* reason)
{
    char text[MAX_LOGGED_LINE + 1];
    if (len > MAX_LOGGED_LINE)
        len = MAX_LOGGED_LINE;
    memcpy(text, line, len);
    text[len] = '\0';
    for (size_t i = 0; i < len; i++) {
        if (text[i] == '\n' || text[i] == '\r') {
            text[i] = '\0';
            break;
        }
    }

    Logger::Log(LOG_LEVEL_ERROR, "malformed database entry at line %lld (offset %zu): %s: \"%s\"",
        static_cast<long long>(num_lines + 1), offset, reason, text);
    status = PCError::MALFORMED_DB_ENTRY;
    return status;
}

int BreachDBScanner::Next(DatabaseEntry& entry)
{
    if (status != PCError::SUCCESS)
        return status;
    if (closed)
        return PCError::NOT_INITIALIZED;
    if (offset >= size)
        return PCError::END_OF_DATA;

    const char* line = base + offset;
    const char* end = base + size;
    size_t remain = size - offset;

    // digest, separator and at least one digit
    if (remain < PC_DIGEST_HEX_LENGTH + 2)
        return Malformed(line, remain, "truncated line");
    if (DecodeHex(line, PC_DIGEST_HEX_LENGTH, entry.digest, hex_case) != PCError::SUCCESS)
        return Malformed(line, remain, "invalid digest");
    if (hex_case == HEX_CASE_AUTO) {
        hex_case = DetectHexCase(line, PC_DIGEST_HEX_LENGTH);
        if (hex_case != HEX_CASE_AUTO)
            Logger::Log(LOG_LEVEL_DEBUG, "breach database uses %s hex digits from line %lld",
                hex_case == HEX_CASE_LOWER ? "lowercase" : "uppercase",
                static_cast<long long>(num_lines + 1));
    }
    if (line[PC_DIGEST_HEX_LENGTH] != ':')
        return Malformed(line, remain, "missing separator");

    // Only locate the count here, it is decoded on a match.
    const char* count = line + PC_DIGEST_HEX_LENGTH + 1;
    const char* p = count;
    while (p < end && *p != '\n' && *p != '\r') {
        if (p - count >= PCConsts::MAX_COUNT_DIGITS)
            return Malformed(line, remain, "count too long");
        p++;
    }
    if (p == count)
        return Malformed(line, remain, "empty count");

    size_t next;
    if (p == end) {
        // last line without terminator
        next = size;
    } else if (*p == '\n') {
        next = static_cast<size_t>(p + 1 - base);
    } else if (p + 1 < end && p[1] == '\n') {
        next = static_cast<size_t>(p + 2 - base);
    } else {
        return Malformed(line, remain, "bad line terminator");
    }

    entry.count_ptr = count;
    entry.count_len = static_cast<int>(p - count);
    offset = next;
    num_lines++;
    return PCError::SUCCESS;
}

int BreachDBScanner::ParseCount(const DatabaseEntry& entry, uint32_t& count) const
{
    if (entry.count_ptr == NULL || entry.count_len <= 0
        || entry.count_len > PCConsts::MAX_COUNT_DIGITS)
        return PCError::MALFORMED_DB_ENTRY;

    uint64_t value = 0;
    for (int i = 0; i < entry.count_len; i++) {
        char c = entry.count_ptr[i];
        if (c < '0' || c > '9')
            return PCError::MALFORMED_DB_ENTRY;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > 0xFFFFFFFFULL)
        return PCError::MALFORMED_DB_ENTRY;

    count = static_cast<uint32_t>(value);
    return PCError::SUCCESS;
}

size_t BreachDBScanner::Offset() const
{
    return offset;
}

size_t BreachDBScanner::Size() const
{
    return size;
}

int64_t BreachDBScanner::LinesScanned() const
{
    return num_lines;
}

const uint8_t* BreachDBScanner::GetMapAddr() const
{
    return reinterpret_cast<const uint8_t*>(base);
}

const std::string& BreachDBScanner::GetFilePath() const
{
    return db_file.GetFilePath();
}

void BreachDBScanner::Close()
{
    if (closed)
        return;
    db_file.UnMapFile();
    db_file.Close();
    base = NULL;
    closed = true;
}

bool BreachDBScanner::IsClosed() const
{
    return closed;
}

}
