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

#include "error.h"

namespace pwcheck {

const int PCError::MAX_ERROR_CODE = UNKNOWN_ERROR;
const char* PCError::error_str[] = {
    "success",
    "no memory",
    "invalid argument",
    "not initialized",
    "file open failure",
    "permission denied",
    "mmap failed",
    "file read error",
    "failed to create thread",
    "credential file header has no password column",
    "end of data",
    "malformed credential row",
    "failed to hash credential",
    "malformed digest",
    "malformed database entry",
    "database not sorted by digest",
    "read fault on mapped database",
    "no valid credentials",
    "interrupted",

    ///////////////////////////////////
    "unknown error",
};

const char* PCError::category_str[] = {
    "none",
    "setup error",
    "recoverable",
    "scan error",
    "nothing to check",
    "interrupted",
    "unknown",
};

const char* PCError::get_error_str(int err)
{
    if (err < 0)
        return "system error";
    else if (err > MAX_ERROR_CODE)
        return "invalid error code";

    return error_str[err];
}

int PCError::get_error_category(int err)
{
    switch (err) {
    case SUCCESS:
    case END_OF_DATA:
        return CATEGORY_NONE;
    case NO_MEMORY:
    case INVALID_ARG:
    case NOT_INITIALIZED:
    case OPEN_FAILURE:
    case NO_PERMISSION:
    case MMAP_FAILED:
    case READ_ERROR:
    case THREAD_FAILED:
    case INVALID_HEADER:
        return CATEGORY_SETUP;
    case MALFORMED_CREDENTIAL_ROW:
    case HASH_FAILURE:
        return CATEGORY_RECOVERABLE;
    case MALFORMED_DIGEST:
    case MALFORMED_DB_ENTRY:
    case DB_ORDER_VIOLATION:
    case IO_FAULT:
        return CATEGORY_SCAN;
    case NO_VALID_CREDENTIALS:
        return CATEGORY_NO_CREDENTIALS;
    case INTERRUPTED:
        return CATEGORY_INTERRUPTED;
    default:
        break;
    }

    return CATEGORY_UNKNOWN;
}

const char* PCError::get_category_str(int category)
{
    if (category < CATEGORY_NONE || category > CATEGORY_UNKNOWN)
        return "invalid category";

    return category_str[category];
}

bool PCError::is_fatal(int err)
{
    int category = get_error_category(err);
    return category != CATEGORY_NONE && category != CATEGORY_RECOVERABLE;
}

}
