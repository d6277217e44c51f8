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

#ifndef __PC_ERROR_H__
#define __PC_ERROR_H__

namespace pwcheck {

// pwcheck errors
class PCError {
public:
    enum pc_error {
        SUCCESS = 0,
        NO_MEMORY = 1,
        INVALID_ARG = 2,
        NOT_INITIALIZED = 3,
        OPEN_FAILURE = 4,
        NO_PERMISSION = 5,
        MMAP_FAILED = 6,
        READ_ERROR = 7,
        THREAD_FAILED = 8,
        INVALID_HEADER = 9,
        END_OF_DATA = 10,
        MALFORMED_CREDENTIAL_ROW = 11,
        HASH_FAILURE = 12,
        MALFORMED_DIGEST = 13,
        MALFORMED_DB_ENTRY = 14,
        DB_ORDER_VIOLATION = 15,
        IO_FAULT = 16,
        NO_VALID_CREDENTIALS = 17,
        INTERRUPTED = 18,

        // UNKNOWN_ERROR should be the last enum.
        UNKNOWN_ERROR
    };

    // Error categories as seen by the operator. Every fatal error belongs
    // to exactly one category so that a corrupt download can be told apart
    // from a permission problem.
    enum pc_error_category {
        CATEGORY_NONE = 0,
        CATEGORY_SETUP = 1,
        CATEGORY_RECOVERABLE = 2,
        CATEGORY_SCAN = 3,
        CATEGORY_NO_CREDENTIALS = 4,
        CATEGORY_INTERRUPTED = 5,
        CATEGORY_UNKNOWN = 6
    };

    static const int MAX_ERROR_CODE;
    static const char* error_str[];
    static const char* category_str[];
    static const char* get_error_str(int err);
    static int get_error_category(int err);
    static const char* get_category_str(int category);
    static bool is_fatal(int err);
};

}

#endif
