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

#ifndef __PC_CONSTS_H__
#define __PC_CONSTS_H__

#include <stddef.h>
#include <stdint.h>

namespace pwcheck {

class PCConsts {
public:
    // Bytes scanned between two progress notifications
    static const size_t DEFAULT_PROGRESS_INTERVAL;
    static const int MAX_NUM_THREADS;
    // Longest decimal occurrence count accepted on a database line
    static const int MAX_COUNT_DIGITS;
    // Exported credential lists are read into memory in one piece.
    static const size_t MAX_CREDENTIAL_FILE_SIZE;
    static const char* DEFAULT_LABEL_SEPARATOR;
};

}

#endif
