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

#include "pwcheck_consts.h"

namespace pwcheck {

const size_t PCConsts::DEFAULT_PROGRESS_INTERVAL = 64LLU * 1024 * 1024;
const int PCConsts::MAX_NUM_THREADS = 1024;
const int PCConsts::MAX_COUNT_DIGITS = 10;
const size_t PCConsts::MAX_CREDENTIAL_FILE_SIZE = 1024LLU * 1024 * 1024;
const char* PCConsts::DEFAULT_LABEL_SEPARATOR = "@";

}
