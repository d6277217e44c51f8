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
#include <thread>

#include "config.h"
#include "digest.h"
#include "error.h"
#include "logger.h"
#include "pwcheck_consts.h"

namespace pwcheck {

void InitConfig(PCConfig& config)
{
    memset(&config, 0, sizeof(config));
    config.log_level = LOG_LEVEL_INFO;
    config.hex_case = HEX_CASE_AUTO;
    config.full_scan = false;
    config.progress_interval = PCConsts::DEFAULT_PROGRESS_INTERVAL;
}

int DetectNumThreads()
{
    unsigned int ncpu = std::thread::hardware_concurrency();
    if (ncpu == 0)
        ncpu = 1;
    if (ncpu > static_cast<unsigned int>(PCConsts::MAX_NUM_THREADS))
        ncpu = PCConsts::MAX_NUM_THREADS;
    return static_cast<int>(ncpu);
}

int ValidateConfig(PCConfig& config)
{
    if (config.password_file == NULL || config.password_file[0] == '\0') {
        Logger::Log(LOG_LEVEL_ERROR, "password file not specified");
        return PCError::INVALID_ARG;
    }
    if (config.hash_file == NULL || config.hash_file[0] == '\0') {
        Logger::Log(LOG_LEVEL_ERROR, "hash file not specified");
        return PCError::INVALID_ARG;
    }

    if (config.verbose)
        config.log_level = LOG_LEVEL_DEBUG;
    if (config.log_level < LOG_LEVEL_ERROR || config.log_level > LOG_LEVEL_DEBUG) {
        Logger::Log(LOG_LEVEL_ERROR, "invalid log level %d", config.log_level);
        return PCError::INVALID_ARG;
    }

    if (config.hex_case != HEX_CASE_AUTO && config.hex_case != HEX_CASE_LOWER
        && config.hex_case != HEX_CASE_UPPER) {
        Logger::Log(LOG_LEVEL_ERROR, "invalid hex case %d", config.hex_case);
        return PCError::INVALID_ARG;
    }

    if (config.num_threads < 0 || config.num_threads > PCConsts::MAX_NUM_THREADS) {
        Logger::Log(LOG_LEVEL_ERROR, "invalid number of threads %d", config.num_threads);
        return PCError::INVALID_ARG;
    }
    if (config.num_threads == 0)
        config.num_threads = DetectNumThreads();

    return PCError::SUCCESS;
}

}
