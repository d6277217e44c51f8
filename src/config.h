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

#ifndef __PC_CONFIG_H__
#define __PC_CONFIG_H__

#include <signal.h>
#include <stddef.h>
#include <stdint.h>

namespace pwcheck {

typedef struct _PCConfig {
    // exported credential list (csv)
    const char* password_file;
    // breach database sorted by digest
    const char* hash_file;
    // log to this file instead of stdout/stderr if set
    const char* log_file;
    int log_level;
    bool verbose;

    // Number of hashing workers. Zero means one per logical processor.
    // Resolved once by ValidateConfig and never changed afterwards.
    int num_threads;
    // HEX_CASE_AUTO, HEX_CASE_LOWER or HEX_CASE_UPPER
    int hex_case;
    // Keep scanning (and checking the sort order) after the last
    // credential has been passed. Off by default.
    bool full_scan;
    // bytes between progress callbacks, zero disables progress
    size_t progress_interval;
    // Set from a signal handler to stop the run. Checked around credential
    // loading; the scan is stopped through the progress callback.
    const volatile sig_atomic_t* quit_flag;
} PCConfig;

// Fill in default values.
void InitConfig(PCConfig& config);
// Check config values and resolve defaults that depend on the host.
int ValidateConfig(PCConfig& config);
int DetectNumThreads();

}

#endif
