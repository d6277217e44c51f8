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

#ifndef __PC_FAULT_GUARD_H__
#define __PC_FAULT_GUARD_H__

#include <setjmp.h>
#include <signal.h>
#include <stddef.h>

namespace pwcheck {

// Converts a SIGBUS raised while reading a memory mapped region into a
// return through siglongjmp. This happens when the mapped file is
// truncated by someone else while it is being scanned.
//
// Usage:
//     sigjmp_buf env;
//     if (sigsetjmp(env, 1) != 0) {
//         FaultGuard::Disarm();
//         return PCError::IO_FAULT;
//     }
//     FaultGuard::Arm(&env, map_addr, map_size);
//     ... read the mapping, no objects with destructors in between ...
//     FaultGuard::Disarm();
//
// The handler is installed while at least one FaultGuard object is alive.
// Faults outside of the armed region get the previous disposition.
class FaultGuard {
public:
    FaultGuard();
    ~FaultGuard();

    bool Installed() const;

    static void Arm(sigjmp_buf* env, const void* start, size_t len);
    static void Disarm();
    // Address reported by the last caught fault.
    static const void* LastFaultAddress();

private:
    static void Handler(int sig, siginfo_t* si, void* ctx);

    bool installed;

    static int install_count;
    static struct sigaction prev_action;
};

}

#endif
