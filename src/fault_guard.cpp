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

#include <errno.h>
#include <stdint.h>
#include <string.h>

#include "fault_guard.h"
#include "logger.h"

namespace pwcheck {

int FaultGuard::install_count = 0;
struct sigaction FaultGuard::prev_action;

// The scan is single threaded but each thread gets its own arming state.
static __thread sigjmp_buf* fault_env = NULL;
static __thread const uint8_t* fault_start = NULL;
static __thread size_t fault_len = 0;
static const void* volatile last_fault_addr = NULL;

FaultGuard::FaultGuard()
{
    installed = false;
    if (install_count++ > 0) {
        installed = true;
        return;
    }

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_sigaction = FaultGuard::Handler;
    sa.sa_flags = SA_SIGINFO;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGBUS, &sa, &prev_action) != 0) {
        Logger::Log(LOG_LEVEL_WARN, "failed to install SIGBUS handler: errno %d", errno);
        install_count--;
        return;
    }
    installed = true;
}

FaultGuard::~FaultGuard()
{
    if (!installed)
        return;
    if (--install_count == 0)
        sigaction(SIGBUS, &prev_action, NULL);
}

bool FaultGuard::Installed() const
{
    return installed;
}

void FaultGuard::Arm(sigjmp_buf* env, const void* start, size_t len)
{
    fault_start = reinterpret_cast<const uint8_t*>(start);
    fault_len = len;
    fault_env = env;
}

void FaultGuard::Disarm()
{
    fault_env = NULL;
    fault_start = NULL;
    fault_len = 0;
}

const void* FaultGuard::LastFaultAddress()
{
    return last_fault_addr;
}

void FaultGuard::Handler(int sig, siginfo_t* si, void* ctx)
{
    const uint8_t* addr = reinterpret_cast<const uint8_t*>(si->si_addr);
    if (fault_env != NULL && addr >= fault_start && addr < fault_start + fault_len) {
        sigjmp_buf* env = fault_env;
        fault_env = NULL;
        last_fault_addr = si->si_addr;
        siglongjmp(*env, 1);
    }

    // Not ours. Restore the previous disposition and let the faulting
    // instruction run again.
    sigaction(SIGBUS, &prev_action, NULL);
    if ((prev_action.sa_flags & SA_SIGINFO) && prev_action.sa_sigaction != NULL) {
        prev_action.sa_sigaction(sig, si, ctx);
    } else if (prev_action.sa_handler != SIG_DFL && prev_action.sa_handler != SIG_IGN) {
        prev_action.sa_handler(sig);
    }
}

}
