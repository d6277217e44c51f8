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

#ifndef __PC_CHECKER_H__
#define __PC_CHECKER_H__

#include <iostream>
#include <stdint.h>
#include <string>

#include "config.h"
#include "credential.h"
#include "match_reporter.h"

namespace pwcheck {

class BreachDBScanner;
class MergeSearch;

// Checks an exported credential list against a breach database.
// The constructor does all the work up to the scan: it opens and maps the
// database, then reads and hashes the credentials. Setup problems are
// reported through Status() before any credential is read. The scan itself
// is driven by iterating over the reporter:
//     Checker checker(config);
//     if (checker.Status() != PCError::SUCCESS) ...
//     MatchReporter* reporter = checker.GetReporter();
//     for (MatchReporter::iterator iter = reporter->begin();
//          iter != reporter->end(); ++iter) { ... }
//     checker.Close();
class Checker {
public:
    explicit Checker(PCConfig& config);
    ~Checker();

    Checker(const Checker&) = delete;
    Checker& operator=(const Checker&) = delete;

    int Status() const;
    const char* StatusStr() const;
    bool IsReady() const;

    // NULL unless IsReady() returns true.
    MatchReporter* GetReporter();
    void SetProgressCallback(ProgressCallback cb, void* arg);

    // Final result of the run: SUCCESS, the search error or the setup error.
    int Result() const;

    // Unmap the database and drop the OS read-ahead hints. Safe to call
    // more than once, and before the scan has finished.
    int Close();

    int64_t CredentialCount() const;
    int64_t SkippedRows() const;
    int64_t MatchCount() const;
    int NumThreads() const;
    void PrintStats(std::ostream& out_stream = std::cout) const;

private:
    void Init(PCConfig& config);
    int LoadCredentials();
    bool QuitRequested() const;

    PCConfig config;
    int status;

    BreachDBScanner* scanner;
    HashedRecordList records;
    MergeSearch* search;
    MatchReporter* reporter;

    int64_t num_skipped;
    // kept after Close()
    int64_t num_matches;
    int result;
};

}

#endif
