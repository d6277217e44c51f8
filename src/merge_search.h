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

#ifndef __PC_MERGE_SEARCH_H__
#define __PC_MERGE_SEARCH_H__

#include <setjmp.h>
#include <stdint.h>
#include <string>

#include "credential.h"
#include "db_scanner.h"
#include "fault_guard.h"

namespace pwcheck {

typedef struct _MatchEvent {
    std::string account_label;
    uint32_t occurrence_count;
} MatchEvent;

// Called every progress interval with the scanner byte offset. Returning
// false stops the search with PCError::INTERRUPTED.
typedef bool (*ProgressCallback)(size_t offset, size_t total, void* arg);

// Ascending merge-join of the sorted hashed credentials against the breach
// database. Both sides are walked forward exactly once.
//
// Matches are produced one at a time by Next(), nothing is buffered. The
// record list is borrowed and must not change while the search is alive.
class MergeSearch {
public:
    // The search ends as soon as either side is exhausted. With full_scan
    // set the database is read to the end even after all credentials have
    // been passed, so that the whole file is checked for sort order and
    // format.
    MergeSearch(const HashedRecordList& records, BreachDBScanner& scanner,
        bool full_scan = false);
    ~MergeSearch();

    void SetProgressCallback(ProgressCallback cb, void* arg, size_t interval);

    // Returns SUCCESS and fills event for the next match, END_OF_DATA when
    // the search is complete, or the fatal error that stopped it. After a
    // fatal error every call returns the same error.
    int Next(MatchEvent& event);

    // SUCCESS unless the search stopped on an error.
    int Status() const;
    bool Done() const;
    int64_t Matches() const;
    int64_t RecordsConsumed() const;
    int64_t LinesScanned() const;

private:
    enum {
        STEP_MATCH = 0,
        STEP_PROGRESS,
        STEP_DONE,
        STEP_ERROR
    };

    // Runs with the fault guard armed: only plain locals allowed.
    int Step(size_t& index, uint32_t& count);
    int AdvanceDB();
    int Fail(int err);

    const HashedRecordList& records;
    BreachDBScanner& scanner;
    bool full_scan;
    FaultGuard fault_guard;
    sigjmp_buf fault_env;

    size_t u;
    DatabaseEntry entry;
    bool have_entry;
    bool count_parsed;
    uint32_t entry_count;
    Digest prev_digest;
    bool have_prev;
    bool db_done;

    int status;
    bool done;
    int64_t num_matches;

    ProgressCallback progress_cb;
    void* progress_arg;
    size_t progress_interval;
    size_t next_progress;
};

}

#endif
