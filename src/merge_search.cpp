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

#include "digest_compare.h"
#include "error.h"
#include "logger.h"
#include "merge_search.h"

namespace pwcheck {

MergeSearch::MergeSearch(const HashedRecordList& recs, BreachDBScanner& db_scanner,
    bool full)
    : records(recs)
    , scanner(db_scanner)
    , full_scan(full)
    , u(0)
    , have_entry(false)
    , count_parsed(false)
    , entry_count(0)
    , have_prev(false)
    , db_done(false)
    , status(PCError::SUCCESS)
    , done(false)
    , num_matches(0)
    , progress_cb(NULL)
    , progress_arg(NULL)
    , progress_interval(0)
    , next_progress(0)
{
    entry.count_ptr = NULL;
    entry.count_len = 0;

    if (scanner.Status() != PCError::SUCCESS)
        status = scanner.Status();
    else if (scanner.IsClosed())
        status = PCError::NOT_INITIALIZED;
    else if (!fault_guard.Installed())
        Logger::Log(LOG_LEVEL_WARN, "SIGBUS handler not installed, a truncated "
            "database will terminate the process");
}

MergeSearch::~MergeSearch()
{
}

void MergeSearch::SetProgressCallback(ProgressCallback cb, void* arg, size_t interval)
{
    progress_cb = cb;
    progress_arg = arg;
    progress_interval = interval;
    next_progress = scanner.Offset() + interval;
    if (interval == 0)
        progress_cb = NULL;
}

int MergeSearch::Fail(int err)
{
    status = err;
    done = true;
    Logger::Log(LOG_LEVEL_ERROR, "search of %s stopped after %lld lines: %s",
        scanner.GetFilePath().c_str(), static_cast<long long>(scanner.LinesScanned()),
        PCError::get_error_str(err));
    return err;
}

int MergeSearch::AdvanceDB()
{
    int rval = scanner.Next(entry);
    if (rval != PCError::SUCCESS)
        return rval;

    if (have_prev && DigestLess(entry.digest, prev_digest)) {
        Logger::Log(LOG_LEVEL_ERROR, "database not sorted at line %lld: %s after %s",
            static_cast<long long>(scanner.LinesScanned()),
            EncodeHex(entry.digest).c_str(), EncodeHex(prev_digest).c_str());
        return PCError::DB_ORDER_VIOLATION;
    }

    prev_digest = entry.digest;
    have_prev = true;
    have_entry = true;
    count_parsed = false;
    return PCError::SUCCESS;
}

int MergeSearch::Step(size_t& index, uint32_t& count)
{
    int rval;
    for (;;) {
        if (u >= records.size() && !full_scan)
            return STEP_DONE;
        if (!have_entry) {
            if (db_done)
                return STEP_DONE;
            rval = AdvanceDB();
            if (rval == PCError::END_OF_DATA) {
                // credentials left over here can not match
                db_done = true;
                return STEP_DONE;
            }
            if (rval != PCError::SUCCESS) {
                status = rval;
                return STEP_ERROR;
            }
            if (progress_cb != NULL && scanner.Offset() >= next_progress)
                return STEP_PROGRESS;
            continue;
        }

        if (u >= records.size()) {
            have_entry = false;
            continue;
        }

        int cmp = DigestCompare(records[u].digest, entry.digest);
        if (cmp == 0) {
            if (!count_parsed) {
                rval = scanner.ParseCount(entry, entry_count);
                if (rval != PCError::SUCCESS) {
                    Logger::Log(LOG_LEVEL_ERROR, "invalid occurrence count at line %lld",
                        static_cast<long long>(scanner.LinesScanned()));
                    status = rval;
                    return STEP_ERROR;
                }
                count_parsed = true;
            }
            // Keep the entry, the next record may have the same digest.
            index = u++;
            count = entry_count;
            return STEP_MATCH;
        }
        if (cmp < 0)
            u++;
        else
            have_entry = false;
    }
}

int MergeSearch::Next(MatchEvent& event)
{
    if (status != PCError::SUCCESS)
        return status;
    if (done)
        return PCError::END_OF_DATA;

    size_t index = 0;
    uint32_t count = 0;
    int rval;
    for (;;) {
        if (sigsetjmp(fault_env, 1) != 0) {
            FaultGuard::Disarm();
            Logger::Log(LOG_LEVEL_ERROR, "read fault at %p in %s, file changed during scan?",
                FaultGuard::LastFaultAddress(), scanner.GetFilePath().c_str());
            return Fail(PCError::IO_FAULT);
        }
        FaultGuard::Arm(&fault_env, scanner.GetMapAddr(), scanner.Size());
        rval = Step(index, count);
        FaultGuard::Disarm();

        if (rval == STEP_MATCH)
            break;
        if (rval == STEP_ERROR)
            return Fail(status);
        if (rval == STEP_DONE) {
            done = true;
            Logger::Log(LOG_LEVEL_DEBUG, "search complete: %lld lines, %lld matches",
                static_cast<long long>(scanner.LinesScanned()),
                static_cast<long long>(num_matches));
            return PCError::END_OF_DATA;
        }

        // STEP_PROGRESS
        next_progress = scanner.Offset() + progress_interval;
        if (!progress_cb(scanner.Offset(), scanner.Size(), progress_arg))
            return Fail(PCError::INTERRUPTED);
    }

    event.account_label = records[index].account_label;
    event.occurrence_count = count;
    num_matches++;
    return PCError::SUCCESS;
}

int MergeSearch::Status() const
{
    return status;
}

bool MergeSearch::Done() const
{
    return done;
}

int64_t MergeSearch::Matches() const
{
    return num_matches;
}

int64_t MergeSearch::RecordsConsumed() const
{
    return static_cast<int64_t>(u);
}

int64_t MergeSearch::LinesScanned() const
{
    return scanner.LinesScanned();
}

}
