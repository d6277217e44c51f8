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

#include "error.h"
#include "logger.h"
#include "match_reporter.h"

namespace pwcheck {

MatchReporter::MatchReporter(MergeSearch& merge_search)
    : search(merge_search)
    , started(false)
    , status(PCError::SUCCESS)
    , count(0)
{
}

MatchReporter::~MatchReporter()
{
}

std::string MatchReporter::FormatMatch(const std::string& account_label, uint32_t occurrences)
{
    return "Password for " + account_label + " found " + std::to_string(occurrences)
        + (occurrences == 1 ? " time" : " times") + " in breach database";
}

int MatchReporter::Pull(MatchResult& result)
{
    MatchEvent event;
    int rval = search.Next(event);
    if (rval == PCError::END_OF_DATA)
        return rval;
    if (rval != PCError::SUCCESS) {
        status = rval;
        return rval;
    }

    result.text = FormatMatch(event.account_label, event.occurrence_count);
    result.account_label = std::move(event.account_label);
    result.occurrence_count = event.occurrence_count;
    count++;
    return PCError::SUCCESS;
}

MatchReporter::iterator MatchReporter::begin()
{
    if (started) {
        Logger::Log(LOG_LEVEL_WARN, "match reporter can only be iterated once");
        return iterator(*this, REPORTER_ITER_STATE_DONE);
    }
    started = true;
    return iterator(*this, REPORTER_ITER_STATE_INIT);
}

MatchReporter::iterator MatchReporter::end()
{
    return iterator(*this, REPORTER_ITER_STATE_DONE);
}

int MatchReporter::Status() const
{
    return status;
}

int64_t MatchReporter::Count() const
{
    return count;
}

/////////////////////////////////////////////////////////////////////
// reporter iterator
/////////////////////////////////////////////////////////////////////

MatchReporter::iterator::iterator(MatchReporter& reporter, int iter_state)
    : reporter_ref(reporter)
    , state(iter_state)
{
    match.occurrence_count = 0;
    if (state == REPORTER_ITER_STATE_INIT) {
        state = REPORTER_ITER_STATE_MORE;
        next();
    }
}

MatchReporter::iterator::~iterator()
{
}

void MatchReporter::iterator::next()
{
    if (reporter_ref.Pull(match) != PCError::SUCCESS)
        state = REPORTER_ITER_STATE_DONE;
}

bool MatchReporter::iterator::operator!=(const iterator& rhs) const
{
    return state != rhs.state;
}

const MatchReporter::iterator& MatchReporter::iterator::operator++()
{
    if (state == REPORTER_ITER_STATE_MORE)
        next();
    return *this;
}

}
