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

#ifndef __PC_MATCH_REPORTER_H__
#define __PC_MATCH_REPORTER_H__

#include <stdint.h>
#include <string>

#include "merge_search.h"

namespace pwcheck {

typedef struct _MatchResult {
    std::string account_label;
    uint32_t occurrence_count;
    // line shown to the user
    std::string text;
} MatchResult;

#define REPORTER_ITER_STATE_INIT 0
#define REPORTER_ITER_STATE_MORE 1
#define REPORTER_ITER_STATE_DONE 2

// Turns match events into user facing results while the search runs.
// Example:
//     MatchReporter reporter(search);
//     for (MatchReporter::iterator iter = reporter.begin();
//          iter != reporter.end(); ++iter) {
//         std::cout << iter.match.text << "\n";
//     }
//     if (reporter.Status() != PCError::SUCCESS) ...
// Iteration is single pass. begin() can only be used once per reporter.
class MatchReporter {
public:
    class iterator {
    public:
        MatchResult match;

        iterator(MatchReporter& reporter, int iter_state);
        ~iterator();

        bool operator!=(const iterator& rhs) const;
        const iterator& operator++();

    private:
        void next();

        MatchReporter& reporter_ref;
        int state;
    };

    explicit MatchReporter(MergeSearch& search);
    ~MatchReporter();

    iterator begin();
    iterator end();

    // Result of the underlying search. Only final once iteration is done.
    int Status() const;
    int64_t Count() const;

    static std::string FormatMatch(const std::string& account_label, uint32_t count);

private:
    int Pull(MatchResult& result);

    MergeSearch& search;
    bool started;
    int status;
    int64_t count;
};

}

#endif
