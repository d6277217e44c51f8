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

#ifndef __PC_CREDENTIAL_H__
#define __PC_CREDENTIAL_H__

#include <string>
#include <vector>

#include "digest.h"
#include "secure_buffer.h"

namespace pwcheck {

// Plaintext credential. Lives only until its digest is computed.
typedef struct _CredentialRecord {
    std::string account_label;
    SecureBuffer secret;
} CredentialRecord;

// Hashed credential. A collection of these is sorted by digest once and is
// read-only afterwards.
typedef struct _HashedRecord {
    std::string account_label;
    Digest digest;
} HashedRecord;

typedef std::vector<HashedRecord> HashedRecordList;

// Source of (account label, secret) rows, read once front to back.
class RowSource {
public:
    virtual ~RowSource() {}

    // Returns SUCCESS and fills record, END_OF_DATA when there are no more
    // rows, MALFORMED_CREDENTIAL_ROW for a row that has to be skipped (the
    // source stays usable), or any other error if reading has to stop.
    virtual int Next(CredentialRecord& record) = 0;
};

}

#endif
