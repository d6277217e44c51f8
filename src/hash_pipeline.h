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

#ifndef __PC_HASH_PIPELINE_H__
#define __PC_HASH_PIPELINE_H__

#include <stdint.h>
#include <vector>

#include "credential.h"
#include "digest.h"

namespace pwcheck {

// Turns credential rows into HashedRecords sorted ascending by digest.
//
// All rows are read first by the calling thread. The row buffer is then
// cut into one contiguous chunk per worker; each worker hashes its chunk
// into its own output slot and wipes every secret as soon as it has been
// hashed. After all workers have been joined the slots are concatenated
// and sorted. Records with equal digests are all kept.
class HashPipeline {
public:
    // Digest function used by the workers. Called concurrently.
    // PCError::HASH_FAILURE skips the row; any other error fails the run.
    typedef int (*HashFunction)(const SecureBuffer& secret, Digest& digest);

    // num_threads is fixed for the lifetime of the pipeline.
    explicit HashPipeline(int num_threads);
    ~HashPipeline();

    // Returns SUCCESS, NO_VALID_CREDENTIALS if no row could be hashed, or
    // the first fatal error of the source or of a worker. records only
    // holds output on SUCCESS.
    int Run(RowSource& source, HashedRecordList& records);

    // Rows skipped because they were malformed or could not be hashed.
    int64_t SkippedRows() const;
    int64_t HashedRows() const;
    int NumThreads() const;
    // Plaintext rows held by the pipeline. Always zero outside Run.
    size_t BufferedRows() const;

    // HashSecret unless replaced.
    void SetHashFunction(HashFunction func);
    static int HashSecret(const SecureBuffer& secret, Digest& digest);

private:
    typedef struct _ChunkResult {
        HashedRecordList records;
        int64_t num_skipped;
        int status;
    } ChunkResult;

    int Collect(RowSource& source);
    static void HashChunk(HashFunction func, std::vector<CredentialRecord>* rows,
        size_t start, size_t end, ChunkResult* result);
    void WipeRows();

    std::vector<CredentialRecord> rows;
    HashFunction hash_func;
    int num_threads;
    int64_t num_skipped;
    int64_t num_hashed;
};

}

#endif
