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

#include <algorithm>
#include <iterator>
#include <new>
#include <system_error>
#include <thread>

#include <openssl/evp.h>

#include "digest_compare.h"
#include "error.h"
#include "hash_pipeline.h"
#include "logger.h"

namespace pwcheck {

static bool smallest_digest_first(const HashedRecord& lhs, const HashedRecord& rhs)
{
    return DigestLess(lhs.digest, rhs.digest);
}

HashPipeline::HashPipeline(int nthreads)
    : hash_func(HashPipeline::HashSecret)
    , num_threads(nthreads > 0 ? nthreads : 1)
    , num_skipped(0)
    , num_hashed(0)
{
}

HashPipeline::~HashPipeline()
{
    WipeRows();
}

void HashPipeline::SetHashFunction(HashFunction func)
{
    hash_func = (func == NULL) ? HashPipeline::HashSecret : func;
}

int HashPipeline::HashSecret(const SecureBuffer& secret, Digest& digest)
{
    unsigned int md_len = 0;
    static const unsigned char empty = 0;
    const unsigned char* data = secret.Empty() ? &empty : secret.Data();
    if (EVP_Digest(data, secret.Size(), digest.data(), &md_len, EVP_sha1(), NULL) != 1
        || md_len != PC_DIGEST_LENGTH)
        return PCError::HASH_FAILURE;
    return PCError::SUCCESS;
}

void HashPipeline::WipeRows()
{
    for (size_t i = 0; i < rows.size(); i++)
        rows[i].secret.Wipe();
    rows.clear();
}

int HashPipeline::Collect(RowSource& source)
{
    CredentialRecord record;
    for (;;) {
        int rval = source.Next(record);
        if (rval == PCError::END_OF_DATA)
            break;
        if (rval == PCError::MALFORMED_CREDENTIAL_ROW) {
            num_skipped++;
            continue;
        }
        if (rval != PCError::SUCCESS)
            return rval;

        rows.push_back(std::move(record));
        record.secret.Wipe();
    }
    return PCError::SUCCESS;
}

void HashPipeline::HashChunk(HashFunction func, std::vector<CredentialRecord>* rows,
    size_t start, size_t end, ChunkResult* result)
{
    result->num_skipped = 0;
    result->status = PCError::SUCCESS;
    try {
        result->records.reserve(end - start);
        for (size_t i = start; i < end; i++) {
            CredentialRecord& row = (*rows)[i];
            HashedRecord hashed;
            int rval = func(row.secret, hashed.digest);
            row.secret.Wipe();
            if (rval == PCError::HASH_FAILURE) {
                Logger::Log(LOG_LEVEL_WARN, "failed to hash credential for %s",
                    row.account_label.c_str());
                result->num_skipped++;
                continue;
            }
            if (rval != PCError::SUCCESS) {
                result->status = rval;
                break;
            }
            hashed.account_label = std::move(row.account_label);
            result->records.push_back(std::move(hashed));
        }
    } catch (const std::bad_alloc&) {
        result->status = PCError::NO_MEMORY;
    }

    if (result->status != PCError::SUCCESS) {
        for (size_t i = start; i < end; i++)
            (*rows)[i].secret.Wipe();
        HashedRecordList().swap(result->records);
    }
}

int HashPipeline::Run(RowSource& source, HashedRecordList& records)
{
    records.clear();
    num_skipped = 0;
    num_hashed = 0;

    WipeRows();
    int rval;
    try {
        rval = Collect(source);
    } catch (const std::bad_alloc&) {
        rval = PCError::NO_MEMORY;
    }
    if (rval != PCError::SUCCESS) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to read credentials: %s",
            PCError::get_error_str(rval));
        WipeRows();
        return rval;
    }

    if (rows.empty()) {
        Logger::Log(LOG_LEVEL_ERROR, "no valid credentials (%lld rows skipped)",
            static_cast<long long>(num_skipped));
        return PCError::NO_VALID_CREDENTIALS;
    }

    // Static partition: no more chunks than rows, sizes differ by at most one.
    size_t nchunk = std::min(static_cast<size_t>(num_threads), rows.size());
    size_t chunk_size = rows.size() / nchunk;
    size_t remainder = rows.size() % nchunk;
    std::vector<ChunkResult> results(nchunk);
    std::vector<std::thread> workers;
    workers.reserve(nchunk);

    Logger::Log(LOG_LEVEL_DEBUG, "hashing %zu credentials with %zu threads",
        rows.size(), nchunk);

    rval = PCError::SUCCESS;
    size_t start = 0;
    for (size_t i = 0; i < nchunk; i++) {
        size_t end = start + chunk_size + (i < remainder ? 1 : 0);
        try {
            workers.push_back(std::thread(HashPipeline::HashChunk, hash_func, &rows, start, end,
                &results[i]));
        } catch (const std::system_error& e) {
            Logger::Log(LOG_LEVEL_ERROR, "failed to create hashing thread: %s", e.what());
            rval = PCError::THREAD_FAILED;
            break;
        }
        start = end;
    }

    // join barrier
    for (size_t i = 0; i < workers.size(); i++)
        workers[i].join();

    if (rval == PCError::SUCCESS) {
        for (size_t i = 0; i < nchunk; i++) {
            if (results[i].status != PCError::SUCCESS) {
                rval = results[i].status;
                Logger::Log(LOG_LEVEL_ERROR, "hashing worker %zu failed: %s",
                    i, PCError::get_error_str(rval));
                break;
            }
        }
    }
    // First error wins, output of the other chunks is dropped.
    WipeRows();
    if (rval != PCError::SUCCESS)
        return rval;

    size_t total = 0;
    for (size_t i = 0; i < nchunk; i++) {
        total += results[i].records.size();
        num_skipped += results[i].num_skipped;
    }
    if (total == 0) {
        Logger::Log(LOG_LEVEL_ERROR, "no valid credentials (%lld rows skipped)",
            static_cast<long long>(num_skipped));
        return PCError::NO_VALID_CREDENTIALS;
    }

    try {
        records.reserve(total);
        for (size_t i = 0; i < nchunk; i++) {
            records.insert(records.end(),
                std::make_move_iterator(results[i].records.begin()),
                std::make_move_iterator(results[i].records.end()));
            HashedRecordList().swap(results[i].records);
        }
    } catch (const std::bad_alloc&) {
        records.clear();
        return PCError::NO_MEMORY;
    }

    std::sort(records.begin(), records.end(), smallest_digest_first);
    num_hashed = static_cast<int64_t>(records.size());

    if (num_skipped > 0)
        Logger::Log(LOG_LEVEL_WARN, "%lld credential rows skipped", static_cast<long long>(num_skipped));
    Logger::Log(LOG_LEVEL_DEBUG, "hashed %lld credentials", static_cast<long long>(num_hashed));
    return PCError::SUCCESS;
}

int64_t HashPipeline::SkippedRows() const
{
    return num_skipped;
}

int64_t HashPipeline::HashedRows() const
{
    return num_hashed;
}

int HashPipeline::NumThreads() const
{
    return num_threads;
}

size_t HashPipeline::BufferedRows() const
{
    return rows.size();
}

}
