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

#include "checker.h"
#include "credential_reader.h"
#include "db_scanner.h"
#include "digest_compare.h"
#include "error.h"
#include "hash_pipeline.h"
#include "logger.h"
#include "merge_search.h"
#include "version.h"

namespace pwcheck {

Checker::Checker(PCConfig& pc_config)
    : status(PCError::NOT_INITIALIZED)
    , scanner(NULL)
    , search(NULL)
    , reporter(NULL)
    , num_skipped(0)
    , num_matches(0)
    , result(PCError::NOT_INITIALIZED)
{
    InitConfig(config);
    Init(pc_config);
}

Checker::~Checker()
{
    Close();
}

void Checker::Init(PCConfig& pc_config)
{
    status = ValidateConfig(pc_config);
    if (status != PCError::SUCCESS)
        return;
    config = pc_config;

    if (config.log_file != NULL && config.log_file[0] != '\0')
        Logger::InitLogFile(config.log_file);
    Logger::SetLogLevel(config.log_level);

    Logger::Log(LOG_LEVEL_DEBUG, "pwcheck %s, digest compare %s", PWCHECK_VERSION,
        DigestCompareImpl());
    Logger::Log(LOG_LEVEL_DEBUG, "password file: %s", config.password_file);
    Logger::Log(LOG_LEVEL_DEBUG, "hash file: %s", config.hash_file);
    Logger::Log(LOG_LEVEL_DEBUG, "threads: %d", config.num_threads);

    // Open the database first so that a bad path is reported before the
    // credentials are touched.
    scanner = new BreachDBScanner(config.hash_file, config.hex_case);
    status = scanner->Status();
    if (status != PCError::SUCCESS) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to open hash file %s: %s",
            config.hash_file, PCError::get_error_str(status));
        return;
    }

    status = LoadCredentials();
    if (status != PCError::SUCCESS) {
        if (status == PCError::INTERRUPTED)
            Logger::Log(LOG_LEVEL_INFO, "interrupted while loading credentials");
        scanner->Close();
        return;
    }

    search = new MergeSearch(records, *scanner, config.full_scan);
    status = search->Status();
    if (status != PCError::SUCCESS)
        return;
    reporter = new MatchReporter(*search);
}

bool Checker::QuitRequested() const
{
    return config.quit_flag != NULL && *config.quit_flag != 0;
}

int Checker::LoadCredentials()
{
    if (QuitRequested())
        return PCError::INTERRUPTED;

    CredentialReader reader(config.password_file);
    int rval = reader.Status();
    if (rval != PCError::SUCCESS) {
        Logger::Log(LOG_LEVEL_ERROR, "failed to read password file %s: %s",
            config.password_file, PCError::get_error_str(rval));
        return rval;
    }

    HashPipeline pipeline(config.num_threads);
    rval = pipeline.Run(reader, records);
    num_skipped = pipeline.SkippedRows();
    if (rval != PCError::SUCCESS)
        return rval;
    if (QuitRequested()) {
        HashedRecordList().swap(records);
        return PCError::INTERRUPTED;
    }

    Logger::Log(LOG_LEVEL_DEBUG, "%lld credentials hashed, %lld rows skipped",
        static_cast<long long>(records.size()), static_cast<long long>(num_skipped));
    return PCError::SUCCESS;
}

int Checker::Status() const
{
    return status;
}

const char* Checker::StatusStr() const
{
    return PCError::get_error_str(status);
}

bool Checker::IsReady() const
{
    return status == PCError::SUCCESS && reporter != NULL;
}

MatchReporter* Checker::GetReporter()
{
    return reporter;
}

void Checker::SetProgressCallback(ProgressCallback cb, void* arg)
{
    if (search != NULL)
        search->SetProgressCallback(cb, arg, config.progress_interval);
}

int Checker::Result() const
{
    if (status != PCError::SUCCESS)
        return status;
    if (reporter == NULL)
        return result;
    return reporter->Status();
}

int Checker::Close()
{
    if (reporter != NULL) {
        result = reporter->Status();
        num_matches = reporter->Count();
        delete reporter;
        reporter = NULL;
    }
    if (search != NULL) {
        delete search;
        search = NULL;
    }
    if (scanner != NULL) {
        scanner->Close();
        delete scanner;
        scanner = NULL;
    }
    return PCError::SUCCESS;
}

int64_t Checker::CredentialCount() const
{
    return static_cast<int64_t>(records.size());
}

int64_t Checker::SkippedRows() const
{
    return num_skipped;
}

int64_t Checker::MatchCount() const
{
    if (reporter == NULL)
        return num_matches;
    return reporter->Count();
}

int Checker::NumThreads() const
{
    return config.num_threads;
}

void Checker::PrintStats(std::ostream& out_stream) const
{
    out_stream << "credentials checked: " << records.size() << "\n";
    out_stream << "rows skipped: " << num_skipped << "\n";
    if (search != NULL) {
        out_stream << "database lines scanned: " << search->LinesScanned() << "\n";
        out_stream << "matches: " << search->Matches() << "\n";
    } else {
        out_stream << "matches: " << num_matches << "\n";
    }
}

}
