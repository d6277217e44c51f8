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

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <iostream>
#include <string>

#include "checker.h"
#include "config.h"
#include "digest.h"
#include "error.h"
#include "logger.h"
#include "version.h"

using namespace pwcheck;

enum pwcheck_exit_code {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_SETUP_ERROR = 2,
    EXIT_SCAN_ERROR = 3,
    EXIT_NO_CREDENTIALS = 4,
    EXIT_INTERRUPTED = 130,
};

volatile sig_atomic_t quit_pwcheck = 0;
static void HandleSignal(int sig)
{
    switch(sig)
    {
        case SIGTERM:
        case SIGINT:
        case SIGQUIT:
        case SIGHUP:
            quit_pwcheck = 1;
            break;
        default:
            break;
    }
}

static void usage(const char *prog)
{
    std::cout << "Usage: " << prog << " [-v] [-t threads] [-l logfile] [-c lower|upper|auto] [-f] [-p] passwords.csv hashes.txt\n";
    std::cout << "\t-v verbose output\n";
    std::cout << "\t-t number of hashing threads (default: number of cpus)\n";
    std::cout << "\t-l write logs to a file\n";
    std::cout << "\t-c hex case required in the hash file (default: auto, set by the first digest)\n";
    std::cout << "\t-f read and check the whole hash file, even after the last credential\n";
    std::cout << "\t-p show scan progress\n";
    std::cout << "\t-V print version\n";
    exit(EXIT_USAGE);
}

static int exit_code(int err)
{
    switch(PCError::get_error_category(err))
    {
        case PCError::CATEGORY_NONE:
            return EXIT_OK;
        case PCError::CATEGORY_SETUP:
            return EXIT_SETUP_ERROR;
        case PCError::CATEGORY_NO_CREDENTIALS:
            return EXIT_NO_CREDENTIALS;
        case PCError::CATEGORY_INTERRUPTED:
            return EXIT_INTERRUPTED;
        default:
            break;
    }
    return EXIT_SCAN_ERROR;
}

typedef struct _ProgressState {
    bool show;
    int last_percent;
} ProgressState;

// Also the point where a pending signal stops the scan.
static bool ShowProgress(size_t offset, size_t total, void *arg)
{
    ProgressState *progress = reinterpret_cast<ProgressState *>(arg);
    if(progress->show && total > 0)
    {
        int percent = static_cast<int>(offset * 100 / total);
        if(percent != progress->last_percent)
        {
            fprintf(stderr, "\rscanning hash file: %3d%%", percent);
            progress->last_percent = percent;
        }
    }
    return quit_pwcheck == 0;
}

int main(int argc, char *argv[])
{
    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);
    signal(SIGQUIT, HandleSignal);
    signal(SIGHUP, HandleSignal);
    signal(SIGPIPE, SIG_IGN);

    PCConfig config;
    InitConfig(config);
    ProgressState progress;
    progress.show = false;
    progress.last_percent = -1;

    int nfile = 0;
    for(int i = 1; i < argc; i++)
    {
        if(strcmp(argv[i], "-v") == 0)
        {
            config.verbose = true;
        }
        else if(strcmp(argv[i], "-t") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            config.num_threads = atoi(argv[i]);
            if(config.num_threads <= 0)
                usage(argv[0]);
        }
        else if(strcmp(argv[i], "-l") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            config.log_file = argv[i];
        }
        else if(strcmp(argv[i], "-c") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            if(strcmp(argv[i], "lower") == 0)
                config.hex_case = HEX_CASE_LOWER;
            else if(strcmp(argv[i], "upper") == 0)
                config.hex_case = HEX_CASE_UPPER;
            else if(strcmp(argv[i], "auto") == 0)
                config.hex_case = HEX_CASE_AUTO;
            else
                usage(argv[0]);
        }
        else if(strcmp(argv[i], "-f") == 0)
        {
            config.full_scan = true;
        }
        else if(strcmp(argv[i], "-p") == 0)
        {
            progress.show = true;
        }
        else if(strcmp(argv[i], "-V") == 0)
        {
            std::cout << "pwcheck " << PWCHECK_VERSION << "\n";
            exit(EXIT_OK);
        }
        else if(argv[i][0] == '-')
        {
            usage(argv[0]);
        }
        else if(nfile == 0)
        {
            config.password_file = argv[i];
            nfile++;
        }
        else if(nfile == 1)
        {
            config.hash_file = argv[i];
            nfile++;
        }
        else
            usage(argv[0]);
    }

    if(nfile != 2)
        usage(argv[0]);

    config.quit_flag = &quit_pwcheck;
    Checker *checker = new Checker(config);
    if(!checker->IsReady())
    {
        int rval = checker->Status();
        std::cerr << "pwcheck: " << checker->StatusStr() << " ("
                  << PCError::get_category_str(PCError::get_error_category(rval)) << ")\n";
        if(checker->SkippedRows() > 0)
            std::cerr << checker->SkippedRows() << " rows skipped\n";
        delete checker;
        Logger::Close();
        return exit_code(rval);
    }

    if(config.verbose)
    {
        std::cout << "Password file: " << config.password_file << "\n";
        std::cout << "Hash file: " << config.hash_file << "\n";
        std::cout << "Threads: " << checker->NumThreads() << "\n";
        std::cout << "Credentials: " << checker->CredentialCount() << "\n";
    }

    checker->SetProgressCallback(ShowProgress, &progress);

    MatchReporter *reporter = checker->GetReporter();
    bool interrupted = false;
    for(MatchReporter::iterator iter = reporter->begin(); iter != reporter->end(); ++iter)
    {
        if(progress.show && progress.last_percent >= 0)
            fprintf(stderr, "\n");
        progress.last_percent = -1;
        std::cout << iter.match.text << "\n";
        if(quit_pwcheck)
        {
            interrupted = true;
            break;
        }
    }
    if(progress.show && progress.last_percent >= 0)
        fprintf(stderr, "\n");

    int rval = checker->Result();
    if(interrupted)
        rval = PCError::INTERRUPTED;
    int64_t nmatch = checker->MatchCount();
    // release the mapping and the read-ahead hints before exiting
    checker->Close();

    if(rval == PCError::SUCCESS)
    {
        std::cout << nmatch << (nmatch == 1 ? " match" : " matches") << " found\n";
        if(checker->SkippedRows() > 0)
            std::cout << checker->SkippedRows() << " rows skipped\n";
        if(config.verbose)
            checker->PrintStats(std::cout);
    }
    else
    {
        std::cerr << "pwcheck: " << PCError::get_error_str(rval) << " ("
                  << PCError::get_category_str(PCError::get_error_category(rval)) << ")\n";
        if(rval != PCError::INTERRUPTED)
            std::cerr << "results are incomplete\n";
    }

    delete checker;
    Logger::Close();
    return exit_code(rval);
}
