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

#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <iostream>
#include <unistd.h>

#include "logger.h"
#include "error.h"

#define MAX_NUM_LOG 10
#define MAX_LOG_MESSAGE 1024

namespace pwcheck {

std::string Logger::log_file = "";
std::ofstream* Logger::log_stream = NULL;
int Logger::log_level_       = LOG_LEVEL_INFO;
int Logger::roll_size        = 50*1024*1024;
std::mutex Logger::log_mutex;
const char* Logger::LOG_LEVEL[4] =
{
    " ERROR: ",
    " WARN: ",
    " INFO: ",
    " DEBUG: "
};

Logger::Logger()
{
}

Logger::~Logger()
{
}

void Logger::Close()
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if(log_stream != NULL)
    {
        if(log_stream->is_open())
            log_stream->close();

        delete log_stream;
        log_stream = NULL;
    }
    log_file = "";
}

void Logger::InitLogFile(const std::string &logfile)
{
    if(logfile.empty())
        return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if(log_stream != NULL)
    {
        if(log_stream->is_open())
            log_stream->close();
        delete log_stream;
    }
    log_file = logfile;
    log_stream = new std::ofstream();
    log_stream->open(log_file.c_str(), std::ios::out | std::ios::app);
    if(!log_stream->is_open())
    {
        std::cerr << "failed to open log file " << log_file << std::endl;
        delete log_stream;
        log_stream = NULL;
        log_file = "";
    }
}

void Logger::FillDateTime(char *buffer, int bufsize)
{
    time_t rawtime;
    struct tm timeinfo;
    time (&rawtime);
    if(localtime_r(&rawtime, &timeinfo))
        strftime(buffer, bufsize, "%Y-%m-%d.%X", &timeinfo);
    else
        snprintf(buffer, bufsize, "Time unknown");
}

// Caller holds log_mutex.
void Logger::Rotate()
{
    if(log_stream == NULL)
        return;
    if(log_stream->is_open())
        log_stream->close();

    std::string filepath_old;
    std::string filepath_new;
    for(int i = MAX_NUM_LOG-2; i > 0; i--)
    {
        filepath_old = log_file + "." + std::to_string(i);
        if(access(filepath_old.c_str(), R_OK) == 0)
        {
            filepath_new = log_file + "." + std::to_string(i+1);
            if(rename(filepath_old.c_str(), filepath_new.c_str()))
                std::cerr << "failed to move log file\n";
        }
    }
    filepath_new = log_file + ".1";
    if(rename(log_file.c_str(), filepath_new.c_str()))
        std::cerr << "failed to move log file\n";

    log_stream->open(log_file.c_str(), std::ios::out | std::ios::app);
}

// Errors and warnings go to stderr, everything else to stdout unless a
// log file has been set.
void Logger::Write(int level, const char *message)
{
    char buffer[80];
    FillDateTime(buffer, sizeof(buffer));

    std::lock_guard<std::mutex> lock(log_mutex);
    if(log_stream != NULL)
    {
        *log_stream << buffer << LOG_LEVEL[level] << message << std::endl;
        if(log_stream->tellp() > roll_size)
            Logger::Rotate();
    }
    else if(level < LOG_LEVEL_INFO)
        std::cerr << buffer << LOG_LEVEL[level] << message << std::endl;
    else if(level == LOG_LEVEL_DEBUG)
        std::cout << buffer << " Verbose: " << message << std::endl;
    else
        std::cout << buffer << ": " << message << std::endl;
}

void Logger::Log(int level, const std::string &message)
{
    if(level < LOG_LEVEL_ERROR || level > log_level_)
        return;

    Write(level, message.c_str());
}

void Logger::Log(int level, const char *format, ... )
{
    if(level < LOG_LEVEL_ERROR || level > log_level_)
        return;

    char message[MAX_LOG_MESSAGE];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    Write(level, message);
}

int Logger::SetLogLevel(int level)
{
    if(level < LOG_LEVEL_ERROR || level > LOG_LEVEL_DEBUG)
    {
        Logger::Log(LOG_LEVEL_WARN, "invalid logging level %d", level);
        return PCError::INVALID_ARG;
    }

    log_level_ = level;

    return PCError::SUCCESS;
}

int Logger::GetLogLevel()
{
    return log_level_;
}

std::ofstream* Logger::GetLogStream()
{
    return log_stream;
}

}
