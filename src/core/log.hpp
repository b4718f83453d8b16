#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Debug and per-job logs live under one directory, set once from config.
// Until set, the system temp directory is used.
void set_log_dir(const std::filesystem::path& dir);
std::filesystem::path log_dir();

std::string isojob_log_path();

// Persistent job log path: <log_dir>/{job_id}.log
std::string job_log_path(const std::string& job_id);

// Append a timestamped line to a job's persistent log file.
// Callers pass lifecycle events only; secret payloads never reach a log.
void append_job_log(const std::string& job_id, const std::string& msg);

// Append a millisecond-timestamped line to the debug log.
void isojob_log(const std::string& msg);

void isojob_log_cmd(const std::string& label, const std::string& cmd,
                    const CommandResult& r);
