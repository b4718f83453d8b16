#include "utils.hpp"
#include "constants.hpp"
#include "types.hpp"
#include <chrono>
#include <ctime>
#include <stdexcept>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:          return "Success";
        case ErrorCode::CopyError:     return "CopyError";
        case ErrorCode::DuplicateJob:  return "DuplicateJobError";
        case ErrorCode::Filesystem:    return "FilesystemError";
        case ErrorCode::Spawn:         return "SpawnError";
        case ErrorCode::Timeout:       return "Timeout";
        case ErrorCode::NoReader:      return "NoReaderError";
        case ErrorCode::ChannelExists: return "ChannelExistsError";
        case ErrorCode::Canceled:      return "Canceled";
        case ErrorCode::NotFound:      return "NotFound";
        case ErrorCode::Busy:          return "Busy";
        case ErrorCode::Config:        return "ConfigError";
    }
    return "Unknown";
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

unsigned parse_mode(const std::string& s, unsigned fallback) {
    if (s.empty()) return fallback;
    unsigned mode = 0;
    for (char c : s) {
        if (c < '0' || c > '7') return fallback;
        mode = mode * 8 + static_cast<unsigned>(c - '0');
        if (mode > 07777) return fallback;
    }
    return mode;
}

bool is_valid_job_id(const std::string& job_id) {
    if (job_id.empty() || job_id.size() > static_cast<size_t>(MAX_JOB_ID_LENGTH)) {
        return false;
    }
    if (job_id == "." || job_id == "..") return false;
    for (char c : job_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}
