#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Error taxonomy shared by every launch step. Each maps to a distinct CLI exit code.
enum class ErrorCode {
    None = 0,
    CopyError,
    DuplicateJob,
    Filesystem,
    Spawn,
    Timeout,
    NoReader,
    ChannelExists,
    Canceled,
    NotFound,
    Busy,
    Config,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct PathsConfig {
    std::string jobs_root = "/tmp/isojob/jobs";
    std::string dest_root = "/tmp";          // workspaces land at <dest_root>/<name>
    std::string temp_root = "/tmp";          // optional temp dirs land at <temp_root>/<name>
    std::string state_dir = "/tmp/isojob/state";
    std::string log_dir = "/tmp/isojob/logs";
};

struct ChannelConfig {
    std::string name = "env";                // FIFO name inside the registered workspace
    unsigned mode = 0600;
    int timeout_secs = 30;                   // upper bound on the secret rendezvous
};

struct ServiceConfig {
    std::string systemctl = "systemctl";
    std::string unit_template = "playbook@{}.service";
    bool user = false;                       // pass --user to systemctl
    bool no_block = true;                    // pass --no-block to start/stop
    int timeout_secs = 30;                   // max wait for systemctl itself
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
