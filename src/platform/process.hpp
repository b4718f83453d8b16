#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code, 128+N for a signal,
    // or -1 on timeout. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after the grace period).
    void terminate();

    int native_handle() const { return pid_; }

    // Read ends of the child's stdout/stderr pipes (-1 if not captured).
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }

private:
    int pid_ = -1;
    int exit_code_ = -1;
    bool reaped_ = false;
    int out_fd_ = -1;
    int err_fd_ = -1;

    void close_pipes();
    void record_status(int status);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture_output);
};

// Spawn a child process with stdin on /dev/null. No shell is involved.
// capture_output: pipe the child's stdout/stderr back to the caller.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output = false);

// Spawn, collect stdout/stderr and wait. A child still running at the
// deadline is terminated and reported with exit_code -1.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms);

} // namespace platform
