#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
    // Never leave a zombie behind: a handle dropped while the child runs
    // terminates it.
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_), reaped_(other.reaped_),
      out_fd_(other.out_fd_), err_fd_(other.err_fd_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        if (pid_ > 0 && !reaped_) {
            terminate();
        }
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        reaped_ = other.reaped_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) record_status(status);
        return exit_code_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (elapsed <= timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            record_status(status);
            return exit_code_;
        }
        if (ret < 0 && errno != EINTR) return -1;
        sleep_ms(20);
        elapsed += 20;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    if (wait(PROCESS_TERM_GRACE_MS) >= 0) return;
    kill(pid_, SIGKILL);
    wait(-1);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (capture_output) {
        if (pipe2(out_pipe, O_CLOEXEC) != 0) return handle;
        if (pipe2(err_pipe, O_CLOEXEC) != 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            return handle;
        }
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (capture_output) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
        }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        handle.out_fd_ = out_pipe[0];
        handle.err_fd_ = err_pipe[0];
    }
    return handle;
}

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    ProcessHandle proc = spawn(program, args, true);
    if (!proc.valid()) {
        return CommandResult{-1, "", "Failed to spawn " + program + ": " + std::strerror(errno)};
    }

    std::string out, err;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool out_open = true, err_open = true;
    char buf[4096];

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        struct pollfd fds[2] = {
            {out_open ? proc.stdout_fd() : -1, POLLIN, 0},
            {err_open ? proc.stderr_fd() : -1, POLLIN, 0},
        };
        int rc = poll(fds, 2, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? out : err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                (i == 0 ? out_open : err_open) = false;
            }
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    int code = proc.wait(remaining > 0 ? static_cast<int>(remaining) : 0);
    if (code < 0) {
        if (proc.running()) {
            proc.terminate();
            return CommandResult{-1, out, err + (err.empty() ? "" : "\n") +
                                     program + " timed out after " +
                                     std::to_string(timeout_ms) + "ms"};
        }
        code = proc.wait(0);
    }
    if (code == 127 && err.empty()) {
        err = "Failed to execute " + program;
    }
    return CommandResult{code, out, err};
}

} // namespace platform
