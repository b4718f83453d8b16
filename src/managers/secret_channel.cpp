#include "secret_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono;

namespace {

// Blocks SIGPIPE on this thread for its lifetime so a vanished reader shows
// up as EPIPE instead of killing the process. A SIGPIPE raised meanwhile is
// consumed before the old mask is restored.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &set, &old_);
        was_blocked_ = sigismember(&old_, SIGPIPE) == 1;
    }

    ~SigpipeGuard() {
        if (!was_blocked_) {
            sigset_t pending;
            sigemptyset(&pending);
            if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                sigset_t set;
                sigemptyset(&set);
                sigaddset(&set, SIGPIPE);
                struct timespec zero = {0, 0};
                while (sigtimedwait(&set, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t old_;
    bool was_blocked_ = false;
};

struct FdCloser {
    int fd;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
};

int remaining_ms(steady_clock::time_point deadline) {
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool canceled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

} // namespace

Result<SecretChannel> SecretChannel::create(const fs::path& node_path, unsigned mode) {
    if (mkfifo(node_path.c_str(), static_cast<mode_t>(mode)) != 0) {
        if (errno == EEXIST) {
            return Result<SecretChannel>::Err(ErrorCode::ChannelExists,
                fmt::format("Channel node {} already exists", node_path.string()));
        }
        return Result<SecretChannel>::Err(ErrorCode::Filesystem,
            fmt::format("mkfifo {} failed: {}", node_path.string(), std::strerror(errno)));
    }

    // From here on the node is ours; the channel unlinks it on any exit
    SecretChannel channel(node_path);

    // mkfifo applies the umask; make the mode exact
    if (chmod(node_path.c_str(), static_cast<mode_t>(mode)) != 0) {
        return Result<SecretChannel>::Err(ErrorCode::Filesystem,
            fmt::format("chmod {} failed: {}", node_path.string(), std::strerror(errno)));
    }

    isojob_log(fmt::format("channel: created {} mode {:04o}", node_path.string(), mode));
    return Result<SecretChannel>::Ok(std::move(channel));
}

SecretChannel::~SecretChannel() {
    if (open_) {
        auto r = close();
        if (r.is_err()) {
            isojob_log(fmt::format("channel: {}", r.error));
        }
    }
}

SecretChannel::SecretChannel(SecretChannel&& other) noexcept
    : path_(std::move(other.path_)), open_(other.open_), written_(other.written_) {
    other.open_ = false;
}

SecretChannel& SecretChannel::operator=(SecretChannel&& other) noexcept {
    if (this != &other) {
        if (open_) {
            auto r = close();
            if (r.is_err()) {
                isojob_log(fmt::format("channel: {}", r.error));
            }
        }
        path_ = std::move(other.path_);
        open_ = other.open_;
        written_ = other.written_;
        other.open_ = false;
    }
    return *this;
}

Result<void> SecretChannel::write_once(const Secret& secret, milliseconds timeout,
                                       const std::atomic<bool>* cancel) {
    if (!open_) {
        return Result<void>::Err(ErrorCode::NoReader, "Channel is closed");
    }
    if (written_) {
        return Result<void>::Err(ErrorCode::ChannelExists,
            fmt::format("Channel {} was already used", path_.string()));
    }
    written_ = true;

    auto deadline = steady_clock::now() + timeout;

    // A non-blocking write-open fails with ENXIO until a reader has the
    // pipe open, so poll for the reader instead of blocking in open(2).
    int fd = -1;
    for (;;) {
        if (canceled(cancel)) {
            return Result<void>::Err(ErrorCode::Canceled, "Canceled while waiting for the worker");
        }
        fd = ::open(path_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd >= 0) break;

        if (errno == ENOENT) {
            return Result<void>::Err(ErrorCode::NoReader,
                fmt::format("Channel node {} was removed", path_.string()));
        }
        if (errno != ENXIO && errno != EINTR) {
            return Result<void>::Err(ErrorCode::Filesystem,
                fmt::format("Cannot open {}: {}", path_.string(), std::strerror(errno)));
        }
        int left = remaining_ms(deadline);
        if (left == 0) {
            return Result<void>::Err(ErrorCode::Timeout,
                fmt::format("No reader attached to {} within {} ms", path_.string(), timeout.count()));
        }
        platform::sleep_ms(std::min(left, CHANNEL_POLL_MS));
    }
    FdCloser closer{fd};

    // Someone may have swapped the node; never write the secret into a file
    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISFIFO(st.st_mode)) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("{} is no longer a named pipe", path_.string()));
    }

    SigpipeGuard sigpipe;
    size_t offset = 0;
    while (offset < secret.size()) {
        if (canceled(cancel)) {
            return Result<void>::Err(ErrorCode::Canceled, "Canceled while delivering the secret");
        }
        int left = remaining_ms(deadline);
        if (left == 0) {
            return Result<void>::Err(ErrorCode::Timeout,
                fmt::format("Reader on {} stopped draining ({} of {} bytes written)",
                            path_.string(), offset, secret.size()));
        }

        struct pollfd pfd = {fd, POLLOUT, 0};
        int pr = poll(&pfd, 1, std::min(left, CHANNEL_POLL_MS));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(ErrorCode::Filesystem,
                fmt::format("poll on {} failed: {}", path_.string(), std::strerror(errno)));
        }
        if (pr == 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP)) {
            return Result<void>::Err(ErrorCode::NoReader,
                fmt::format("Reader closed {} early", path_.string()));
        }

        ssize_t n = ::write(fd, secret.data() + offset, secret.size() - offset);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            if (errno == EPIPE) {
                return Result<void>::Err(ErrorCode::NoReader,
                    fmt::format("Reader closed {} early", path_.string()));
            }
            return Result<void>::Err(ErrorCode::Filesystem,
                fmt::format("write to {} failed: {}", path_.string(), std::strerror(errno)));
        }
        offset += static_cast<size_t>(n);
    }

    // Closing the write end is what the reader sees as end-of-stream
    closer.fd = -1;
    if (::close(fd) != 0) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("close {} failed: {}", path_.string(), std::strerror(errno)));
    }

    isojob_log(fmt::format("channel: delivered {} bytes on {}", secret.size(), path_.string()));
    return Result<void>::Ok();
}

Result<void> SecretChannel::close() {
    if (!open_) return Result<void>::Ok();
    open_ = false;

    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot remove channel {}: {}", path_.string(), std::strerror(errno)));
    }
    isojob_log(fmt::format("channel: removed {}", path_.string()));
    return Result<void>::Ok();
}
