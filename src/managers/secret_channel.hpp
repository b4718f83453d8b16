#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/secret.hpp>

namespace fs = std::filesystem;

// A named pipe used once to hand a secret to the job worker. The secret
// crosses only the pipe's kernel buffer and never touches disk. The node
// is unlinked when the channel is closed or destroyed.
class SecretChannel {
public:
    // mkfifo at node_path with the given mode. ChannelExists if anything is
    // already at that path (a stale node is never reused).
    static Result<SecretChannel> create(const fs::path& node_path, unsigned mode = 0600);

    SecretChannel() = default;
    ~SecretChannel();

    SecretChannel(SecretChannel&& other) noexcept;
    SecretChannel& operator=(SecretChannel&& other) noexcept;
    SecretChannel(const SecretChannel&) = delete;
    SecretChannel& operator=(const SecretChannel&) = delete;

    // Wait up to timeout for a reader to open the pipe, write the whole
    // secret, then close the write end so the reader sees EOF.
    //   Timeout   no reader within the deadline, or it stopped draining
    //   NoReader  the node vanished or the reader closed early
    //   Canceled  *cancel became true while waiting
    // Only one write is ever attempted per channel.
    Result<void> write_once(const Secret& secret, std::chrono::milliseconds timeout,
                            const std::atomic<bool>* cancel = nullptr);

    // Unlink the node. Safe to call more than once.
    Result<void> close();

    const fs::path& path() const { return path_; }
    bool is_open() const { return open_; }
    bool written() const { return written_; }

private:
    explicit SecretChannel(fs::path path) : path_(std::move(path)), open_(true) {}

    fs::path path_;
    bool open_ = false;
    bool written_ = false;
};
