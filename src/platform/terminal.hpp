#pragma once

namespace platform {

// RAII guard that turns terminal echo off on stdin (for secret input).
// Line editing stays on so the user can still erase and press Enter.
// The destructor restores the saved mode. A no-op when stdin is not a tty.
class NoEchoGuard {
public:
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

    bool active() const { return impl_ != nullptr; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
