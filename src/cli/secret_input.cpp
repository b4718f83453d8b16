#include "secret_input.hpp"
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string.h>
#include <unistd.h>

Result<Secret> read_secret_fd(int fd, bool line_only) {
    Secret secret;
    char buf[4096];
    int read_errno = 0;

    for (;;) {
        ssize_t n = ::read(fd, buf, line_only ? 1 : sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            read_errno = errno;
            break;
        }
        if (n == 0) break;
        secret.append(buf, static_cast<size_t>(n));
        if (line_only && buf[0] == '\n') break;
    }
    explicit_bzero(buf, sizeof(buf));

    if (read_errno != 0) {
        return Result<Secret>::Err(ErrorCode::Config,
            fmt::format("Cannot read secret: {}", std::strerror(read_errno)));
    }

    secret.strip_newline();
    return Result<Secret>::Ok(std::move(secret));
}

Result<Secret> read_secret_stdin(const std::string& prompt) {
    if (!platform::is_tty(STDIN_FILENO)) {
        return read_secret_fd(STDIN_FILENO, false);
    }

    std::cerr << prompt << std::flush;
    Result<Secret> r = Result<Secret>::Err(ErrorCode::Config, "");
    {
        platform::NoEchoGuard no_echo;
        r = read_secret_fd(STDIN_FILENO, true);
    }
    // The user's Enter was not echoed
    std::cerr << "\n";
    return r;
}
