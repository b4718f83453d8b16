#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>

namespace platform {

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    if (!isatty(STDIN_FILENO)) return;

    struct termios old_term;
    if (tcgetattr(STDIN_FILENO, &old_term) != 0) return;

    struct termios quiet = old_term;
    quiet.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) != 0) return;

    impl_ = new Impl{old_term};
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

} // namespace platform
