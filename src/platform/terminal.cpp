#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>

namespace platform {

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool active = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    // Not a terminal (piped input): nothing to restore later
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;

    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    quiet.c_lflag |= ECHONL;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0) {
        impl_->active = true;
    }
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->active) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        }
        delete impl_;
    }
}

} // namespace platform
