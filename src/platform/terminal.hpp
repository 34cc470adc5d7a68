#pragma once

namespace platform {

// True when stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard for terminal echo.
// Constructor saves the current mode and turns echo off.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
