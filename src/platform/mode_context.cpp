/**
 * Terminal Mode Context Implementation
 */

#include "platform/mode_context.hpp"

#ifndef _WIN32
#include <unistd.h>
#endif

namespace ttyin {
namespace platform {

std::unique_ptr<ModeContext> ModeContext::create(NativeHandle handle, TerminalMode mode) {
#ifndef _WIN32
    return std::make_unique<PosixModeContext>(handle, mode);
#else
    return std::make_unique<WindowsModeContext>(handle, mode);
#endif
}

// =============================================================================
// POSIX Implementation
// =============================================================================

#ifndef _WIN32

PosixModeContext::PosixModeContext(int fd, TerminalMode mode)
    : fd_(fd)
    , saved_()
    , valid_(false)
    , restored_(false)
{
    // ENOTTY / EBADF: not a terminal, stay a no-op
    if (tcgetattr(fd_, &saved_) < 0) {
        return;
    }

    struct termios attrs = saved_;
    if (mode == TerminalMode::RAW) {
        makeRaw(attrs);
    } else {
        makeCooked(attrs);
    }

    // TCSANOW: pending typeahead must survive the switch
    if (tcsetattr(fd_, TCSANOW, &attrs) < 0) {
        return;
    }

    valid_ = true;
}

PosixModeContext::~PosixModeContext() {
    restore();
}

void PosixModeContext::makeRaw(struct termios& attrs) {
    attrs.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
    attrs.c_iflag &= ~(ICRNL | INLCR | IGNCR | IXON | BRKINT | ISTRIP | INPCK);

    // Keep OPOST so a plain \n still returns the carriage
    attrs.c_cflag |= CS8;

    attrs.c_cc[VMIN] = 1;
    attrs.c_cc[VTIME] = 0;
}

void PosixModeContext::makeCooked(struct termios& attrs) {
    attrs.c_lflag |= (ECHO | ICANON | ISIG | IEXTEN);
    attrs.c_iflag |= ICRNL;
}

void PosixModeContext::restore() {
    if (!valid_ || restored_) {
        return;
    }
    restored_ = true;
    tcsetattr(fd_, TCSANOW, &saved_);
}

#endif // !_WIN32

// =============================================================================
// Windows Implementation
// =============================================================================

#ifdef _WIN32

WindowsModeContext::WindowsModeContext(HANDLE handle, TerminalMode mode)
    : handle_(handle)
    , saved_(0)
    , valid_(false)
    , restored_(false)
{
    if (handle_ == INVALID_HANDLE_VALUE || !GetConsoleMode(handle_, &saved_)) {
        return;
    }

    DWORD newMode = (mode == TerminalMode::RAW) ? makeRaw(saved_) : makeCooked(saved_);
    if (!SetConsoleMode(handle_, newMode)) {
        return;
    }

    valid_ = true;
}

WindowsModeContext::~WindowsModeContext() {
    restore();
}

DWORD WindowsModeContext::makeRaw(DWORD mode) {
    return mode & ~(ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT | ENABLE_PROCESSED_INPUT);
}

DWORD WindowsModeContext::makeCooked(DWORD mode) {
    return mode | (ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT | ENABLE_PROCESSED_INPUT);
}

void WindowsModeContext::restore() {
    if (!valid_ || restored_) {
        return;
    }
    restored_ = true;
    SetConsoleMode(handle_, saved_);
}

#endif // _WIN32

} // namespace platform
} // namespace ttyin
