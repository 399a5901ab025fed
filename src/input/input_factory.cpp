/**
 * Input Factory Implementation
 */

#include "input/input_factory.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include "input/posix_pipe_input.hpp"
#include "input/vt100_input.hpp"
#include <unistd.h>
#else
#include "input/win32_input.hpp"
#endif

namespace ttyin {
namespace input {

namespace {

bool parseFlag(const char* value) {
    return std::strcmp(value, "1") == 0 || std::strcmp(value, "true") == 0;
}

} // anonymous namespace

InputOptions InputOptions::fromEnvironment() {
    InputOptions options;

    if (const char* preferTty = std::getenv("TTYIN_ALWAYS_PREFER_TTY")) {
        options.alwaysPreferTty = parseFlag(preferTty);
    }

    if (const char* timeout = std::getenv("TTYIN_ESCAPE_TIMEOUT_MS")) {
        try {
            size_t used = 0;
            int ms = std::stoi(timeout, &used);
            if (used == std::strlen(timeout) && ms >= 0) {
                options.escapeTimeoutMs = ms;
            }
        } catch (const std::exception&) {
            // Not a number: keep the default
        }
    }

    return options;
}

// =============================================================================
// POSIX
// =============================================================================

#ifndef _WIN32

bool isTerminal(platform::NativeHandle handle) {
    return isatty(handle) == 1;
}

std::unique_ptr<InputSource> createInput(const InputOptions& options) {
    int fd = STDIN_FILENO;

    if (options.alwaysPreferTty && !isTerminal(fd)) {
        for (int candidate : {STDOUT_FILENO, STDERR_FILENO}) {
            if (isTerminal(candidate)) {
                fd = candidate;
                break;
            }
        }
    }

    return std::make_unique<Vt100Input>(fd, options.readChunkSize);
}

std::unique_ptr<PipeInputBase> createPipeInput() {
    return std::make_unique<PosixPipeInput>();
}

#endif // !_WIN32

// =============================================================================
// Windows
// =============================================================================

#ifdef _WIN32

bool isTerminal(platform::NativeHandle handle) {
    DWORD mode;
    return handle != INVALID_HANDLE_VALUE && GetConsoleMode(handle, &mode) != 0;
}

std::unique_ptr<InputSource> createInput(const InputOptions& options) {
    (void)options;
    return std::make_unique<Win32Input>(GetStdHandle(STD_INPUT_HANDLE));
}

std::unique_ptr<PipeInputBase> createPipeInput() {
    return std::make_unique<PipeInput>();
}

#endif // _WIN32

} // namespace input
} // namespace ttyin
