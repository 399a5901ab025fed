/**
 * Input Factory
 *
 * Picks the input source for the current platform and stdio setup.
 */

#ifndef TTYIN_INPUT_FACTORY_HPP
#define TTYIN_INPUT_FACTORY_HPP

#include "input/input_source.hpp"
#include "input/pipe_input.hpp"
#include "platform/handle.hpp"

#include <cstddef>
#include <memory>

namespace ttyin {
namespace input {

struct InputOptions {
    // Fall back to stdout/stderr when stdin is redirected but one of them
    // is still a terminal
    bool alwaysPreferTty = false;

    // Idle time after which a buffered partial sequence is flushed
    int escapeTimeoutMs = 50;

    // Bytes per non-blocking read
    size_t readChunkSize = 1024;

    /**
     * Defaults overridden by TTYIN_ALWAYS_PREFER_TTY ("1"/"true") and
     * TTYIN_ESCAPE_TIMEOUT_MS (non-negative integer; invalid values ignored)
     */
    static InputOptions fromEnvironment();
};

/**
 * Terminal-backed source: Vt100Input on POSIX, Win32Input on Windows
 */
std::unique_ptr<InputSource> createInput(const InputOptions& options = InputOptions());

/**
 * Programmatic source: PosixPipeInput on POSIX, PipeInput elsewhere
 */
std::unique_ptr<PipeInputBase> createPipeInput();

/**
 * True if `handle` refers to a terminal / console
 */
bool isTerminal(platform::NativeHandle handle);

} // namespace input
} // namespace ttyin

#endif // TTYIN_INPUT_FACTORY_HPP
