/**
 * Terminal Mode Context
 *
 * Scoped change of the terminal's line discipline. The attributes in effect
 * at construction are captured and restored exactly once, on restore() or
 * destruction, so contexts nest in LIFO order:
 *
 *   auto raw = ModeContext::create(fd, TerminalMode::RAW);
 *   {
 *       auto cooked = ModeContext::create(fd, TerminalMode::COOKED);
 *   }   // back to raw
 *       // back to the original attributes when `raw` goes away
 *
 * POSIX: termios (tcgetattr/tcsetattr)
 * Windows: console input mode (GetConsoleMode/SetConsoleMode)
 *
 * A handle that is not a terminal yields an invalid context whose
 * operations are no-ops.
 */

#ifndef TTYIN_MODE_CONTEXT_HPP
#define TTYIN_MODE_CONTEXT_HPP

#include "platform/handle.hpp"

#include <memory>

#ifndef _WIN32
#include <termios.h>
#endif

namespace ttyin {
namespace platform {

enum class TerminalMode {
    RAW,     // Unbuffered, unechoed, no signal keys
    COOKED   // Line buffered, echoed, signal keys active
};

class ModeContext {
public:
    virtual ~ModeContext() = default;

    ModeContext(const ModeContext&) = delete;
    ModeContext& operator=(const ModeContext&) = delete;

    /**
     * True if the attributes were captured and the mode applied
     */
    virtual bool isValid() const = 0;

    /**
     * Put back the captured attributes. Idempotent.
     */
    virtual void restore() = 0;

    /**
     * Pick the implementation for the current platform
     */
    static std::unique_ptr<ModeContext> create(NativeHandle handle, TerminalMode mode);

protected:
    ModeContext() = default;
};

/**
 * Context for sources without a terminal (pipes, in-memory input)
 */
class NullModeContext : public ModeContext {
public:
    NullModeContext() = default;

    bool isValid() const override { return false; }
    void restore() override {}
};

#ifndef _WIN32

class PosixModeContext : public ModeContext {
public:
    PosixModeContext(int fd, TerminalMode mode);
    ~PosixModeContext() override;

    bool isValid() const override { return valid_; }
    void restore() override;

    /**
     * Apply the raw-mode transformation to `attrs`
     */
    static void makeRaw(struct termios& attrs);

    /**
     * Apply the cooked-mode transformation to `attrs`
     */
    static void makeCooked(struct termios& attrs);

private:
    int fd_;
    struct termios saved_;
    bool valid_;
    bool restored_;
};

#else

class WindowsModeContext : public ModeContext {
public:
    WindowsModeContext(HANDLE handle, TerminalMode mode);
    ~WindowsModeContext() override;

    bool isValid() const override { return valid_; }
    void restore() override;

    static DWORD makeRaw(DWORD mode);
    static DWORD makeCooked(DWORD mode);

private:
    HANDLE handle_;
    DWORD saved_;
    bool valid_;
    bool restored_;
};

#endif

} // namespace platform
} // namespace ttyin

#endif // TTYIN_MODE_CONTEXT_HPP
