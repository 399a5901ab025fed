/**
 * Windows Console Input
 *
 * Two paths, chosen once at construction:
 * - VT mode (ENABLE_VIRTUAL_TERMINAL_INPUT accepted): the console delivers
 *   escape sequences as characters; they go through the same Vt100Parser
 *   as on POSIX. The flag stays set until close() or destruction. Key
 *   records without a character still take the legacy mapping.
 * - Legacy mode: KEY_EVENT_RECORD virtual key codes and modifier state are
 *   mapped to KeySymbols directly.
 */

#ifndef TTYIN_WIN32_INPUT_HPP
#define TTYIN_WIN32_INPUT_HPP

#ifdef _WIN32

#include "input/input_source.hpp"
#include "input/vt100_parser.hpp"

#include <windows.h>

#include <optional>

namespace ttyin {
namespace input {

class Win32Input : public InputSource {
public:
    explicit Win32Input(HANDLE handle = GetStdHandle(STD_INPUT_HANDLE));
    ~Win32Input() override;

    bool closed() const override { return closed_; }

    KeyPressList readKeys() override;
    KeyPressList flushKeys() override;

    std::unique_ptr<platform::ModeContext> rawMode() override;
    std::unique_ptr<platform::ModeContext> cookedMode() override;

    platform::NativeHandle fileNo() const override { return handle_; }
    std::string typeaheadHash() const override;

    void close() override;

    /**
     * Block up to `timeoutMs` (negative: no limit) for console input
     * @return true if input is pending
     */
    bool waitForInput(int timeoutMs);

    bool usesVirtualTerminal() const { return vtMode_; }

    /**
     * Legacy mapping of one key-down record
     */
    std::optional<KeyPress> convertKeyEvent(const KEY_EVENT_RECORD& keyEvent);

private:
    bool enableVirtualTerminal();
    void restoreConsoleMode();
    void appendUtf16(WCHAR ch, std::string& out);
    KeyPress convertMouseEvent(const MOUSE_EVENT_RECORD& mouseEvent) const;

    HANDLE handle_;
    bool vtMode_;
    bool closed_;
    DWORD savedMode_;
    Vt100Parser parser_;
    WCHAR pendingHighSurrogate_;
};

} // namespace input
} // namespace ttyin

#endif // _WIN32

#endif // TTYIN_WIN32_INPUT_HPP
