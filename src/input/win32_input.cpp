/**
 * Windows Console Input Implementation
 */

#include "input/win32_input.hpp"

#ifdef _WIN32

#include "input/errors.hpp"
#include "input/utf8.hpp"

#include <sstream>
#include <vector>

namespace ttyin {
namespace input {

namespace {

constexpr DWORD MAX_RECORDS = 1024;

/**
 * Navigation key and its modifier variants
 */
struct NavigationKey {
    WORD vk;
    KeySymbol plain;
    KeySymbol control;
    KeySymbol shift;
    KeySymbol controlShift;
};

const NavigationKey NAVIGATION_KEYS[] = {
    {VK_LEFT,   KeySymbol::LEFT,      KeySymbol::CONTROL_LEFT,      KeySymbol::SHIFT_LEFT,      KeySymbol::CONTROL_SHIFT_LEFT},
    {VK_RIGHT,  KeySymbol::RIGHT,     KeySymbol::CONTROL_RIGHT,     KeySymbol::SHIFT_RIGHT,     KeySymbol::CONTROL_SHIFT_RIGHT},
    {VK_UP,     KeySymbol::UP,        KeySymbol::CONTROL_UP,        KeySymbol::SHIFT_UP,        KeySymbol::CONTROL_SHIFT_UP},
    {VK_DOWN,   KeySymbol::DOWN,      KeySymbol::CONTROL_DOWN,      KeySymbol::SHIFT_DOWN,      KeySymbol::CONTROL_SHIFT_DOWN},
    {VK_HOME,   KeySymbol::HOME,      KeySymbol::CONTROL_HOME,      KeySymbol::SHIFT_HOME,      KeySymbol::CONTROL_SHIFT_HOME},
    {VK_END,    KeySymbol::END,       KeySymbol::CONTROL_END,       KeySymbol::SHIFT_END,       KeySymbol::CONTROL_SHIFT_END},
    {VK_INSERT, KeySymbol::INSERT,    KeySymbol::CONTROL_INSERT,    KeySymbol::SHIFT_INSERT,    KeySymbol::CONTROL_SHIFT_INSERT},
    {VK_DELETE, KeySymbol::DELETE_KEY, KeySymbol::CONTROL_DELETE,   KeySymbol::SHIFT_DELETE,    KeySymbol::CONTROL_SHIFT_DELETE},
    {VK_PRIOR,  KeySymbol::PAGE_UP,   KeySymbol::CONTROL_PAGE_UP,   KeySymbol::SHIFT_PAGE_UP,   KeySymbol::CONTROL_SHIFT_PAGE_UP},
    {VK_NEXT,   KeySymbol::PAGE_DOWN, KeySymbol::CONTROL_PAGE_DOWN, KeySymbol::SHIFT_PAGE_DOWN, KeySymbol::CONTROL_SHIFT_PAGE_DOWN},
};

KeySymbol offsetKey(KeySymbol base, int offset) {
    return static_cast<KeySymbol>(static_cast<int>(base) + offset);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Win32Input::Win32Input(HANDLE handle)
    : handle_(handle)
    , vtMode_(false)
    , closed_(false)
    , savedMode_(0)
    , pendingHighSurrogate_(0)
{
    vtMode_ = enableVirtualTerminal();
}

Win32Input::~Win32Input() {
    restoreConsoleMode();
}

bool Win32Input::enableVirtualTerminal() {
    if (handle_ == INVALID_HANDLE_VALUE || !GetConsoleMode(handle_, &savedMode_)) {
        return false;
    }

    // Windows 10+ accepts the flag; older consoles reject it. It stays on
    // until close() so mode contexts taken later inherit it.
    return SetConsoleMode(handle_, savedMode_ | ENABLE_VIRTUAL_TERMINAL_INPUT) != 0;
}

void Win32Input::restoreConsoleMode() {
    if (!vtMode_) {
        return;
    }
    DWORD current;
    if (GetConsoleMode(handle_, &current)) {
        SetConsoleMode(handle_, current & ~(ENABLE_VIRTUAL_TERMINAL_INPUT & ~savedMode_));
    }
    vtMode_ = false;
}

void Win32Input::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    restoreConsoleMode();
}

// =============================================================================
// Reading
// =============================================================================

KeyPressList Win32Input::readKeys() {
    if (closed_) {
        throw DisposedError(typeaheadHash());
    }

    KeyPressList keys;

    DWORD available = 0;
    if (!GetNumberOfConsoleInputEvents(handle_, &available) || available == 0) {
        return keys;
    }

    std::vector<INPUT_RECORD> records(available < MAX_RECORDS ? available : MAX_RECORDS);
    DWORD read = 0;
    if (!ReadConsoleInputW(handle_, records.data(), static_cast<DWORD>(records.size()), &read)) {
        return keys;
    }

    std::string text;
    for (DWORD i = 0; i < read; ++i) {
        const INPUT_RECORD& rec = records[i];

        if (rec.EventType == MOUSE_EVENT && !vtMode_) {
            keys.push_back(convertMouseEvent(rec.Event.MouseEvent));
            continue;
        }

        if (rec.EventType != KEY_EVENT || !rec.Event.KeyEvent.bKeyDown) {
            continue;  // Key-up, focus, resize and menu events
        }

        const KEY_EVENT_RECORD& keyEvent = rec.Event.KeyEvent;
        WORD repeat = keyEvent.wRepeatCount ? keyEvent.wRepeatCount : 1;

        if (vtMode_ && keyEvent.uChar.UnicodeChar != 0) {
            for (WORD r = 0; r < repeat; ++r) {
                appendUtf16(keyEvent.uChar.UnicodeChar, text);
            }
            continue;
        }

        // Legacy records, and keys a VT console still sends without text
        if (!text.empty()) {
            KeyPressList parsed = parser_.feed(text);
            keys.insert(keys.end(), parsed.begin(), parsed.end());
            text.clear();
        }

        auto key = convertKeyEvent(keyEvent);
        if (key) {
            for (WORD r = 0; r < repeat; ++r) {
                keys.push_back(*key);
            }
        }
    }

    if (vtMode_ && !text.empty()) {
        KeyPressList parsed = parser_.feed(text);
        keys.insert(keys.end(), parsed.begin(), parsed.end());
    }

    return keys;
}

KeyPressList Win32Input::flushKeys() {
    return parser_.flush();
}

bool Win32Input::waitForInput(int timeoutMs) {
    DWORD timeout = timeoutMs < 0 ? INFINITE : static_cast<DWORD>(timeoutMs);
    return WaitForSingleObject(handle_, timeout) == WAIT_OBJECT_0;
}

std::unique_ptr<platform::ModeContext> Win32Input::rawMode() {
    return platform::ModeContext::create(handle_, platform::TerminalMode::RAW);
}

std::unique_ptr<platform::ModeContext> Win32Input::cookedMode() {
    return platform::ModeContext::create(handle_, platform::TerminalMode::COOKED);
}

std::string Win32Input::typeaheadHash() const {
    std::ostringstream oss;
    oss << "Win32Input-" << instanceId() << "-" << handle_;
    return oss.str();
}

void Win32Input::appendUtf16(WCHAR ch, std::string& out) {
    if (ch >= 0xD800 && ch <= 0xDBFF) {
        if (pendingHighSurrogate_ != 0) {
            appendUtf8(out, REPLACEMENT_CHARACTER);
        }
        pendingHighSurrogate_ = ch;
        return;
    }

    if (ch >= 0xDC00 && ch <= 0xDFFF) {
        if (pendingHighSurrogate_ == 0) {
            appendUtf8(out, REPLACEMENT_CHARACTER);
            return;
        }
        char32_t cp = 0x10000 + ((static_cast<char32_t>(pendingHighSurrogate_) - 0xD800) << 10) +
                      (static_cast<char32_t>(ch) - 0xDC00);
        pendingHighSurrogate_ = 0;
        appendUtf8(out, cp);
        return;
    }

    if (pendingHighSurrogate_ != 0) {
        appendUtf8(out, REPLACEMENT_CHARACTER);
        pendingHighSurrogate_ = 0;
    }
    appendUtf8(out, static_cast<char32_t>(ch));
}

// =============================================================================
// Legacy key mapping
// =============================================================================

std::optional<KeyPress> Win32Input::convertKeyEvent(const KEY_EVENT_RECORD& keyEvent) {
    WORD vk = keyEvent.wVirtualKeyCode;
    DWORD ctrlState = keyEvent.dwControlKeyState;
    WCHAR ch = keyEvent.uChar.UnicodeChar;

    bool ctrl = (ctrlState & (LEFT_CTRL_PRESSED | RIGHT_CTRL_PRESSED)) != 0;
    bool shift = (ctrlState & SHIFT_PRESSED) != 0;

    for (const auto& nav : NAVIGATION_KEYS) {
        if (nav.vk != vk) {
            continue;
        }
        KeySymbol key = nav.plain;
        if (ctrl && shift) {
            key = nav.controlShift;
        } else if (ctrl) {
            key = nav.control;
        } else if (shift) {
            key = nav.shift;
        }
        return KeyPress(key);
    }

    if (vk >= VK_F1 && vk <= VK_F24) {
        int offset = vk - VK_F1;
        return KeyPress(offsetKey(ctrl ? KeySymbol::CONTROL_F1 : KeySymbol::F1, offset));
    }

    switch (vk) {
        case VK_ESCAPE:
            return KeyPress(shift ? KeySymbol::SHIFT_ESCAPE : KeySymbol::ESCAPE);
        case VK_TAB:
            return KeyPress(shift ? KeySymbol::BACK_TAB : KeySymbol::TAB);
        case VK_RETURN:
            return KeyPress(KeySymbol::ENTER);
        case VK_BACK:
            return KeyPress(KeySymbol::BACKSPACE);
        case VK_SPACE:
            if (ctrl) {
                return KeyPress(KeySymbol::CONTROL_SPACE);
            }
            break;
    }

    // Control+digit has no character of its own
    if (ctrl && vk >= '0' && vk <= '9') {
        int offset = (vk == '0') ? 9 : (vk - '1');
        return KeyPress(offsetKey(shift ? KeySymbol::CONTROL_SHIFT_1 : KeySymbol::CONTROL_1, offset));
    }

    if (ch == 0) {
        return std::nullopt;  // Bare modifier or dead key
    }

    std::string text;
    appendUtf16(ch, text);
    if (text.empty()) {
        return std::nullopt;  // High surrogate, wait for the pair
    }

    unsigned char first = static_cast<unsigned char>(text[0]);
    if (text.size() == 1 && first < 0x20) {
        return KeyPress(EscapeSequenceTable::instance().controlKey(first), text);
    }
    return KeyPress(KeySymbol::ANY, text);
}

KeyPress Win32Input::convertMouseEvent(const MOUSE_EVENT_RECORD& mouseEvent) const {
    // button state ; x ; y ; event flags
    std::ostringstream oss;
    oss << mouseEvent.dwButtonState << ';'
        << mouseEvent.dwMousePosition.X << ';'
        << mouseEvent.dwMousePosition.Y << ';'
        << mouseEvent.dwEventFlags;
    return KeyPress(KeySymbol::WINDOWS_MOUSE_EVENT, oss.str());
}

} // namespace input
} // namespace ttyin

#endif // _WIN32
