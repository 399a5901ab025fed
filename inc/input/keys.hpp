/**
 * Key Symbols
 *
 * Closed set of logical key identities produced by the input layer.
 * ANY stands for a literal character; its text travels in KeyPress::data().
 */

#ifndef TTYIN_KEYS_HPP
#define TTYIN_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ttyin {
namespace input {

enum class KeySymbol : uint16_t {
    // Escape keys
    ESCAPE,
    SHIFT_ESCAPE,

    // Control characters (0x00 - 0x1F, without ESC)
    CONTROL_AT,
    CONTROL_A,
    CONTROL_B,
    CONTROL_C,
    CONTROL_D,
    CONTROL_E,
    CONTROL_F,
    CONTROL_G,
    CONTROL_H,
    CONTROL_I,
    CONTROL_J,
    CONTROL_K,
    CONTROL_L,
    CONTROL_M,
    CONTROL_N,
    CONTROL_O,
    CONTROL_P,
    CONTROL_Q,
    CONTROL_R,
    CONTROL_S,
    CONTROL_T,
    CONTROL_U,
    CONTROL_V,
    CONTROL_W,
    CONTROL_X,
    CONTROL_Y,
    CONTROL_Z,
    CONTROL_BACKSLASH,
    CONTROL_SQUARE_CLOSE,
    CONTROL_CIRCUMFLEX,
    CONTROL_UNDERSCORE,

    // Control + digits
    CONTROL_1, CONTROL_2, CONTROL_3, CONTROL_4, CONTROL_5,
    CONTROL_6, CONTROL_7, CONTROL_8, CONTROL_9, CONTROL_0,

    // Control + Shift + digits
    CONTROL_SHIFT_1, CONTROL_SHIFT_2, CONTROL_SHIFT_3, CONTROL_SHIFT_4, CONTROL_SHIFT_5,
    CONTROL_SHIFT_6, CONTROL_SHIFT_7, CONTROL_SHIFT_8, CONTROL_SHIFT_9, CONTROL_SHIFT_0,

    // Navigation
    LEFT,
    RIGHT,
    UP,
    DOWN,
    HOME,
    END,
    INSERT,
    DELETE_KEY,         // DELETE and IGNORE collide with <windows.h> macros
    PAGE_UP,
    PAGE_DOWN,

    CONTROL_LEFT,
    CONTROL_RIGHT,
    CONTROL_UP,
    CONTROL_DOWN,
    CONTROL_HOME,
    CONTROL_END,
    CONTROL_INSERT,
    CONTROL_DELETE,
    CONTROL_PAGE_UP,
    CONTROL_PAGE_DOWN,

    SHIFT_LEFT,
    SHIFT_RIGHT,
    SHIFT_UP,
    SHIFT_DOWN,
    SHIFT_HOME,
    SHIFT_END,
    SHIFT_INSERT,
    SHIFT_DELETE,
    SHIFT_PAGE_UP,
    SHIFT_PAGE_DOWN,

    CONTROL_SHIFT_LEFT,
    CONTROL_SHIFT_RIGHT,
    CONTROL_SHIFT_UP,
    CONTROL_SHIFT_DOWN,
    CONTROL_SHIFT_HOME,
    CONTROL_SHIFT_END,
    CONTROL_SHIFT_INSERT,
    CONTROL_SHIFT_DELETE,
    CONTROL_SHIFT_PAGE_UP,
    CONTROL_SHIFT_PAGE_DOWN,

    BACK_TAB,           // Shift+Tab

    // Function keys
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    F13, F14, F15, F16, F17, F18, F19, F20, F21, F22, F23, F24,

    CONTROL_F1, CONTROL_F2, CONTROL_F3, CONTROL_F4, CONTROL_F5, CONTROL_F6,
    CONTROL_F7, CONTROL_F8, CONTROL_F9, CONTROL_F10, CONTROL_F11, CONTROL_F12,
    CONTROL_F13, CONTROL_F14, CONTROL_F15, CONTROL_F16, CONTROL_F17, CONTROL_F18,
    CONTROL_F19, CONTROL_F20, CONTROL_F21, CONTROL_F22, CONTROL_F23, CONTROL_F24,

    // Special symbols
    ANY,                // Literal character
    SCROLL_UP,
    SCROLL_DOWN,
    CPR_RESPONSE,       // Cursor position report: ESC [ row ; col R
    VT100_MOUSE_EVENT,  // Raw mouse sequence, undecoded
    WINDOWS_MOUSE_EVENT,
    BRACKETED_PASTE,
    SIGINT_KEY,
    IGNORE_KEY,

    COUNT,

    // Aliases
    TAB = CONTROL_I,
    ENTER = CONTROL_M,
    BACKSPACE = CONTROL_H,
    CONTROL_SPACE = CONTROL_AT
};

constexpr size_t KEY_SYMBOL_COUNT = static_cast<size_t>(KeySymbol::COUNT);

/**
 * Canonical key name ("c-a", "s-tab", "f5", "<bracketed-paste>", ...)
 */
const std::string& keyToString(KeySymbol key);

/**
 * Resolve a key name, case-insensitively. Accepts the canonical names
 * plus the aliases backspace, c-space, enter, tab, s-c-left, s-c-right,
 * s-c-home and s-c-end.
 *
 * @return std::nullopt for empty or unknown names
 */
std::optional<KeySymbol> parseKey(std::string_view name);

} // namespace input
} // namespace ttyin

#endif // TTYIN_KEYS_HPP
