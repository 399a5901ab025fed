/**
 * Key Symbol Names
 */

#include "input/keys.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace ttyin {
namespace input {

namespace {

using KeyName = std::pair<KeySymbol, const char*>;

const KeyName KEY_NAMES[] = {
    {KeySymbol::ESCAPE, "escape"},
    {KeySymbol::SHIFT_ESCAPE, "s-escape"},

    {KeySymbol::CONTROL_AT, "c-@"},
    {KeySymbol::CONTROL_A, "c-a"},
    {KeySymbol::CONTROL_B, "c-b"},
    {KeySymbol::CONTROL_C, "c-c"},
    {KeySymbol::CONTROL_D, "c-d"},
    {KeySymbol::CONTROL_E, "c-e"},
    {KeySymbol::CONTROL_F, "c-f"},
    {KeySymbol::CONTROL_G, "c-g"},
    {KeySymbol::CONTROL_H, "c-h"},
    {KeySymbol::CONTROL_I, "c-i"},
    {KeySymbol::CONTROL_J, "c-j"},
    {KeySymbol::CONTROL_K, "c-k"},
    {KeySymbol::CONTROL_L, "c-l"},
    {KeySymbol::CONTROL_M, "c-m"},
    {KeySymbol::CONTROL_N, "c-n"},
    {KeySymbol::CONTROL_O, "c-o"},
    {KeySymbol::CONTROL_P, "c-p"},
    {KeySymbol::CONTROL_Q, "c-q"},
    {KeySymbol::CONTROL_R, "c-r"},
    {KeySymbol::CONTROL_S, "c-s"},
    {KeySymbol::CONTROL_T, "c-t"},
    {KeySymbol::CONTROL_U, "c-u"},
    {KeySymbol::CONTROL_V, "c-v"},
    {KeySymbol::CONTROL_W, "c-w"},
    {KeySymbol::CONTROL_X, "c-x"},
    {KeySymbol::CONTROL_Y, "c-y"},
    {KeySymbol::CONTROL_Z, "c-z"},
    {KeySymbol::CONTROL_BACKSLASH, "c-\\"},
    {KeySymbol::CONTROL_SQUARE_CLOSE, "c-]"},
    {KeySymbol::CONTROL_CIRCUMFLEX, "c-^"},
    {KeySymbol::CONTROL_UNDERSCORE, "c-_"},

    {KeySymbol::CONTROL_1, "c-1"},
    {KeySymbol::CONTROL_2, "c-2"},
    {KeySymbol::CONTROL_3, "c-3"},
    {KeySymbol::CONTROL_4, "c-4"},
    {KeySymbol::CONTROL_5, "c-5"},
    {KeySymbol::CONTROL_6, "c-6"},
    {KeySymbol::CONTROL_7, "c-7"},
    {KeySymbol::CONTROL_8, "c-8"},
    {KeySymbol::CONTROL_9, "c-9"},
    {KeySymbol::CONTROL_0, "c-0"},

    {KeySymbol::CONTROL_SHIFT_1, "c-s-1"},
    {KeySymbol::CONTROL_SHIFT_2, "c-s-2"},
    {KeySymbol::CONTROL_SHIFT_3, "c-s-3"},
    {KeySymbol::CONTROL_SHIFT_4, "c-s-4"},
    {KeySymbol::CONTROL_SHIFT_5, "c-s-5"},
    {KeySymbol::CONTROL_SHIFT_6, "c-s-6"},
    {KeySymbol::CONTROL_SHIFT_7, "c-s-7"},
    {KeySymbol::CONTROL_SHIFT_8, "c-s-8"},
    {KeySymbol::CONTROL_SHIFT_9, "c-s-9"},
    {KeySymbol::CONTROL_SHIFT_0, "c-s-0"},

    {KeySymbol::LEFT, "left"},
    {KeySymbol::RIGHT, "right"},
    {KeySymbol::UP, "up"},
    {KeySymbol::DOWN, "down"},
    {KeySymbol::HOME, "home"},
    {KeySymbol::END, "end"},
    {KeySymbol::INSERT, "insert"},
    {KeySymbol::DELETE_KEY, "delete"},
    {KeySymbol::PAGE_UP, "pageup"},
    {KeySymbol::PAGE_DOWN, "pagedown"},

    {KeySymbol::CONTROL_LEFT, "c-left"},
    {KeySymbol::CONTROL_RIGHT, "c-right"},
    {KeySymbol::CONTROL_UP, "c-up"},
    {KeySymbol::CONTROL_DOWN, "c-down"},
    {KeySymbol::CONTROL_HOME, "c-home"},
    {KeySymbol::CONTROL_END, "c-end"},
    {KeySymbol::CONTROL_INSERT, "c-insert"},
    {KeySymbol::CONTROL_DELETE, "c-delete"},
    {KeySymbol::CONTROL_PAGE_UP, "c-pageup"},
    {KeySymbol::CONTROL_PAGE_DOWN, "c-pagedown"},

    {KeySymbol::SHIFT_LEFT, "s-left"},
    {KeySymbol::SHIFT_RIGHT, "s-right"},
    {KeySymbol::SHIFT_UP, "s-up"},
    {KeySymbol::SHIFT_DOWN, "s-down"},
    {KeySymbol::SHIFT_HOME, "s-home"},
    {KeySymbol::SHIFT_END, "s-end"},
    {KeySymbol::SHIFT_INSERT, "s-insert"},
    {KeySymbol::SHIFT_DELETE, "s-delete"},
    {KeySymbol::SHIFT_PAGE_UP, "s-pageup"},
    {KeySymbol::SHIFT_PAGE_DOWN, "s-pagedown"},

    {KeySymbol::CONTROL_SHIFT_LEFT, "c-s-left"},
    {KeySymbol::CONTROL_SHIFT_RIGHT, "c-s-right"},
    {KeySymbol::CONTROL_SHIFT_UP, "c-s-up"},
    {KeySymbol::CONTROL_SHIFT_DOWN, "c-s-down"},
    {KeySymbol::CONTROL_SHIFT_HOME, "c-s-home"},
    {KeySymbol::CONTROL_SHIFT_END, "c-s-end"},
    {KeySymbol::CONTROL_SHIFT_INSERT, "c-s-insert"},
    {KeySymbol::CONTROL_SHIFT_DELETE, "c-s-delete"},
    {KeySymbol::CONTROL_SHIFT_PAGE_UP, "c-s-pageup"},
    {KeySymbol::CONTROL_SHIFT_PAGE_DOWN, "c-s-pagedown"},

    {KeySymbol::BACK_TAB, "s-tab"},

    {KeySymbol::F1, "f1"},
    {KeySymbol::F2, "f2"},
    {KeySymbol::F3, "f3"},
    {KeySymbol::F4, "f4"},
    {KeySymbol::F5, "f5"},
    {KeySymbol::F6, "f6"},
    {KeySymbol::F7, "f7"},
    {KeySymbol::F8, "f8"},
    {KeySymbol::F9, "f9"},
    {KeySymbol::F10, "f10"},
    {KeySymbol::F11, "f11"},
    {KeySymbol::F12, "f12"},
    {KeySymbol::F13, "f13"},
    {KeySymbol::F14, "f14"},
    {KeySymbol::F15, "f15"},
    {KeySymbol::F16, "f16"},
    {KeySymbol::F17, "f17"},
    {KeySymbol::F18, "f18"},
    {KeySymbol::F19, "f19"},
    {KeySymbol::F20, "f20"},
    {KeySymbol::F21, "f21"},
    {KeySymbol::F22, "f22"},
    {KeySymbol::F23, "f23"},
    {KeySymbol::F24, "f24"},

    {KeySymbol::CONTROL_F1, "c-f1"},
    {KeySymbol::CONTROL_F2, "c-f2"},
    {KeySymbol::CONTROL_F3, "c-f3"},
    {KeySymbol::CONTROL_F4, "c-f4"},
    {KeySymbol::CONTROL_F5, "c-f5"},
    {KeySymbol::CONTROL_F6, "c-f6"},
    {KeySymbol::CONTROL_F7, "c-f7"},
    {KeySymbol::CONTROL_F8, "c-f8"},
    {KeySymbol::CONTROL_F9, "c-f9"},
    {KeySymbol::CONTROL_F10, "c-f10"},
    {KeySymbol::CONTROL_F11, "c-f11"},
    {KeySymbol::CONTROL_F12, "c-f12"},
    {KeySymbol::CONTROL_F13, "c-f13"},
    {KeySymbol::CONTROL_F14, "c-f14"},
    {KeySymbol::CONTROL_F15, "c-f15"},
    {KeySymbol::CONTROL_F16, "c-f16"},
    {KeySymbol::CONTROL_F17, "c-f17"},
    {KeySymbol::CONTROL_F18, "c-f18"},
    {KeySymbol::CONTROL_F19, "c-f19"},
    {KeySymbol::CONTROL_F20, "c-f20"},
    {KeySymbol::CONTROL_F21, "c-f21"},
    {KeySymbol::CONTROL_F22, "c-f22"},
    {KeySymbol::CONTROL_F23, "c-f23"},
    {KeySymbol::CONTROL_F24, "c-f24"},

    {KeySymbol::ANY, "<any>"},
    {KeySymbol::SCROLL_UP, "<scroll-up>"},
    {KeySymbol::SCROLL_DOWN, "<scroll-down>"},
    {KeySymbol::CPR_RESPONSE, "<cursor-position-response>"},
    {KeySymbol::VT100_MOUSE_EVENT, "<vt100-mouse-event>"},
    {KeySymbol::WINDOWS_MOUSE_EVENT, "<windows-mouse-event>"},
    {KeySymbol::BRACKETED_PASTE, "<bracketed-paste>"},
    {KeySymbol::SIGINT_KEY, "<sigint>"},
    {KeySymbol::IGNORE_KEY, "<ignore>"},
};

const KeyName KEY_ALIASES[] = {
    {KeySymbol::BACKSPACE, "backspace"},
    {KeySymbol::CONTROL_SPACE, "c-space"},
    {KeySymbol::ENTER, "enter"},
    {KeySymbol::TAB, "tab"},
    {KeySymbol::CONTROL_SHIFT_LEFT, "s-c-left"},
    {KeySymbol::CONTROL_SHIFT_RIGHT, "s-c-right"},
    {KeySymbol::CONTROL_SHIFT_HOME, "s-c-home"},
    {KeySymbol::CONTROL_SHIFT_END, "s-c-end"},
};

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

struct NameTables {
    std::array<std::string, KEY_SYMBOL_COUNT> byKey;
    std::unordered_map<std::string, KeySymbol> byName;

    NameTables() {
        for (const auto& [key, name] : KEY_NAMES) {
            byKey[static_cast<size_t>(key)] = name;
            byName.emplace(name, key);
        }
        for (const auto& [key, name] : KEY_ALIASES) {
            byName.emplace(name, key);
        }
    }
};

const NameTables& nameTables() {
    static const NameTables tables;
    return tables;
}

} // anonymous namespace

const std::string& keyToString(KeySymbol key) {
    static const std::string unknown = "<unknown>";

    size_t index = static_cast<size_t>(key);
    if (index >= KEY_SYMBOL_COUNT) {
        return unknown;
    }
    return nameTables().byKey[index];
}

std::optional<KeySymbol> parseKey(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    const auto& byName = nameTables().byName;
    auto it = byName.find(toLower(name));
    if (it == byName.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace input
} // namespace ttyin
