/**
 * KeyPress Implementation
 */

#include "input/key_press.hpp"
#include "input/escape_sequences.hpp"

#include <cstdio>
#include <utility>

namespace ttyin {
namespace input {

KeyPress::KeyPress(KeySymbol key)
    : key_(key)
    , data_(defaultData(key))
{
}

KeyPress::KeyPress(KeySymbol key, std::string data)
    : key_(key)
    , data_(std::move(data))
{
}

std::string KeyPress::defaultData(KeySymbol key) {
    if (key == KeySymbol::ANY) {
        return std::string();
    }

    auto sequence = EscapeSequenceTable::instance().canonicalSequence(key);
    if (sequence) {
        return *sequence;
    }

    // No wire form (F21-F24, Control+digit, special symbols): use the name
    return keyToString(key);
}

std::ostream& operator<<(std::ostream& os, const KeyPress& kp) {
    os << "KeyPress(" << keyToString(kp.key()) << ", \"";
    for (unsigned char c : kp.data()) {
        if (c == ESC) {
            os << "\\x1b";
        } else if (c < 0x20 || c == 0x7F) {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02x", c);
            os << hex;
        } else if (c == '"' || c == '\\') {
            os << '\\' << static_cast<char>(c);
        } else {
            os << static_cast<char>(c);
        }
    }
    return os << "\")";
}

} // namespace input
} // namespace ttyin
