/**
 * KeyPress - one decoded input event
 *
 * Immutable pair of a KeySymbol and the text that produced it.
 * Constructing from a key alone fills in the canonical data: the key's
 * escape sequence, its control byte, or its name.
 */

#ifndef TTYIN_KEY_PRESS_HPP
#define TTYIN_KEY_PRESS_HPP

#include "input/keys.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ttyin {
namespace input {

class KeyPress {
public:
    explicit KeyPress(KeySymbol key);
    KeyPress(KeySymbol key, std::string data);

    KeySymbol key() const { return key_; }
    const std::string& data() const { return data_; }

    bool operator==(const KeyPress& other) const {
        return key_ == other.key_ && data_ == other.data_;
    }
    bool operator!=(const KeyPress& other) const { return !(*this == other); }

    /**
     * Data used when a KeyPress is built from a bare key
     */
    static std::string defaultData(KeySymbol key);

private:
    KeySymbol key_;
    std::string data_;
};

using KeyPressList = std::vector<KeyPress>;

/**
 * Debug form: KeyPress(up, "\x1b[A") with control bytes escaped
 */
std::ostream& operator<<(std::ostream& os, const KeyPress& kp);

} // namespace input
} // namespace ttyin

#endif // TTYIN_KEY_PRESS_HPP
