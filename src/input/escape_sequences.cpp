/**
 * Escape Sequence Table Implementation
 */

#include "input/escape_sequences.hpp"

#include <utility>

namespace ttyin {
namespace input {

namespace {

using Entry = std::pair<const char*, KeySymbol>;

// Input sequences recognised by the parser. Where a key has several
// encodings the first one listed is its canonical form.
const Entry SEQUENCES[] = {
    // Navigation
    {"\x1b[A", KeySymbol::UP},
    {"\x1b[B", KeySymbol::DOWN},
    {"\x1b[C", KeySymbol::RIGHT},
    {"\x1b[D", KeySymbol::LEFT},
    {"\x1b[H", KeySymbol::HOME},
    {"\x1b[F", KeySymbol::END},
    {"\x1b[2~", KeySymbol::INSERT},
    {"\x1b[3~", KeySymbol::DELETE_KEY},
    {"\x1b[5~", KeySymbol::PAGE_UP},
    {"\x1b[6~", KeySymbol::PAGE_DOWN},

    // Home/End variants (rxvt, linux console, application cursor mode)
    {"\x1b[1~", KeySymbol::HOME},
    {"\x1b[4~", KeySymbol::END},
    {"\x1b[7~", KeySymbol::HOME},
    {"\x1b[8~", KeySymbol::END},
    {"\x1bOH", KeySymbol::HOME},
    {"\x1bOF", KeySymbol::END},

    // Application cursor mode arrows
    {"\x1bOA", KeySymbol::UP},
    {"\x1bOB", KeySymbol::DOWN},
    {"\x1bOC", KeySymbol::RIGHT},
    {"\x1bOD", KeySymbol::LEFT},

    // Control + navigation (modifier 5)
    {"\x1b[1;5A", KeySymbol::CONTROL_UP},
    {"\x1b[1;5B", KeySymbol::CONTROL_DOWN},
    {"\x1b[1;5C", KeySymbol::CONTROL_RIGHT},
    {"\x1b[1;5D", KeySymbol::CONTROL_LEFT},
    {"\x1b[1;5H", KeySymbol::CONTROL_HOME},
    {"\x1b[1;5F", KeySymbol::CONTROL_END},
    {"\x1b[2;5~", KeySymbol::CONTROL_INSERT},
    {"\x1b[3;5~", KeySymbol::CONTROL_DELETE},
    {"\x1b[5;5~", KeySymbol::CONTROL_PAGE_UP},
    {"\x1b[6;5~", KeySymbol::CONTROL_PAGE_DOWN},

    // Shift + navigation (modifier 2)
    {"\x1b[1;2A", KeySymbol::SHIFT_UP},
    {"\x1b[1;2B", KeySymbol::SHIFT_DOWN},
    {"\x1b[1;2C", KeySymbol::SHIFT_RIGHT},
    {"\x1b[1;2D", KeySymbol::SHIFT_LEFT},
    {"\x1b[1;2H", KeySymbol::SHIFT_HOME},
    {"\x1b[1;2F", KeySymbol::SHIFT_END},
    {"\x1b[2;2~", KeySymbol::SHIFT_INSERT},
    {"\x1b[3;2~", KeySymbol::SHIFT_DELETE},
    {"\x1b[5;2~", KeySymbol::SHIFT_PAGE_UP},
    {"\x1b[6;2~", KeySymbol::SHIFT_PAGE_DOWN},

    // Control + Shift + navigation (modifier 6)
    {"\x1b[1;6A", KeySymbol::CONTROL_SHIFT_UP},
    {"\x1b[1;6B", KeySymbol::CONTROL_SHIFT_DOWN},
    {"\x1b[1;6C", KeySymbol::CONTROL_SHIFT_RIGHT},
    {"\x1b[1;6D", KeySymbol::CONTROL_SHIFT_LEFT},
    {"\x1b[1;6H", KeySymbol::CONTROL_SHIFT_HOME},
    {"\x1b[1;6F", KeySymbol::CONTROL_SHIFT_END},
    {"\x1b[2;6~", KeySymbol::CONTROL_SHIFT_INSERT},
    {"\x1b[3;6~", KeySymbol::CONTROL_SHIFT_DELETE},
    {"\x1b[5;6~", KeySymbol::CONTROL_SHIFT_PAGE_UP},
    {"\x1b[6;6~", KeySymbol::CONTROL_SHIFT_PAGE_DOWN},

    {"\x1b[Z", KeySymbol::BACK_TAB},

    // F1-F4 (SS3), then the CSI alternates some terminals send
    {"\x1bOP", KeySymbol::F1},
    {"\x1bOQ", KeySymbol::F2},
    {"\x1bOR", KeySymbol::F3},
    {"\x1bOS", KeySymbol::F4},
    {"\x1b[11~", KeySymbol::F1},
    {"\x1b[12~", KeySymbol::F2},
    {"\x1b[13~", KeySymbol::F3},
    {"\x1b[14~", KeySymbol::F4},

    {"\x1b[15~", KeySymbol::F5},
    {"\x1b[17~", KeySymbol::F6},
    {"\x1b[18~", KeySymbol::F7},
    {"\x1b[19~", KeySymbol::F8},
    {"\x1b[20~", KeySymbol::F9},
    {"\x1b[21~", KeySymbol::F10},
    {"\x1b[23~", KeySymbol::F11},
    {"\x1b[24~", KeySymbol::F12},
    {"\x1b[25~", KeySymbol::F13},
    {"\x1b[26~", KeySymbol::F14},
    {"\x1b[28~", KeySymbol::F15},
    {"\x1b[29~", KeySymbol::F16},
    {"\x1b[31~", KeySymbol::F17},
    {"\x1b[32~", KeySymbol::F18},
    {"\x1b[33~", KeySymbol::F19},
    {"\x1b[34~", KeySymbol::F20},

    // Linux console F1-F5
    {"\x1b[[A", KeySymbol::F1},
    {"\x1b[[B", KeySymbol::F2},
    {"\x1b[[C", KeySymbol::F3},
    {"\x1b[[D", KeySymbol::F4},
    {"\x1b[[E", KeySymbol::F5},

    {"\x1b[1;5P", KeySymbol::CONTROL_F1},
    {"\x1b[1;5Q", KeySymbol::CONTROL_F2},
    {"\x1b[1;5R", KeySymbol::CONTROL_F3},
    {"\x1b[1;5S", KeySymbol::CONTROL_F4},
    {"\x1b[15;5~", KeySymbol::CONTROL_F5},
    {"\x1b[17;5~", KeySymbol::CONTROL_F6},
    {"\x1b[18;5~", KeySymbol::CONTROL_F7},
    {"\x1b[19;5~", KeySymbol::CONTROL_F8},
    {"\x1b[20;5~", KeySymbol::CONTROL_F9},
    {"\x1b[21;5~", KeySymbol::CONTROL_F10},
    {"\x1b[23;5~", KeySymbol::CONTROL_F11},
    {"\x1b[24;5~", KeySymbol::CONTROL_F12},

    // Shift+F1..F4 arrive as F13..F16 on xterm
    {"\x1b[1;2P", KeySymbol::F13},
    {"\x1b[1;2Q", KeySymbol::F14},
    {"\x1b[1;2R", KeySymbol::F15},
    {"\x1b[1;2S", KeySymbol::F16},

    // Paste markers; the parser intercepts both before lookup
    {"\x1b[200~", KeySymbol::BRACKETED_PASTE},
    {"\x1b[201~", KeySymbol::BRACKETED_PASTE},
};

// C0 controls; 0x1B is ESC.
const KeySymbol CONTROL_KEYS[32] = {
    KeySymbol::CONTROL_AT,
    KeySymbol::CONTROL_A,
    KeySymbol::CONTROL_B,
    KeySymbol::CONTROL_C,
    KeySymbol::CONTROL_D,
    KeySymbol::CONTROL_E,
    KeySymbol::CONTROL_F,
    KeySymbol::CONTROL_G,
    KeySymbol::CONTROL_H,
    KeySymbol::CONTROL_I,
    KeySymbol::CONTROL_J,
    KeySymbol::CONTROL_K,
    KeySymbol::CONTROL_L,
    KeySymbol::CONTROL_M,
    KeySymbol::CONTROL_N,
    KeySymbol::CONTROL_O,
    KeySymbol::CONTROL_P,
    KeySymbol::CONTROL_Q,
    KeySymbol::CONTROL_R,
    KeySymbol::CONTROL_S,
    KeySymbol::CONTROL_T,
    KeySymbol::CONTROL_U,
    KeySymbol::CONTROL_V,
    KeySymbol::CONTROL_W,
    KeySymbol::CONTROL_X,
    KeySymbol::CONTROL_Y,
    KeySymbol::CONTROL_Z,
    KeySymbol::ESCAPE,
    KeySymbol::CONTROL_BACKSLASH,
    KeySymbol::CONTROL_SQUARE_CLOSE,
    KeySymbol::CONTROL_CIRCUMFLEX,
    KeySymbol::CONTROL_UNDERSCORE,
};

} // anonymous namespace

const EscapeSequenceTable& EscapeSequenceTable::instance() {
    static const EscapeSequenceTable table;
    return table;
}

EscapeSequenceTable::EscapeSequenceTable() {
    for (int c = 0; c < 32; ++c) {
        std::string sequence(1, static_cast<char>(c));
        sequences_.emplace(sequence, CONTROL_KEYS[c]);
        canonical_.emplace(CONTROL_KEYS[c], sequence);
    }

    for (const auto& [sequence, key] : SEQUENCES) {
        sequences_.emplace(sequence, key);
        // emplace keeps the first (canonical) encoding
        canonical_.emplace(key, sequence);
    }

    // Paste markers are handled by the parser; BRACKETED_PASTE data is
    // the pasted text, never a marker.
    canonical_.erase(KeySymbol::BRACKETED_PASTE);

    for (const auto& entry : sequences_) {
        const std::string& sequence = entry.first;
        for (size_t len = 1; len < sequence.size(); ++len) {
            prefixes_.insert(sequence.substr(0, len));
        }
    }

    // Variable-length mouse forms
    prefixes_.insert("\x1b[M");
    prefixes_.insert("\x1b[<");
}

std::optional<KeySymbol> EscapeSequenceTable::lookup(const std::string& sequence) const {
    auto it = sequences_.find(sequence);
    if (it == sequences_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> EscapeSequenceTable::canonicalSequence(KeySymbol key) const {
    auto it = canonical_.find(key);
    if (it == canonical_.end()) {
        return std::nullopt;
    }
    return it->second;
}

KeySymbol EscapeSequenceTable::controlKey(unsigned char c) const {
    if (c < 32) {
        return CONTROL_KEYS[c];
    }
    return KeySymbol::ANY;
}

} // namespace input
} // namespace ttyin
