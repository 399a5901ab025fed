/**
 * Escape Sequence Table
 *
 * Immutable bidirectional mapping between VT100/xterm input sequences and
 * KeySymbols, plus the set of strings that are proper prefixes of some
 * longer sequence. Built once on first use; read-only afterwards, so
 * concurrent readers need no locking.
 */

#ifndef TTYIN_ESCAPE_SEQUENCES_HPP
#define TTYIN_ESCAPE_SEQUENCES_HPP

#include "input/keys.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ttyin {
namespace input {

inline constexpr char ESC = '\x1b';
inline constexpr const char* BRACKETED_PASTE_START = "\x1b[200~";
inline constexpr const char* BRACKETED_PASTE_END = "\x1b[201~";

class EscapeSequenceTable {
public:
    static const EscapeSequenceTable& instance();

    /**
     * Key for a complete sequence (including single control bytes)
     */
    std::optional<KeySymbol> lookup(const std::string& sequence) const;

    /**
     * Canonical sequence for a key, if it has one
     */
    std::optional<std::string> canonicalSequence(KeySymbol key) const;

    /**
     * True if `sequence` is a proper prefix of a longer known sequence.
     * Hash lookup; runs once per buffered character.
     */
    bool isPrefix(const std::string& sequence) const {
        return prefixes_.count(sequence) != 0;
    }

    /**
     * Key for a C0 control byte (0x00 - 0x1F)
     */
    KeySymbol controlKey(unsigned char c) const;

    size_t size() const { return sequences_.size(); }
    const std::unordered_map<std::string, KeySymbol>& sequences() const { return sequences_; }

    EscapeSequenceTable(const EscapeSequenceTable&) = delete;
    EscapeSequenceTable& operator=(const EscapeSequenceTable&) = delete;

private:
    EscapeSequenceTable();

    std::unordered_map<std::string, KeySymbol> sequences_;
    std::unordered_map<KeySymbol, std::string> canonical_;
    std::unordered_set<std::string> prefixes_;
};

} // namespace input
} // namespace ttyin

#endif // TTYIN_ESCAPE_SEQUENCES_HPP
