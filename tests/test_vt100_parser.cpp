/**
 * VT100 Parser Test
 *
 * Note: "\x1b" followed by a hex digit would extend the escape, so such
 * literals are split ("\x1b" "a").
 */

#include "input/vt100_parser.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace ttyin::input;

namespace {

bool sameKeys(const KeyPressList& a, const KeyPressList& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            return false;
        }
    }
    return true;
}

void dump(const KeyPressList& keys) {
    for (const auto& k : keys) {
        std::cout << "  " << k << "\n";
    }
}

} // anonymous namespace

void test_plain_text() {
    std::cout << "=== Test: Plain Text ===\n";

    Vt100Parser parser;
    auto keys = parser.feed("ab\x03\r");

    assert(keys.size() == 4);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "a"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "b"));
    assert(keys[2] == KeyPress(KeySymbol::CONTROL_C, "\x03"));
    assert(keys[3] == KeyPress(KeySymbol::ENTER, "\r"));
    assert(parser.state() == ParserState::GROUND);

    std::cout << "✓ Plain text working\n";
}

void test_utf8_characters() {
    std::cout << "\n=== Test: UTF-8 Characters ===\n";

    Vt100Parser parser;

    // é split across two feeds
    assert(parser.feed("\xc3").empty());
    auto keys = parser.feed("\xa9\xe2\x82\xac");
    assert(keys.size() == 2);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "\xc3\xa9"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "\xe2\x82\xac"));

    // Invalid byte degrades to U+FFFD
    keys = parser.feed("\xff");
    assert(keys.size() == 1);
    assert(keys[0].data() == "\xef\xbf\xbd");

    // Truncated character resolved by flush
    assert(parser.feed("\xe2\x82").empty());
    keys = parser.flush();
    assert(keys.size() == 1);
    assert(keys[0].data() == "\xef\xbf\xbd");

    std::cout << "✓ UTF-8 characters working\n";
}

void test_round_trip() {
    std::cout << "\n=== Test: Round Trip ===\n";

    const auto& table = EscapeSequenceTable::instance();
    int checked = 0;

    for (size_t i = 0; i < KEY_SYMBOL_COUNT; ++i) {
        auto key = static_cast<KeySymbol>(i);
        if (!table.canonicalSequence(key)) {
            continue;
        }

        KeyPress expected(key);
        Vt100Parser parser;
        auto keys = parser.feedAndFlush(expected.data());

        if (keys.size() != 1 || keys[0] != expected) {
            std::cerr << "Round trip failed for " << expected << ":\n";
            dump(keys);
        }
        assert(keys.size() == 1);
        assert(keys[0] == expected);
        ++checked;
    }

    std::cout << checked << " keys round-tripped\n";
    std::cout << "✓ Round trip working\n";
}

void test_standalone_escape() {
    std::cout << "\n=== Test: Standalone Escape ===\n";

    Vt100Parser parser;

    // ESC alone could start a sequence: nothing yet
    assert(parser.feed("\x1b").empty());
    assert(parser.state() == ParserState::ESCAPE);

    auto keys = parser.flush();
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::ESCAPE, "\x1b"));
    assert(parser.state() == ParserState::GROUND);

    // A following key completes the sequence instead
    assert(parser.feed("\x1b").empty());
    keys = parser.feed("[A");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::UP, "\x1b[A"));

    std::cout << "✓ Standalone escape working\n";
}

void test_alt_prefix() {
    std::cout << "\n=== Test: Meta Prefix ===\n";

    Vt100Parser parser;
    auto keys = parser.feed("\x1b" "f");

    assert(keys.size() == 2);
    assert(keys[0] == KeyPress(KeySymbol::ESCAPE, "\x1b"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "f"));

    // ESC ESC: the first resolves, the second waits
    keys = parser.feed("\x1b\x1b");
    assert(keys.size() == 1);
    assert(keys[0].key() == KeySymbol::ESCAPE);
    keys = parser.flush();
    assert(keys.size() == 1);
    assert(keys[0].key() == KeySymbol::ESCAPE);

    std::cout << "✓ Meta prefix working\n";
}

void test_flush_idempotence() {
    std::cout << "\n=== Test: Flush Idempotence ===\n";

    Vt100Parser parser;
    assert(parser.flush().empty());

    parser.feed("\x1b[1;5");
    auto first = parser.flush();
    auto second = parser.flush();

    // ESC [ 1 ; 5
    assert(first.size() == 5);
    assert(first[0].key() == KeySymbol::ESCAPE);
    assert(first[1] == KeyPress(KeySymbol::ANY, "["));
    assert(first[4] == KeyPress(KeySymbol::ANY, "5"));
    assert(second.empty());

    std::cout << "✓ Flush idempotence working\n";
}

void test_incremental_equivalence() {
    std::cout << "\n=== Test: Incremental Feed ===\n";

    std::string input =
        "ab\x1b[Ac\x1bOP\xc3\xa9\x1b[1;5D"
        "\x1b[200~pasted\x1b[201~"
        "\x1b[<0;10;20M\x1b[12;40R\x1b" "x";

    Vt100Parser whole;
    KeyPressList expected = whole.feedAndFlush(input);

    Vt100Parser split;
    KeyPressList actual;
    for (char c : input) {
        auto keys = split.feed(std::string(1, c));
        actual.insert(actual.end(), keys.begin(), keys.end());
    }
    auto rest = split.flush();
    actual.insert(actual.end(), rest.begin(), rest.end());

    dump(expected);
    assert(sameKeys(expected, actual));
    assert(expected.size() == 12);

    std::cout << "✓ Incremental feed working\n";
}

void test_buffer_bound() {
    std::cout << "\n=== Test: Buffer Bound ===\n";

    Vt100Parser parser;
    std::string input = "\x1b[" + std::string(300, '1');
    auto keys = parser.feed(input);

    // ESC, '[' and 300 digits, none held back past the cap
    assert(keys.size() == 302);
    assert(keys[0].key() == KeySymbol::ESCAPE);
    assert(keys[1] == KeyPress(KeySymbol::ANY, "["));
    for (size_t i = 2; i < keys.size(); ++i) {
        assert(keys[i] == KeyPress(KeySymbol::ANY, "1"));
    }
    assert(parser.bufferedChars() < Vt100Parser::MAX_BUFFER_CHARS);

    std::cout << "✓ Buffer bound working\n";
}

void test_bracketed_paste() {
    std::cout << "\n=== Test: Bracketed Paste ===\n";

    Vt100Parser parser;
    auto keys = parser.feed("\x1b[200~hello\x1b[Aworld\x1b[201~");

    assert(keys.size() == 1);
    assert(keys[0].key() == KeySymbol::BRACKETED_PASTE);
    assert(keys[0].data() == "hello\x1b[Aworld");

    // Split markers and content
    assert(parser.feed("\x1b[20").empty());
    assert(parser.feed("0~line1\nli").empty());
    assert(parser.inBracketedPaste());
    assert(parser.flush().empty());  // flush leaves the paste open
    keys = parser.feed("ne2\x1b[2");
    assert(keys.empty());
    keys = parser.feed("01~z");
    assert(keys.size() == 2);
    assert(keys[0] == KeyPress(KeySymbol::BRACKETED_PASTE, "line1\nline2"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "z"));

    // A start marker inside a paste is content
    keys = parser.feed("\x1b[200~a\x1b[200~b\x1b[201~");
    assert(keys.size() == 1);
    assert(keys[0].data() == "a\x1b[200~" "b");

    // Lone end marker is dropped
    keys = parser.feed("\x1b[201~q");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "q"));

    // Empty paste
    keys = parser.feed("\x1b[200~\x1b[201~");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::BRACKETED_PASTE, ""));

    std::cout << "✓ Bracketed paste working\n";
}

void test_mouse_events() {
    std::cout << "\n=== Test: Mouse Events ===\n";

    Vt100Parser parser;

    // X10: three raw bytes after ESC [ M
    auto keys = parser.feed("\x1b[M !\"");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[M !\""));

    // X10 payload may itself contain ESC and brackets
    keys = parser.feed("\x1b[M\x1b[A");
    assert(keys.size() == 1);
    assert(keys[0].key() == KeySymbol::VT100_MOUSE_EVENT);

    // Coordinates past 95 encode as bytes >= 0x80 and are not UTF-8
    keys = parser.feedAndFlush("\x1b[M " "\xC3" "\xA0" "ab");
    assert(keys.size() == 3);
    assert(keys[0] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[M " "\xC3" "\xA0"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "a"));
    assert(keys[2] == KeyPress(KeySymbol::ANY, "b"));

    // Same report split across reads
    assert(parser.feed("\x1b[M").empty());
    assert(parser.feed("\xFF").empty());
    keys = parser.feed("\x80" "\xE9" "x");
    assert(keys.size() == 2);
    assert(keys[0] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[M" "\xFF" "\x80" "\xE9"));
    assert(keys[1] == KeyPress(KeySymbol::ANY, "x"));

    // SGR, press and release
    keys = parser.feed("\x1b[<0;10;20M\x1b[<0;10;20m");
    assert(keys.size() == 2);
    assert(keys[0] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[<0;10;20M"));
    assert(keys[1] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[<0;10;20m"));

    // urxvt
    keys = parser.feed("\x1b[32;5;7M");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::VT100_MOUSE_EVENT, "\x1b[32;5;7M"));

    std::cout << "✓ Mouse events working\n";
}

void test_cursor_position_report() {
    std::cout << "\n=== Test: Cursor Position Report ===\n";

    Vt100Parser parser;
    auto keys = parser.feed("\x1b[12;40R");

    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::CPR_RESPONSE, "\x1b[12;40R"));

    std::cout << "✓ Cursor position report working\n";
}

void test_unknown_sequence_reparse() {
    std::cout << "\n=== Test: Unknown Sequences ===\n";

    Vt100Parser parser;

    // Well-formed but unknown CSI: ESC then literal text
    auto keys = parser.feed("\x1b[99~");
    assert(keys.size() == 5);
    assert(keys[0].key() == KeySymbol::ESCAPE);
    assert(keys[1] == KeyPress(KeySymbol::ANY, "["));
    assert(keys[4] == KeyPress(KeySymbol::ANY, "~"));

    // Unknown SS3
    keys = parser.feed("\x1bOx");
    assert(keys.size() == 3);
    assert(keys[0].key() == KeySymbol::ESCAPE);
    assert(keys[1] == KeyPress(KeySymbol::ANY, "O"));
    assert(keys[2] == KeyPress(KeySymbol::ANY, "x"));

    // Control byte interrupts a sequence; the ESC inside restarts one
    keys = parser.feed("\x1b[1\x03\x1b[B");
    assert(keys.size() == 5);
    assert(keys[0].key() == KeySymbol::ESCAPE);
    assert(keys[1] == KeyPress(KeySymbol::ANY, "["));
    assert(keys[2] == KeyPress(KeySymbol::ANY, "1"));
    assert(keys[3].key() == KeySymbol::CONTROL_C);
    assert(keys[4] == KeyPress(KeySymbol::DOWN, "\x1b[B"));

    std::cout << "✓ Unknown sequences working\n";
}

void test_terminal_strings_discarded() {
    std::cout << "\n=== Test: OSC / DCS Strings ===\n";

    Vt100Parser parser;

    auto keys = parser.feed("\x1b]11;rgb:0000/0000/0000\x07k");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "k"));

    keys = parser.feed("\x1bP>|xterm(367)\x1b\\m");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "m"));

    std::cout << "✓ Terminal strings working\n";
}

void test_linux_console_keys() {
    std::cout << "\n=== Test: Linux Console Keys ===\n";

    Vt100Parser parser;
    auto keys = parser.feed("\x1b[[A\x1b[[E");

    assert(keys.size() == 2);
    assert(keys[0].key() == KeySymbol::F1);
    assert(keys[1].key() == KeySymbol::F5);

    std::cout << "✓ Linux console keys working\n";
}

void test_reset() {
    std::cout << "\n=== Test: Reset ===\n";

    Vt100Parser parser;
    parser.feed("\x1b[200~half a paste");
    assert(parser.inBracketedPaste());

    parser.reset();
    assert(!parser.inBracketedPaste());
    assert(parser.state() == ParserState::GROUND);
    assert(parser.flush().empty());

    auto keys = parser.feed("x");
    assert(keys.size() == 1);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "x"));

    std::cout << "✓ Reset working\n";
}

int main() {
    std::cout << "VT100 Parser Test Suite\n";
    std::cout << "=======================\n\n";

    try {
        test_plain_text();
        test_utf8_characters();
        test_round_trip();
        test_standalone_escape();
        test_alt_prefix();
        test_flush_idempotence();
        test_incremental_equivalence();
        test_buffer_bound();
        test_bracketed_paste();
        test_mouse_events();
        test_cursor_position_report();
        test_unknown_sequence_reparse();
        test_terminal_strings_discarded();
        test_linux_console_keys();
        test_reset();

        std::cout << "\n✅ All parser tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
