/**
 * VT100 Input Parser Implementation
 */

#include "input/vt100_parser.hpp"

#include <utility>

namespace ttyin {
namespace input {

namespace {

constexpr std::string_view CSI = "\x1b[";
constexpr std::string_view X10_MOUSE_PREFIX = "\x1b[M";
constexpr std::string_view SGR_MOUSE_PREFIX = "\x1b[<";

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * True if `params` is exactly `groups` runs of digits joined by ';'
 */
bool matchDigitGroups(std::string_view params, int groups) {
    size_t pos = 0;
    for (int g = 0; g < groups; ++g) {
        if (g > 0) {
            if (pos >= params.size() || params[pos] != ';') {
                return false;
            }
            ++pos;
        }
        size_t start = pos;
        while (pos < params.size() && isDigit(params[pos])) {
            ++pos;
        }
        if (pos == start) {
            return false;
        }
    }
    return pos == params.size();
}

// ESC [ < b ; x ; y (M|m)
bool isSgrMouse(std::string_view seq) {
    if (seq.size() < SGR_MOUSE_PREFIX.size() + 6 || !seq.starts_with(SGR_MOUSE_PREFIX)) {
        return false;
    }
    char final = seq.back();
    if (final != 'M' && final != 'm') {
        return false;
    }
    std::string_view params = seq.substr(SGR_MOUSE_PREFIX.size(),
                                         seq.size() - SGR_MOUSE_PREFIX.size() - 1);
    return matchDigitGroups(params, 3);
}

// ESC [ b ; x ; y M
bool isUrxvtMouse(std::string_view seq) {
    if (seq.size() < CSI.size() + 6 || !seq.starts_with(CSI) || seq.back() != 'M') {
        return false;
    }
    return matchDigitGroups(seq.substr(CSI.size(), seq.size() - CSI.size() - 1), 3);
}

// ESC [ row ; col R
bool isCursorPositionReport(std::string_view seq) {
    if (seq.size() < CSI.size() + 4 || !seq.starts_with(CSI) || seq.back() != 'R') {
        return false;
    }
    return matchDigitGroups(seq.substr(CSI.size(), seq.size() - CSI.size() - 1), 2);
}

} // anonymous namespace

// =============================================================================
// Public interface
// =============================================================================

Vt100Parser::Vt100Parser()
    : table_(EscapeSequenceTable::instance())
    , state_(ParserState::GROUND)
    , bufferChars_(0)
    , x10Remaining_(0)
    , inPaste_(false)
{
}

KeyPressList Vt100Parser::feed(std::string_view data) {
    KeyPressList out;
    feedBytes(data, decoder_, out);
    return out;
}

KeyPressList Vt100Parser::flush() {
    KeyPressList out;

    // Pasted text may legitimately pause mid-character; keep it pending
    if (inPaste_) {
        return out;
    }

    flushBuffer(out);
    decoder_.flush([&](std::string_view ch, char32_t cp) {
        emitLiteral(ch, cp, out);
    });
    return out;
}

KeyPressList Vt100Parser::feedAndFlush(std::string_view data) {
    KeyPressList out = feed(data);
    KeyPressList rest = flush();
    out.insert(out.end(),
               std::make_move_iterator(rest.begin()),
               std::make_move_iterator(rest.end()));
    return out;
}

void Vt100Parser::reset() {
    clearBuffer();
    decoder_.reset();
    inPaste_ = false;
    pasteBuffer_.clear();
}

// =============================================================================
// State machine
// =============================================================================

void Vt100Parser::feedBytes(std::string_view data, Utf8Decoder& decoder, KeyPressList& out) {
    auto onChar = [&](std::string_view ch, char32_t cp) {
        processChar(ch, cp, out);
    };

    while (!data.empty()) {
        // X10 payload bytes are 32 + coordinate and need not be valid UTF-8
        if (state_ == ParserState::X10_MOUSE && !inPaste_) {
            processX10Mouse(data.substr(0, 1), out);
            data.remove_prefix(1);
            continue;
        }

        // One byte at a time: a decoded 'M' may switch to X10_MOUSE
        decoder.decode(data.substr(0, 1), onChar);
        data.remove_prefix(1);
    }
}

void Vt100Parser::processChar(std::string_view ch, char32_t cp, KeyPressList& out) {
    if (inPaste_) {
        processPaste(ch, out);
        return;
    }

    if (bufferChars_ >= MAX_BUFFER_CHARS) {
        flushBuffer(out);
    }

    switch (state_) {
        case ParserState::GROUND:
            processGround(ch, cp, out);
            break;
        case ParserState::ESCAPE:
            processEscape(ch, cp, out);
            break;
        case ParserState::CSI_ENTRY:
        case ParserState::CSI_PARAM:
        case ParserState::CSI_INTERMEDIATE:
            processCsi(ch, cp, out);
            break;
        case ParserState::OSC_STRING:
            processOsc(ch, cp);
            break;
        case ParserState::SOS_PM_APC_STRING:
            processSosPmApc(ch, cp);
            break;
        case ParserState::SS3:
            processSs3(ch, out);
            break;
        case ParserState::X10_MOUSE:
            processX10Mouse(ch, out);
            break;
    }
}

void Vt100Parser::processGround(std::string_view ch, char32_t cp, KeyPressList& out) {
    if (cp == static_cast<char32_t>(ESC)) {
        // ESC is both a complete key and a prefix: wait
        append(ch);
        state_ = ParserState::ESCAPE;
        return;
    }
    emitLiteral(ch, cp, out);
}

void Vt100Parser::processEscape(std::string_view ch, char32_t cp, KeyPressList& out) {
    append(ch);

    switch (cp) {
        case '[':
            state_ = ParserState::CSI_ENTRY;
            break;
        case 'O':
            state_ = ParserState::SS3;
            break;
        case ']':
            state_ = ParserState::OSC_STRING;
            break;
        case 'P':
        case 'X':
        case '^':
        case '_':
            state_ = ParserState::SOS_PM_APC_STRING;
            break;
        default:
            resolveBuffer(out);
            break;
    }
}

void Vt100Parser::processSs3(std::string_view ch, KeyPressList& out) {
    append(ch);
    resolveBuffer(out);
}

void Vt100Parser::processCsi(std::string_view ch, char32_t cp, KeyPressList& out) {
    append(ch);

    if (cp >= 0x40 && cp <= 0x7E) {
        if (buffer_ == X10_MOUSE_PREFIX) {
            state_ = ParserState::X10_MOUSE;
            x10Remaining_ = 3;
            return;
        }

        // e.g. ESC [ [ (linux console F-keys) continues after a final byte
        if (table_.isPrefix(buffer_)) {
            state_ = ParserState::CSI_ENTRY;
            return;
        }

        if (dispatchCsi(out)) {
            clearBuffer();
        } else {
            reparseBuffer(out);
        }
        return;
    }

    if (cp >= 0x30 && cp <= 0x3F) {
        if (state_ == ParserState::CSI_INTERMEDIATE) {
            // Parameter after intermediate: malformed
            reparseBuffer(out);
            return;
        }
        state_ = ParserState::CSI_PARAM;
        return;
    }

    if (cp >= 0x20 && cp <= 0x2F) {
        state_ = ParserState::CSI_INTERMEDIATE;
        return;
    }

    // Control character, DEL or non-ASCII inside a sequence
    reparseBuffer(out);
}

void Vt100Parser::processOsc(std::string_view ch, char32_t cp) {
    append(ch);

    // Terminated by BEL or ST (ESC \); content is a terminal reply, dropped
    if (cp == 0x07 || bufferEndsWithStringTerminator()) {
        clearBuffer();
    }
}

void Vt100Parser::processSosPmApc(std::string_view ch, char32_t cp) {
    (void)cp;
    append(ch);

    if (bufferEndsWithStringTerminator()) {
        clearBuffer();
    }
}

void Vt100Parser::processX10Mouse(std::string_view byte, KeyPressList& out) {
    append(byte);

    if (--x10Remaining_ == 0) {
        out.emplace_back(KeySymbol::VT100_MOUSE_EVENT, buffer_);
        clearBuffer();
    }
}

void Vt100Parser::processPaste(std::string_view ch, KeyPressList& out) {
    pasteBuffer_.append(ch);

    std::string_view end(BRACKETED_PASTE_END);
    if (pasteBuffer_.size() >= end.size() &&
        std::string_view(pasteBuffer_).ends_with(end)) {
        pasteBuffer_.resize(pasteBuffer_.size() - end.size());
        out.emplace_back(KeySymbol::BRACKETED_PASTE, std::move(pasteBuffer_));
        pasteBuffer_.clear();
        inPaste_ = false;
    }
}

// =============================================================================
// Sequence resolution
// =============================================================================

void Vt100Parser::resolveBuffer(KeyPressList& out) {
    if (table_.isPrefix(buffer_)) {
        return;
    }

    auto key = table_.lookup(buffer_);
    if (key) {
        emitSequence(*key, out);
        return;
    }

    reparseBuffer(out);
}

bool Vt100Parser::dispatchCsi(KeyPressList& out) {
    if (buffer_ == BRACKETED_PASTE_START) {
        // Re-entrant start markers are impossible here: while pasting,
        // every character goes to the paste buffer verbatim.
        inPaste_ = true;
        pasteBuffer_.clear();
        return true;
    }

    if (buffer_ == BRACKETED_PASTE_END) {
        // End marker without a start: dropped
        return true;
    }

    auto key = table_.lookup(buffer_);
    if (key) {
        out.emplace_back(*key, buffer_);
        return true;
    }

    if (isSgrMouse(buffer_) || isUrxvtMouse(buffer_)) {
        out.emplace_back(KeySymbol::VT100_MOUSE_EVENT, buffer_);
        return true;
    }

    if (isCursorPositionReport(buffer_)) {
        out.emplace_back(KeySymbol::CPR_RESPONSE, buffer_);
        return true;
    }

    return false;
}

void Vt100Parser::reparseBuffer(KeyPressList& out) {
    std::string pending = std::move(buffer_);
    clearBuffer();

    out.emplace_back(KeySymbol::ESCAPE, std::string(1, ESC));

    // The buffer always starts with ESC and holds whole characters
    Utf8Decoder decoder;
    feedBytes(std::string_view(pending).substr(1), decoder, out);
}

void Vt100Parser::flushBuffer(KeyPressList& out) {
    if (buffer_.empty()) {
        clearBuffer();
        return;
    }

    std::string pending = std::move(buffer_);
    clearBuffer();

    std::string_view rest(pending);
    if (rest.front() == ESC) {
        out.emplace_back(KeySymbol::ESCAPE, std::string(1, ESC));
        rest.remove_prefix(1);
    }

    Utf8Decoder decoder;
    decoder.decode(rest, [&](std::string_view ch, char32_t cp) {
        emitLiteral(ch, cp, out);
    });
}

void Vt100Parser::emitLiteral(std::string_view ch, char32_t cp, KeyPressList& out) {
    if (cp < 0x20) {
        out.emplace_back(table_.controlKey(static_cast<unsigned char>(cp)), std::string(ch));
    } else {
        out.emplace_back(KeySymbol::ANY, std::string(ch));
    }
}

void Vt100Parser::emitSequence(KeySymbol key, KeyPressList& out) {
    out.emplace_back(key, std::move(buffer_));
    clearBuffer();
}

// =============================================================================
// Buffer helpers
// =============================================================================

void Vt100Parser::append(std::string_view ch) {
    buffer_.append(ch);
    ++bufferChars_;
}

void Vt100Parser::clearBuffer() {
    buffer_.clear();
    bufferChars_ = 0;
    x10Remaining_ = 0;
    state_ = ParserState::GROUND;
}

bool Vt100Parser::bufferEndsWithStringTerminator() const {
    size_t n = buffer_.size();
    return n >= 2 && buffer_[n - 2] == ESC && buffer_[n - 1] == '\\';
}

} // namespace input
} // namespace ttyin
