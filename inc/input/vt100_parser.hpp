/**
 * VT100 Input Parser
 *
 * Character-class driven state machine converting terminal input text
 * into an ordered sequence of KeyPress values.
 *
 * - feed() never blocks and never fails: malformed input degrades to
 *   literal characters.
 * - A lone ESC stays buffered (it may start a sequence) until more input
 *   or flush() resolves it.
 * - Bracketed paste content is collected verbatim and emitted as a single
 *   BRACKETED_PASTE key.
 * - Mouse reports (X10, SGR, urxvt) are recognised but not decoded.
 *
 * Not thread-safe: one reader drives a parser.
 */

#ifndef TTYIN_VT100_PARSER_HPP
#define TTYIN_VT100_PARSER_HPP

#include "input/escape_sequences.hpp"
#include "input/key_press.hpp"
#include "input/utf8.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ttyin {
namespace input {

enum class ParserState : uint8_t {
    GROUND,             // Initial state; plain text emits immediately
    ESCAPE,             // Saw ESC
    CSI_ENTRY,          // Saw ESC [
    CSI_PARAM,          // Parameter bytes 0x30-0x3F
    CSI_INTERMEDIATE,   // Intermediate bytes 0x20-0x2F
    OSC_STRING,         // ESC ] ... BEL/ST, discarded
    SOS_PM_APC_STRING,  // ESC P/X/^/_ ... ST, discarded
    SS3,                // Saw ESC O, one character follows
    X10_MOUSE           // Saw ESC [ M, three raw bytes follow
};

class Vt100Parser {
public:
    // Characters buffered before an unfinished sequence is forced out
    static constexpr size_t MAX_BUFFER_CHARS = 256;

    Vt100Parser();

    /**
     * Parse `data` (UTF-8) and return the keys it completes
     */
    KeyPressList feed(std::string_view data);

    /**
     * Resolve a buffered partial sequence: a leading ESC becomes ESCAPE,
     * the rest literal characters. Call after an input timeout.
     * An open bracketed paste is left open.
     */
    KeyPressList flush();

    KeyPressList feedAndFlush(std::string_view data);

    /**
     * Drop all buffered state, including an open paste
     */
    void reset();

    ParserState state() const { return state_; }
    bool inBracketedPaste() const { return inPaste_; }
    size_t bufferedChars() const { return bufferChars_; }

private:
    // Decode `data` into processChar(), except X10 mouse payloads which
    // are taken byte by byte
    void feedBytes(std::string_view data, Utf8Decoder& decoder, KeyPressList& out);

    void processChar(std::string_view ch, char32_t cp, KeyPressList& out);

    void processGround(std::string_view ch, char32_t cp, KeyPressList& out);
    void processEscape(std::string_view ch, char32_t cp, KeyPressList& out);
    void processSs3(std::string_view ch, KeyPressList& out);
    void processCsi(std::string_view ch, char32_t cp, KeyPressList& out);
    void processOsc(std::string_view ch, char32_t cp);
    void processSosPmApc(std::string_view ch, char32_t cp);
    void processX10Mouse(std::string_view byte, KeyPressList& out);
    void processPaste(std::string_view ch, KeyPressList& out);

    // Wait while the buffer is a known prefix, emit on exact match,
    // otherwise reparse.
    void resolveBuffer(KeyPressList& out);

    // Final byte of a CSI sequence reached
    bool dispatchCsi(KeyPressList& out);

    // Emit ESCAPE for the leading ESC, run the rest through GROUND
    void reparseBuffer(KeyPressList& out);

    // Emit the buffer as ESCAPE + literal characters
    void flushBuffer(KeyPressList& out);

    void emitLiteral(std::string_view ch, char32_t cp, KeyPressList& out);
    void emitSequence(KeySymbol key, KeyPressList& out);

    void append(std::string_view ch);
    void clearBuffer();
    bool bufferEndsWithStringTerminator() const;

    const EscapeSequenceTable& table_;
    Utf8Decoder decoder_;

    ParserState state_;
    std::string buffer_;
    size_t bufferChars_;
    size_t x10Remaining_;

    bool inPaste_;
    std::string pasteBuffer_;
};

} // namespace input
} // namespace ttyin

#endif // TTYIN_VT100_PARSER_HPP
