/**
 * Streaming UTF-8 Decoder Implementation
 */

#include "input/utf8.hpp"

namespace ttyin {
namespace input {

void appendUtf8(std::string& out, char32_t cp) {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        cp = REPLACEMENT_CHARACTER;
    }

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

int Utf8Decoder::sequenceWidth(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;  // Continuation byte, overlong lead (C0/C1) or > U+10FFFF
}

bool Utf8Decoder::isValidContinuation(unsigned char b) const {
    if ((b & 0xC0) != 0x80) {
        return false;
    }

    // Second byte ranges that exclude overlongs and surrogates
    if (len_ == 1) {
        unsigned char lead = static_cast<unsigned char>(buf_[0]);
        switch (lead) {
            case 0xE0: return b >= 0xA0;
            case 0xED: return b <= 0x9F;
            case 0xF0: return b >= 0x90;
            case 0xF4: return b <= 0x8F;
            default: break;
        }
    }
    return true;
}

char32_t Utf8Decoder::assemble() const {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(buf_);
    switch (len_) {
        case 2:
            return (static_cast<char32_t>(p[0] & 0x1F) << 6) | (p[1] & 0x3F);
        case 3:
            return (static_cast<char32_t>(p[0] & 0x0F) << 12) |
                   (static_cast<char32_t>(p[1] & 0x3F) << 6) | (p[2] & 0x3F);
        case 4:
            return (static_cast<char32_t>(p[0] & 0x07) << 18) |
                   (static_cast<char32_t>(p[1] & 0x3F) << 12) |
                   (static_cast<char32_t>(p[2] & 0x3F) << 6) | (p[3] & 0x3F);
        default:
            return REPLACEMENT_CHARACTER;
    }
}

} // namespace input
} // namespace ttyin
