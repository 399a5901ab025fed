/**
 * Streaming UTF-8 Decoder
 *
 * Assembles code points from a byte stream that may be split at any
 * position. Malformed input degrades to U+FFFD, one replacement per
 * maximal invalid subsequence.
 */

#ifndef TTYIN_UTF8_HPP
#define TTYIN_UTF8_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace ttyin {
namespace input {

inline constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;
inline constexpr std::string_view REPLACEMENT_UTF8 = "\xEF\xBF\xBD";

/**
 * Append the UTF-8 encoding of `cp` to `out`. Surrogates and values past
 * U+10FFFF are encoded as U+FFFD.
 */
void appendUtf8(std::string& out, char32_t cp);

class Utf8Decoder {
public:
    /**
     * Decode `bytes`, calling onChar(std::string_view text, char32_t cp)
     * once per complete character. Incomplete trailing bytes are kept
     * for the next call.
     */
    template <typename OnChar>
    void decode(std::string_view bytes, OnChar&& onChar) {
        for (size_t i = 0; i < bytes.size();) {
            unsigned char b = static_cast<unsigned char>(bytes[i]);

            if (expected_ == 0) {
                ++i;
                if (b < 0x80) {
                    char c = static_cast<char>(b);
                    onChar(std::string_view(&c, 1), static_cast<char32_t>(b));
                    continue;
                }
                int width = sequenceWidth(b);
                if (width == 0) {
                    onChar(REPLACEMENT_UTF8, REPLACEMENT_CHARACTER);
                    continue;
                }
                buf_[0] = static_cast<char>(b);
                len_ = 1;
                expected_ = width;
                continue;
            }

            if (!isValidContinuation(b)) {
                // Drop the partial character; the byte starts over
                reset();
                onChar(REPLACEMENT_UTF8, REPLACEMENT_CHARACTER);
                continue;
            }

            ++i;
            buf_[len_++] = static_cast<char>(b);
            if (len_ == expected_) {
                char32_t cp = assemble();
                std::string_view text(buf_, static_cast<size_t>(len_));
                reset();
                onChar(text, cp);
            }
        }
    }

    /**
     * Resolve an incomplete trailing character as U+FFFD.
     * @return true if a replacement was emitted
     */
    template <typename OnChar>
    bool flush(OnChar&& onChar) {
        if (len_ == 0) {
            return false;
        }
        reset();
        onChar(REPLACEMENT_UTF8, REPLACEMENT_CHARACTER);
        return true;
    }

    bool pending() const { return len_ != 0; }

    void reset() {
        len_ = 0;
        expected_ = 0;
    }

private:
    static int sequenceWidth(unsigned char lead);
    bool isValidContinuation(unsigned char b) const;
    char32_t assemble() const;

    char buf_[4] = {0, 0, 0, 0};
    int len_ = 0;
    int expected_ = 0;
};

} // namespace input
} // namespace ttyin

#endif // TTYIN_UTF8_HPP
