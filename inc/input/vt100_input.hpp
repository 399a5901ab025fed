/**
 * VT100 Terminal Input (POSIX)
 *
 * Reads a terminal file descriptor without blocking and decodes VT100 /
 * xterm escape sequences into KeyPress values.
 *
 * The descriptor is borrowed: close() stops reading but does not close it.
 */

#ifndef TTYIN_VT100_INPUT_HPP
#define TTYIN_VT100_INPUT_HPP

#ifndef _WIN32

#include "input/input_source.hpp"
#include "input/vt100_parser.hpp"
#include "platform/posix_reader.hpp"

namespace ttyin {
namespace input {

class Vt100Input : public InputSource {
public:
    explicit Vt100Input(int fd,
                        size_t chunkSize = platform::PosixStdinReader::DEFAULT_CHUNK_SIZE);

    bool closed() const override;

    /**
     * The read that hits end of stream still returns its keys, with any
     * partial sequence flushed. Later reads throw DisposedError.
     */
    KeyPressList readKeys() override;
    KeyPressList flushKeys() override;

    std::unique_ptr<platform::ModeContext> rawMode() override;
    std::unique_ptr<platform::ModeContext> cookedMode() override;

    platform::NativeHandle fileNo() const override { return fd_; }
    std::string typeaheadHash() const override;

    void close() override;

private:
    int fd_;
    platform::PosixStdinReader reader_;
    Vt100Parser parser_;
    bool closed_;
};

} // namespace input
} // namespace ttyin

#endif // !_WIN32

#endif // TTYIN_VT100_INPUT_HPP
