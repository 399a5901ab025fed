/**
 * Pipe Input
 *
 * Input sources fed programmatically, for tests and for embedding the key
 * decoder behind something other than a terminal. Any thread may send;
 * one thread reads. Every send wakes the attached callback.
 */

#ifndef TTYIN_PIPE_INPUT_HPP
#define TTYIN_PIPE_INPUT_HPP

#include "input/input_source.hpp"
#include "input/vt100_parser.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace ttyin {
namespace input {

class PipeInputBase : public InputSource {
public:
    /**
     * Queue raw bytes for the parser.
     * @throws std::invalid_argument for a null pointer with non-zero size
     * @throws DisposedError after close()
     */
    virtual void sendBytes(const uint8_t* data, size_t size) = 0;

    /**
     * Queue UTF-8 text
     */
    void sendText(std::string_view text);

    // No terminal behind a pipe
    std::unique_ptr<platform::ModeContext> rawMode() override;
    std::unique_ptr<platform::ModeContext> cookedMode() override;

protected:
    PipeInputBase() = default;
};

/**
 * In-memory pipe: bytes are queued under a mutex and parsed by readKeys()
 */
class PipeInput : public PipeInputBase {
public:
    PipeInput();

    void sendBytes(const uint8_t* data, size_t size) override;

    bool closed() const override;

    /**
     * Parse everything sent so far. After close() the first call drains
     * what is left; later calls throw DisposedError.
     */
    KeyPressList readKeys() override;
    KeyPressList flushKeys() override;

    platform::NativeHandle fileNo() const override;
    std::string typeaheadHash() const override;

    /**
     * Stop accepting data and wake the reader
     */
    void close() override;

private:
    mutable std::mutex mutex_;
    std::string pending_;
    bool closed_;
    bool drained_;

    // Reader side only
    Vt100Parser parser_;
};

} // namespace input
} // namespace ttyin

#endif // TTYIN_PIPE_INPUT_HPP
