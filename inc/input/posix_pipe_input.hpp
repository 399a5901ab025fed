/**
 * POSIX Pipe Input
 *
 * Pipe input backed by a real OS pipe, so it has a file descriptor that
 * can be polled next to a terminal. Reads go through the same
 * non-blocking reader as Vt100Input.
 */

#ifndef TTYIN_POSIX_PIPE_INPUT_HPP
#define TTYIN_POSIX_PIPE_INPUT_HPP

#ifndef _WIN32

#include "input/pipe_input.hpp"
#include "platform/posix_reader.hpp"

#include <memory>

namespace ttyin {
namespace input {

class PosixPipeInput : public PipeInputBase {
public:
    /**
     * @throws InputError if the pipe cannot be created
     */
    PosixPipeInput();
    ~PosixPipeInput() override;

    /**
     * Write to the pipe. Blocks if the pipe buffer is full and nobody reads.
     * A concurrent close() does not wait for a blocked sender.
     */
    void sendBytes(const uint8_t* data, size_t size) override;

    /**
     * True once the write end is closed or end of stream was seen
     */
    bool closed() const override;

    /**
     * After close() reads drain the pipe until end of stream; the read that
     * sees it returns normally, later ones throw DisposedError.
     */
    KeyPressList readKeys() override;
    KeyPressList flushKeys() override;

    platform::NativeHandle fileNo() const override { return readFd_; }
    std::string typeaheadHash() const override;

    /**
     * Close the write end and wake the reader
     */
    void close() override;

private:
    // @return false if it was already closed
    bool closeWriteEnd();
    void releaseWriter();

    int readFd_;
    int writeFd_;
    std::unique_ptr<platform::PosixStdinReader> reader_;
    Vt100Parser parser_;

    // Guards writeFd_, writeClosed_ and activeWriters_
    mutable std::mutex stateMutex_;
    // Serializes writers so one send is never interleaved with another
    std::mutex writeMutex_;
    bool writeClosed_;
    int activeWriters_;
};

} // namespace input
} // namespace ttyin

#endif // !_WIN32

#endif // TTYIN_POSIX_PIPE_INPUT_HPP
