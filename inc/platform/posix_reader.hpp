/**
 * Non-blocking POSIX Input Reader
 *
 * Reads whatever bytes are available on a file descriptor without ever
 * blocking: poll() with a zero timeout, then a single read().
 */

#ifndef TTYIN_POSIX_READER_HPP
#define TTYIN_POSIX_READER_HPP

#ifndef _WIN32

#include <cstddef>
#include <string>

namespace ttyin {
namespace platform {

class PosixStdinReader {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 1024;

    explicit PosixStdinReader(int fd, size_t chunkSize = DEFAULT_CHUNK_SIZE);

    /**
     * Read up to the chunk size of available bytes.
     *
     * EINTR is retried, EAGAIN and "nothing ready" give an empty string.
     * End of stream (0 bytes, EIO, POLLHUP with no data) sets closed().
     *
     * @return Bytes read, possibly empty
     */
    std::string read();

    bool closed() const { return closed_; }
    int fd() const { return fd_; }

private:
    int fd_;
    size_t chunkSize_;
    bool closed_;
};

} // namespace platform
} // namespace ttyin

#endif // !_WIN32

#endif // TTYIN_POSIX_READER_HPP
