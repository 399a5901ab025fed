/**
 * Non-blocking POSIX Input Reader Implementation
 */

#include "platform/posix_reader.hpp"

#ifndef _WIN32

#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace ttyin {
namespace platform {

PosixStdinReader::PosixStdinReader(int fd, size_t chunkSize)
    : fd_(fd)
    , chunkSize_(chunkSize == 0 ? DEFAULT_CHUNK_SIZE : chunkSize)
    , closed_(false)
{
}

std::string PosixStdinReader::read() {
    if (closed_) {
        return std::string();
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready;
    do {
        ready = poll(&pfd, 1, 0);
    } while (ready < 0 && errno == EINTR);

    if (ready <= 0) {
        return std::string();
    }

    if (pfd.revents & POLLNVAL) {
        closed_ = true;
        return std::string();
    }

    // POLLHUP alone still falls through: read() drains then reports 0
    std::string data(chunkSize_, '\0');
    ssize_t n;
    do {
        n = ::read(fd_, data.data(), data.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::string();
        }
        // EIO: the controlling terminal went away
        closed_ = true;
        return std::string();
    }

    if (n == 0) {
        closed_ = true;
        return std::string();
    }

    data.resize(static_cast<size_t>(n));
    return data;
}

} // namespace platform
} // namespace ttyin

#endif // !_WIN32
