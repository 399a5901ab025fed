/**
 * POSIX Pipe Input Implementation
 */

#include "input/posix_pipe_input.hpp"

#ifndef _WIN32

#include "input/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace ttyin {
namespace input {

PosixPipeInput::PosixPipeInput()
    : readFd_(-1)
    , writeFd_(-1)
    , writeClosed_(false)
    , activeWriters_(0)
{
    int fds[2];
#ifdef __linux__
    if (pipe2(fds, O_CLOEXEC) < 0) {
#else
    if (pipe(fds) < 0) {
#endif
        throw InputError(std::string("Failed to create pipe: ") + strerror(errno));
    }
    readFd_ = fds[0];
    writeFd_ = fds[1];
    reader_ = std::make_unique<platform::PosixStdinReader>(readFd_);
}

PosixPipeInput::~PosixPipeInput() {
    closeWriteEnd();
    if (readFd_ >= 0) {
        ::close(readFd_);
        readFd_ = -1;
    }
}

void PosixPipeInput::sendBytes(const uint8_t* data, size_t size) {
    if (data == nullptr && size != 0) {
        throw std::invalid_argument("sendBytes: null data with non-zero size");
    }

    int fd;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (writeClosed_) {
            throw DisposedError(typeaheadHash());
        }
        // The write end stays open until the last active sender is done
        ++activeWriters_;
        fd = writeFd_;
    }

    try {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        size_t written = 0;
        while (written < size) {
            ssize_t n = write(fd, data + written, size - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw InputError(std::string("Failed to write to pipe: ") + strerror(errno));
            }
            written += static_cast<size_t>(n);
        }
    } catch (...) {
        releaseWriter();
        throw;
    }
    releaseWriter();

    notifyReady();
}

void PosixPipeInput::releaseWriter() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (--activeWriters_ == 0 && writeClosed_ && writeFd_ >= 0) {
        ::close(writeFd_);
        writeFd_ = -1;
    }
}

bool PosixPipeInput::closed() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return writeClosed_ || reader_->closed();
}

KeyPressList PosixPipeInput::readKeys() {
    if (reader_->closed()) {
        throw DisposedError(typeaheadHash());
    }

    KeyPressList keys = parser_.feed(reader_->read());

    if (reader_->closed()) {
        KeyPressList rest = parser_.flush();
        keys.insert(keys.end(), rest.begin(), rest.end());
    }
    return keys;
}

KeyPressList PosixPipeInput::flushKeys() {
    return parser_.flush();
}

std::string PosixPipeInput::typeaheadHash() const {
    return "PosixPipeInput-" + std::to_string(instanceId()) + "-" + std::to_string(readFd_);
}

void PosixPipeInput::close() {
    if (closeWriteEnd()) {
        notifyReady();
    }
}

bool PosixPipeInput::closeWriteEnd() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (writeClosed_) {
        return false;
    }
    writeClosed_ = true;

    // A sender blocked on a full pipe closes it when its write completes
    if (activeWriters_ == 0) {
        ::close(writeFd_);
        writeFd_ = -1;
    }
    return true;
}

} // namespace input
} // namespace ttyin

#endif // !_WIN32
