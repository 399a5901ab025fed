/**
 * Readiness Wait Implementation
 */

#include "platform/wait.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <cerrno>
#include <poll.h>
#endif

namespace ttyin {
namespace platform {

// =============================================================================
// POSIX Implementation
// =============================================================================

#ifndef _WIN32

std::optional<NativeHandle> waitForHandles(const std::vector<NativeHandle>& handles,
                                           int timeoutMs) {
    if (handles.empty()) {
        return std::nullopt;
    }

    std::vector<struct pollfd> fds(handles.size());
    for (size_t i = 0; i < handles.size(); ++i) {
        fds[i].fd = handles[i];
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }

    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs < 0 ? 0 : timeoutMs);
    int remaining = timeoutMs;

    while (true) {
        int ready = poll(fds.data(), static_cast<nfds_t>(fds.size()), remaining);
        if (ready > 0) {
            break;
        }
        if (ready == 0) {
            return std::nullopt;
        }
        if (errno != EINTR) {
            return std::nullopt;
        }

        // Interrupted: retry with what is left of the budget
        if (timeoutMs >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (left <= 0) {
                return std::nullopt;
            }
            remaining = static_cast<int>(left);
        }
    }

    // Hang-up counts as ready: the next read reports end of stream
    for (size_t i = 0; i < fds.size(); ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            return handles[i];
        }
    }
    return std::nullopt;
}

#endif // !_WIN32

// =============================================================================
// Windows Implementation
// =============================================================================

#ifdef _WIN32

std::optional<NativeHandle> waitForHandles(const std::vector<NativeHandle>& handles,
                                           int timeoutMs) {
    if (handles.empty()) {
        return std::nullopt;
    }
    if (handles.size() > MAX_WAIT_HANDLES) {
        throw std::invalid_argument("waitForHandles: at most " +
                                    std::to_string(MAX_WAIT_HANDLES) + " handles");
    }

    DWORD timeout = timeoutMs < 0 ? INFINITE : static_cast<DWORD>(timeoutMs);
    DWORD result = WaitForMultipleObjects(static_cast<DWORD>(handles.size()),
                                          handles.data(), FALSE, timeout);

    if (result >= WAIT_OBJECT_0 && result < WAIT_OBJECT_0 + handles.size()) {
        return handles[result - WAIT_OBJECT_0];
    }
    return std::nullopt;
}

#endif // _WIN32

} // namespace platform
} // namespace ttyin
