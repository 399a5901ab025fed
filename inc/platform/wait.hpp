/**
 * Readiness Wait
 *
 * Block until one of several native input handles has data.
 */

#ifndef TTYIN_WAIT_HPP
#define TTYIN_WAIT_HPP

#include "platform/handle.hpp"

#include <optional>
#include <vector>

namespace ttyin {
namespace platform {

// WaitForMultipleObjects limit
constexpr size_t MAX_WAIT_HANDLES = 64;

/**
 * Wait for the first ready handle.
 *
 * @param handles Handles to watch, in priority order
 * @param timeoutMs Milliseconds to wait, negative for no limit
 * @return The ready handle, or empty on timeout / empty list
 * @throws std::invalid_argument for more than MAX_WAIT_HANDLES handles (Windows)
 */
std::optional<NativeHandle> waitForHandles(const std::vector<NativeHandle>& handles,
                                           int timeoutMs);

} // namespace platform
} // namespace ttyin

#endif // TTYIN_WAIT_HPP
