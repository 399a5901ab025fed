/**
 * Pipe Input Implementation
 */

#include "input/pipe_input.hpp"
#include "input/errors.hpp"

#include <stdexcept>
#include <utility>

namespace ttyin {
namespace input {

// =============================================================================
// PipeInputBase
// =============================================================================

void PipeInputBase::sendText(std::string_view text) {
    sendBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::unique_ptr<platform::ModeContext> PipeInputBase::rawMode() {
    return std::make_unique<platform::NullModeContext>();
}

std::unique_ptr<platform::ModeContext> PipeInputBase::cookedMode() {
    return std::make_unique<platform::NullModeContext>();
}

// =============================================================================
// PipeInput
// =============================================================================

PipeInput::PipeInput()
    : closed_(false)
    , drained_(false)
{
}

void PipeInput::sendBytes(const uint8_t* data, size_t size) {
    if (data == nullptr && size != 0) {
        throw std::invalid_argument("sendBytes: null data with non-zero size");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw DisposedError(typeaheadHash());
        }
        pending_.append(reinterpret_cast<const char*>(data), size);
    }

    // Outside the lock: the callback usually calls readKeys()
    notifyReady();
}

bool PipeInput::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

KeyPressList PipeInput::readKeys() {
    std::string data;
    bool endOfStream = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drained_) {
            throw DisposedError(typeaheadHash());
        }
        data.swap(pending_);
        if (closed_) {
            drained_ = true;
            endOfStream = true;
        }
    }

    KeyPressList keys = parser_.feed(data);
    if (endOfStream) {
        KeyPressList rest = parser_.flush();
        keys.insert(keys.end(), rest.begin(), rest.end());
    }
    return keys;
}

KeyPressList PipeInput::flushKeys() {
    return parser_.flush();
}

platform::NativeHandle PipeInput::fileNo() const {
    throw UnsupportedOperation("PipeInput has no file descriptor");
}

std::string PipeInput::typeaheadHash() const {
    return "PipeInput-" + std::to_string(instanceId());
}

void PipeInput::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    notifyReady();
}

} // namespace input
} // namespace ttyin
