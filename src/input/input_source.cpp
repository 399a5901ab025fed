/**
 * Input Source Implementation
 */

#include "input/input_source.hpp"
#include "input/errors.hpp"
#include "platform/wait.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

namespace ttyin {
namespace input {

namespace {

std::atomic<uint64_t> nextInstanceId{1};

} // anonymous namespace

// =============================================================================
// CallbackScope
// =============================================================================

CallbackScope::CallbackScope(std::function<void()> undo)
    : undo_(std::move(undo))
{
}

CallbackScope::~CallbackScope() {
    release();
}

CallbackScope::CallbackScope(CallbackScope&& other) noexcept
    : undo_(std::move(other.undo_))
{
    other.undo_ = nullptr;
}

CallbackScope& CallbackScope::operator=(CallbackScope&& other) noexcept {
    if (this != &other) {
        release();
        undo_ = std::move(other.undo_);
        other.undo_ = nullptr;
    }
    return *this;
}

void CallbackScope::release() {
    if (undo_) {
        auto undo = std::move(undo_);
        undo_ = nullptr;
        undo();
    }
}

// =============================================================================
// InputSource
// =============================================================================

InputSource::InputSource()
    : instanceId_(nextInstanceId.fetch_add(1))
    , callbacks_(std::make_shared<CallbackStack>())
{
}

CallbackScope InputSource::attach(ReadyCallback callback) {
    if (!callback) {
        throw std::invalid_argument("attach: callback must not be empty");
    }

    auto entry = std::make_shared<ReadyCallback>(std::move(callback));
    callbacks_->push(entry);

    std::weak_ptr<CallbackStack> stack = callbacks_;
    return CallbackScope([stack, entry]() {
        if (auto live = stack.lock()) {
            live->remove(entry);
        }
    });
}

CallbackScope InputSource::detach() {
    CallbackPtr top;
    {
        std::lock_guard<std::mutex> lock(callbacks_->mutex);
        if (callbacks_->entries.empty()) {
            return CallbackScope();
        }
        top = callbacks_->entries.back();
        callbacks_->entries.pop_back();
    }

    std::weak_ptr<CallbackStack> stack = callbacks_;
    return CallbackScope([stack, top]() {
        if (auto live = stack.lock()) {
            live->push(top);
        }
    });
}

void InputSource::notifyReady() {
    CallbackPtr top;
    {
        std::lock_guard<std::mutex> lock(callbacks_->mutex);
        if (callbacks_->entries.empty()) {
            return;
        }
        top = callbacks_->entries.back();
    }

    // The callback may read from this source or attach another one
    (*top)();
}

bool InputSource::hasCallback() const {
    std::lock_guard<std::mutex> lock(callbacks_->mutex);
    return !callbacks_->entries.empty();
}

void InputSource::CallbackStack::push(const CallbackPtr& callback) {
    std::lock_guard<std::mutex> lock(mutex);
    entries.push_back(callback);
}

void InputSource::CallbackStack::remove(const CallbackPtr& callback) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find(entries.rbegin(), entries.rend(), callback);
    if (it != entries.rend()) {
        entries.erase(std::next(it).base());
    }
}

// =============================================================================
// Readiness dispatch
// =============================================================================

InputSource* dispatchReady(const std::vector<InputSource*>& sources, int timeoutMs) {
    std::vector<platform::NativeHandle> handles;
    std::vector<InputSource*> owners;

    for (InputSource* source : sources) {
        if (source == nullptr) {
            continue;
        }
        try {
            handles.push_back(source->fileNo());
            owners.push_back(source);
        } catch (const UnsupportedOperation&) {
            // In-memory sources notify on send; nothing to wait on
        }
    }

    auto ready = platform::waitForHandles(handles, timeoutMs);
    if (!ready) {
        return nullptr;
    }

    for (size_t i = 0; i < handles.size(); ++i) {
        if (handles[i] == *ready) {
            owners[i]->notifyReady();
            return owners[i];
        }
    }
    return nullptr;
}

} // namespace input
} // namespace ttyin
