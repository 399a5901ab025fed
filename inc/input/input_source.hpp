/**
 * Input Source Contract
 *
 * An InputSource owns one OS input handle (or an in-memory stand-in) and
 * turns what arrives on it into KeyPress values.
 *
 * Reading is single-consumer and never blocks: readKeys() performs at most
 * one non-blocking read. Consumers that do not poll can attach() a readiness
 * callback; it is invoked when new input may be available (by the pipe
 * sources directly, or by dispatchReady() for OS handles).
 *
 * Callbacks form a stack: the most recently attached one is active, and
 * the scope returned by attach()/detach() undoes the change when destroyed.
 */

#ifndef TTYIN_INPUT_SOURCE_HPP
#define TTYIN_INPUT_SOURCE_HPP

#include "input/key_press.hpp"
#include "platform/handle.hpp"
#include "platform/mode_context.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ttyin {
namespace input {

using ReadyCallback = std::function<void()>;

/**
 * Move-only guard that runs its undo action once, on destruction or
 * release(). A default-constructed scope does nothing.
 */
class CallbackScope {
public:
    CallbackScope() = default;
    explicit CallbackScope(std::function<void()> undo);
    ~CallbackScope();

    CallbackScope(CallbackScope&& other) noexcept;
    CallbackScope& operator=(CallbackScope&& other) noexcept;

    CallbackScope(const CallbackScope&) = delete;
    CallbackScope& operator=(const CallbackScope&) = delete;

    /**
     * Undo now instead of at destruction
     */
    void release();

    bool active() const { return static_cast<bool>(undo_); }

private:
    std::function<void()> undo_;
};

class InputSource {
public:
    virtual ~InputSource() = default;

    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;

    virtual bool closed() const = 0;

    /**
     * Keys available after at most one non-blocking read.
     * @throws DisposedError once the source is closed and drained
     */
    virtual KeyPressList readKeys() = 0;

    /**
     * Resolve a partially received sequence (call after an input timeout)
     */
    virtual KeyPressList flushKeys() = 0;

    virtual std::unique_ptr<platform::ModeContext> rawMode() = 0;
    virtual std::unique_ptr<platform::ModeContext> cookedMode() = 0;

    /**
     * @throws UnsupportedOperation on sources without an OS handle
     */
    virtual platform::NativeHandle fileNo() const = 0;

    /**
     * Key under which leftover keys of this source are kept in the
     * TypeaheadStore. Unique per source instance.
     */
    virtual std::string typeaheadHash() const = 0;

    /**
     * Idempotent
     */
    virtual void close() = 0;

    /**
     * Push a readiness callback; the returned scope removes it again.
     * @throws std::invalid_argument for an empty callback
     */
    CallbackScope attach(ReadyCallback callback);

    /**
     * Pop the active callback; the returned scope pushes it back.
     * Returns an inactive scope when nothing is attached.
     */
    CallbackScope detach();

    /**
     * Invoke the active callback, if any. Called outside any source lock.
     */
    void notifyReady();

    bool hasCallback() const;

protected:
    InputSource();

    // Process-unique instance number, used in typeahead hashes
    uint64_t instanceId() const { return instanceId_; }

private:
    using CallbackPtr = std::shared_ptr<ReadyCallback>;

    // Shared with outstanding scopes, which may outlive the source
    struct CallbackStack {
        std::mutex mutex;
        std::vector<CallbackPtr> entries;

        void push(const CallbackPtr& callback);
        void remove(const CallbackPtr& callback);
    };

    uint64_t instanceId_;
    std::shared_ptr<CallbackStack> callbacks_;
};

/**
 * Wait up to `timeoutMs` for one of `sources` to have input and call
 * notifyReady() on it.
 *
 * @return The source that became ready, or nullptr on timeout
 */
InputSource* dispatchReady(const std::vector<InputSource*>& sources, int timeoutMs);

} // namespace input
} // namespace ttyin

#endif // TTYIN_INPUT_SOURCE_HPP
