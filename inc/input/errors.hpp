/**
 * Input Error Types
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ttyin {
namespace input {

/**
 * Base for failures raised by input sources
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * Operation on an input source after close()
 */
class DisposedError : public InputError {
public:
    explicit DisposedError(const std::string& source)
        : InputError(source + ": input source is closed") {}
};

/**
 * Operation the source cannot provide (e.g. fileNo() on an in-memory pipe)
 */
class UnsupportedOperation : public InputError {
public:
    explicit UnsupportedOperation(const std::string& msg)
        : InputError(msg) {}
};

} // namespace input
} // namespace ttyin
