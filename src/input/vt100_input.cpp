/**
 * VT100 Terminal Input Implementation
 */

#include "input/vt100_input.hpp"

#ifndef _WIN32

#include "input/errors.hpp"

namespace ttyin {
namespace input {

Vt100Input::Vt100Input(int fd, size_t chunkSize)
    : fd_(fd)
    , reader_(fd, chunkSize)
    , closed_(false)
{
}

bool Vt100Input::closed() const {
    return closed_ || reader_.closed();
}

KeyPressList Vt100Input::readKeys() {
    if (closed()) {
        throw DisposedError(typeaheadHash());
    }

    std::string data = reader_.read();
    KeyPressList keys = parser_.feed(data);

    if (reader_.closed()) {
        // Nothing more will complete a pending sequence
        KeyPressList rest = parser_.flush();
        keys.insert(keys.end(), rest.begin(), rest.end());
    }

    return keys;
}

KeyPressList Vt100Input::flushKeys() {
    return parser_.flush();
}

std::unique_ptr<platform::ModeContext> Vt100Input::rawMode() {
    return platform::ModeContext::create(fd_, platform::TerminalMode::RAW);
}

std::unique_ptr<platform::ModeContext> Vt100Input::cookedMode() {
    return platform::ModeContext::create(fd_, platform::TerminalMode::COOKED);
}

std::string Vt100Input::typeaheadHash() const {
    return "Vt100Input-" + std::to_string(instanceId()) + "-" + std::to_string(fd_);
}

void Vt100Input::close() {
    closed_ = true;
}

} // namespace input
} // namespace ttyin

#endif // !_WIN32
