/**
 * Typeahead Store Implementation
 */

#include "input/typeahead.hpp"

#include <deque>
#include <mutex>
#include <unordered_map>

namespace ttyin {
namespace input {

namespace {

struct Store {
    std::mutex mutex;
    std::unordered_map<std::string, std::deque<KeyPress>> queues;
};

Store& globalStore() {
    static Store store;
    return store;
}

} // anonymous namespace

void TypeaheadStore::store(const InputSource& source, const KeyPressList& keys) {
    if (keys.empty()) {
        return;
    }

    std::string hash = source.typeaheadHash();
    Store& s = globalStore();
    std::lock_guard<std::mutex> lock(s.mutex);

    auto& queue = s.queues[hash];
    queue.insert(queue.end(), keys.begin(), keys.end());
}

KeyPressList TypeaheadStore::get(const InputSource& source) {
    std::string hash = source.typeaheadHash();
    Store& s = globalStore();
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.queues.find(hash);
    if (it == s.queues.end()) {
        return KeyPressList();
    }

    KeyPressList keys(it->second.begin(), it->second.end());
    s.queues.erase(it);
    return keys;
}

void TypeaheadStore::clear(const InputSource& source) {
    std::string hash = source.typeaheadHash();
    Store& s = globalStore();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.queues.erase(hash);
}

bool TypeaheadStore::hasTypeahead(const InputSource& source) {
    std::string hash = source.typeaheadHash();
    Store& s = globalStore();
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.queues.find(hash);
    return it != s.queues.end() && !it->second.empty();
}

void TypeaheadStore::clearAll() {
    Store& s = globalStore();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.queues.clear();
}

} // namespace input
} // namespace ttyin
