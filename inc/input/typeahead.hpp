/**
 * Typeahead Store
 *
 * Keys read past the end of one prompt are stored here and handed to the
 * next reader of the same source. Process-wide, keyed by
 * InputSource::typeaheadHash(). Entries never expire.
 */

#ifndef TTYIN_TYPEAHEAD_HPP
#define TTYIN_TYPEAHEAD_HPP

#include "input/input_source.hpp"

namespace ttyin {
namespace input {

class TypeaheadStore {
public:
    /**
     * Append `keys` to the queue of `source`
     */
    static void store(const InputSource& source, const KeyPressList& keys);

    /**
     * Remove and return everything queued for `source`, oldest first
     */
    static KeyPressList get(const InputSource& source);

    static void clear(const InputSource& source);
    static bool hasTypeahead(const InputSource& source);

    /**
     * Drop the queues of every source
     */
    static void clearAll();

    TypeaheadStore() = delete;
};

} // namespace input
} // namespace ttyin

#endif // TTYIN_TYPEAHEAD_HPP
