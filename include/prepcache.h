/***

Copyright 2013-2016 Dave Cridland
Copyright 2014-2016 Surevine Ltd

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the "Software"), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
of the Software, and to permit persons to whom the Software is furnished to do
so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.

***/

#ifndef JIDKIT_PREPCACHE_H
#define JIDKIT_PREPCACHE_H

#include <cstddef>
#include <deque>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace Jidkit {
    /**
     * Bounded set of strings already known to be in normal form for one
     * component kind.
     *
     * Eviction is first-in first-out: once the set grows past its capacity the
     * oldest inserted entries are dropped, regardless of how recently they were
     * looked up. Re-inserting a present entry does not move it.
     *
     * All members may be called concurrently from any thread.
     */
    class PrepCache {
    public:
        explicit PrepCache(std::size_t capacity);

        PrepCache(PrepCache const &) = delete;

        PrepCache &operator=(PrepCache const &) = delete;

        void put(std::string const &value);

        // Absent components need no prep, so they are always "cached".
        bool contains(std::optional<std::string_view> value) const;

        std::size_t size() const;

        std::size_t capacity() const {
            return m_capacity;
        }

        void clear();

    private:
        using entries_t = std::set<std::string, std::less<>>;

        std::size_t const m_capacity;
        mutable std::shared_mutex m_mutex;
        entries_t m_entries;
        std::deque<entries_t::const_iterator> m_fifo;
    };
}

#endif
