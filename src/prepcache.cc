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

#include "prepcache.h"
#include <mutex>

using namespace Jidkit;

PrepCache::PrepCache(std::size_t capacity) : m_capacity(capacity) {}

void PrepCache::put(std::string const &value) {
    std::unique_lock l(m_mutex);
    auto [it, inserted] = m_entries.insert(value);
    if (!inserted) return;
    m_fifo.push_back(it);
    while (m_entries.size() > m_capacity) {
        m_entries.erase(m_fifo.front());
        m_fifo.pop_front();
    }
}

bool PrepCache::contains(std::optional<std::string_view> value) const {
    if (!value) return true;
    std::shared_lock l(m_mutex);
    return m_entries.find(*value) != m_entries.end();
}

std::size_t PrepCache::size() const {
    std::shared_lock l(m_mutex);
    return m_entries.size();
}

void PrepCache::clear() {
    std::unique_lock l(m_mutex);
    m_fifo.clear();
    m_entries.clear();
}
