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

#include "jidescape.h"
#include <algorithm>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

using namespace Jidkit;

std::string Jidkit::escape_node(std::string_view node) {
    std::string ret;
    ret.reserve(node.size() + 8);
    int32_t const length = static_cast<int32_t>(node.size());
    const char *data = node.data();
    for (int32_t i{0}; i < length;) {
        int32_t const start = i;
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (c < 0) {
            ret.append(data + start, i - start);
            continue;
        }
        auto it = std::find_if(node_escapes.begin(), node_escapes.end(),
                               [c](auto const &e) { return static_cast<UChar32>(e.first) == c; });
        if (it != node_escapes.end()) {
            ret += it->second;
        } else if (u_isWhitespace(c)) {
            ret += "\\20";
        } else {
            ret.append(data + start, i - start);
        }
    }
    return ret;
}

std::string Jidkit::unescape_node(std::string_view node) {
    std::string ret;
    ret.reserve(node.size());
    for (std::size_t i{0}; i != node.size(); ++i) {
        char const c = node[i];
        if (c == '\\' && i + 2 < node.size()) {
            auto seq = node.substr(i, 3);
            bool found = false;
            for (auto const &[ch, escaped] : node_escapes) {
                if (escaped == seq) {
                    ret += ch;
                    found = true;
                    break;
                }
            }
            if (found) {
                i += 2;
                continue;
            }
        }
        ret += c;
    }
    return ret;
}

std::optional<std::string> Jidkit::escape_local_part(std::optional<std::string> const &node) {
    if (!node) return std::nullopt;
    return escape_node(*node);
}

std::optional<std::string> Jidkit::unescape_local_part(std::optional<std::string> const &node) {
    if (!node) return std::nullopt;
    return unescape_node(*node);
}
