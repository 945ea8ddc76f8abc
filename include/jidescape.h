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

#ifndef JIDKIT_JIDESCAPE_H
#define JIDKIT_JIDESCAPE_H

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Jidkit {
    /**
     * JID Escaping (XEP-0106).
     *
     * Maps characters that nodeprep prohibits to escape sequences, so that a
     * node sourced from somewhere else (an LDAP username of "Joe Smith", say)
     * can be used to build a JID ("joe\20smith@example.com" once prepped).
     *
     * Neither direction is ever applied by the Jid constructors. Callers escape
     * before construction and unescape for display.
     */
    inline constexpr std::array<std::pair<char, std::string_view>, 10> node_escapes{{
            {' ', "\\20"},
            {'"', "\\22"},
            {'&', "\\26"},
            {'\'', "\\27"},
            {'/', "\\2f"},
            {':', "\\3a"},
            {'<', "\\3c"},
            {'>', "\\3e"},
            {'@', "\\40"},
            {'\\', "\\5c"},
    }};

    // Any whitespace code point becomes \20. Ill-formed UTF-8 passes through.
    std::string escape_node(std::string_view node);

    std::string unescape_node(std::string_view node);

    std::optional<std::string> escape_local_part(std::optional<std::string> const &node);

    std::optional<std::string> unescape_local_part(std::optional<std::string> const &node);
}

#endif
