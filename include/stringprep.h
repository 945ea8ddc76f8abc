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

#ifndef JIDKIT_STRINGPREP_H
#define JIDKIT_STRINGPREP_H

#include <string>
#include <string_view>

namespace Jidkit {
    enum class PrepKind {
        NODEPREP,
        NAMEPREP,
        RESOURCEPREP
    };

    namespace Stringprep {
        /**
         * Applies the stringprep profile for a JID component to UTF-8 input:
         * RFC 3920 nodeprep or resourceprep, or for domains IDNA ToASCII
         * (UTS #46) followed by RFC 3491 nameprep.
         *
         * Throws normalization_error if the profile rejects the input.
         */
        std::string prep(PrepKind kind, std::string_view input);

        std::string nodeprep(std::string_view input);

        std::string nameprep(std::string_view input);

        std::string resourceprep(std::string_view input);

        std::string to_ascii(std::string_view input);
    }
}

#endif
