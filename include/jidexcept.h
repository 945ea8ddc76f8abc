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

#ifndef JIDKIT_EXCEPT_HH
#define JIDKIT_EXCEPT_HH

#include <stdexcept>
#include <string>

namespace Jidkit {
    namespace base {
        class jid_exception : public std::runtime_error {
        private:
            const char *m_condition; // Always used with string constant
        public:
            jid_exception(std::string const &w, const char *condition) : std::runtime_error(w),
                                                                          m_condition(condition) {}

            jid_exception(const char *w, const char *condition) : std::runtime_error(w), m_condition(condition) {}

            const char *condition() const {
                return m_condition;
            }
        };
    }

    // Following macro generates exception classes.
#   define JIDKIT_JID_EXCEPT(clsname, def_text, condition) \
    class clsname : public base::jid_exception {  \
    public:  \
        clsname() : base::jid_exception(def_text, condition) {}  \
        clsname(std::string const & w) : base::jid_exception(w, condition) {}  \
        clsname(const char * w) : base::jid_exception(w, condition) {}  \
    }

    JIDKIT_JID_EXCEPT(invalid_address, "Malformed address", "jid-malformed");
    JIDKIT_JID_EXCEPT(normalization_error, "Address component rejected by stringprep", "jid-malformed");
    JIDKIT_JID_EXCEPT(length_exceeded, "Address component larger than 1023 bytes", "jid-malformed");
    JIDKIT_JID_EXCEPT(illegal_address, "Illegal JID", "jid-malformed");

    class no_resource : public std::logic_error {
    public:
        explicit no_resource(std::string const &jid)
                : std::logic_error("This JID was instantiated without a resource identifier. "
                                   "A full JID representation is not available for: " + jid) {}
    };
}

#endif
