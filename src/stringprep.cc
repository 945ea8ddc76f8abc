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

#include "stringprep.h"
#include "jidexcept.h"
#include <fmt/format.h>
#include <unicode/usprep.h>
#include <unicode/uidna.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

using namespace Jidkit;

namespace {
    UStringPrepProfile *open_profile(UStringPrepProfileType type) {
        UErrorCode error = U_ZERO_ERROR;
        UStringPrepProfile *p = usprep_openByType(type, &error);
        if (U_FAILURE(error)) {
            throw std::runtime_error(std::string("Cannot open stringprep profile: ") + u_errorName(error));
        }
        return p;
    }

    // Profiles and the IDNA instance are immutable once opened, and live for the process.
    UStringPrepProfile *nodeprep_profile() {
        static UStringPrepProfile *p = open_profile(USPREP_RFC3920_NODEPREP);
        return p;
    }

    UStringPrepProfile *nameprep_profile() {
        static UStringPrepProfile *p = open_profile(USPREP_RFC3491_NAMEPREP);
        return p;
    }

    UStringPrepProfile *resourceprep_profile() {
        static UStringPrepProfile *p = open_profile(USPREP_RFC3920_RESOURCEPREP);
        return p;
    }

    UIDNA *idna() {
        static UIDNA *p = [] {
            UErrorCode error = U_ZERO_ERROR;
            UIDNA *i = uidna_openUTS46(UIDNA_DEFAULT, &error);
            if (U_FAILURE(error)) {
                throw std::runtime_error(std::string("Cannot open IDNA: ") + u_errorName(error));
            }
            return i;
        }();
        return p;
    }

    std::u16string from_utf8(std::string_view input) {
        UErrorCode error = U_ZERO_ERROR;
        int32_t len = 0;
        u_strFromUTF8(nullptr, 0, &len, input.data(), static_cast<int32_t>(input.size()), &error);
        if (U_FAILURE(error) && error != U_BUFFER_OVERFLOW_ERROR) {
            throw normalization_error("Invalid UTF-8 in address component");
        }
        std::u16string ret(static_cast<std::size_t>(len), u'\0');
        error = U_ZERO_ERROR;
        u_strFromUTF8(ret.data(), len, nullptr, input.data(), static_cast<int32_t>(input.size()), &error);
        if (U_FAILURE(error)) {
            throw normalization_error("Invalid UTF-8 in address component");
        }
        return ret;
    }

    std::string to_utf8(std::u16string const &input) {
        UErrorCode error = U_ZERO_ERROR;
        int32_t len = 0;
        u_strToUTF8(nullptr, 0, &len, input.data(), static_cast<int32_t>(input.size()), &error);
        if (U_FAILURE(error) && error != U_BUFFER_OVERFLOW_ERROR) {
            throw normalization_error(std::string("Cannot encode prepped component: ") + u_errorName(error));
        }
        std::string ret(static_cast<std::size_t>(len), '\0');
        error = U_ZERO_ERROR;
        u_strToUTF8(ret.data(), len, nullptr, input.data(), static_cast<int32_t>(input.size()), &error);
        if (U_FAILURE(error)) {
            throw normalization_error(std::string("Cannot encode prepped component: ") + u_errorName(error));
        }
        return ret;
    }

    std::string stringprep(UStringPrepProfile *p, std::string_view input) {
        auto src = from_utf8(input);
        // Case folding can expand (U+00DF becomes "ss"), so allow for growth and retry on overflow.
        std::u16string prepped(2 * src.size() + 1, u'\0');
        UParseError parse_error;
        UErrorCode error = U_ZERO_ERROR;
        int32_t sz = usprep_prepare(p, src.data(), static_cast<int32_t>(src.size()), prepped.data(),
                                    static_cast<int32_t>(prepped.size()), USPREP_DEFAULT, &parse_error, &error);
        if (error == U_BUFFER_OVERFLOW_ERROR) {
            prepped.resize(static_cast<std::size_t>(sz));
            error = U_ZERO_ERROR;
            sz = usprep_prepare(p, src.data(), static_cast<int32_t>(src.size()), prepped.data(),
                                static_cast<int32_t>(prepped.size()), USPREP_DEFAULT, &parse_error, &error);
        }
        if (U_FAILURE(error)) {
            throw normalization_error(
                    fmt::format("Stringprep failed at offset {}: {}", parse_error.offset, u_errorName(error)));
        }
        prepped.resize(static_cast<std::size_t>(sz));
        return to_utf8(prepped);
    }
}

std::string Stringprep::to_ascii(std::string_view input) {
    std::string ret;
    ret.resize(input.size() * 4 + 64);
    UIDNAInfo info = UIDNA_INFO_INITIALIZER;
    UErrorCode error = U_ZERO_ERROR;
    auto sz = uidna_nameToASCII_UTF8(idna(), input.data(), static_cast<int32_t>(input.size()), ret.data(),
                                     static_cast<int32_t>(ret.size()), &info, &error);
    if (error == U_BUFFER_OVERFLOW_ERROR) {
        ret.resize(static_cast<std::size_t>(sz));
        info = UIDNA_INFO_INITIALIZER;
        error = U_ZERO_ERROR;
        sz = uidna_nameToASCII_UTF8(idna(), input.data(), static_cast<int32_t>(input.size()), ret.data(),
                                    static_cast<int32_t>(ret.size()), &info, &error);
    }
    if (U_FAILURE(error)) {
        throw normalization_error(std::string("IDNA ToASCII failed: ") + u_errorName(error));
    }
    // Total length is bounded by the component ceiling, and hyphen placement is an STD3 rule.
    auto const errors = info.errors & ~(UIDNA_ERROR_DOMAIN_NAME_TOO_LONG | UIDNA_ERROR_LEADING_HYPHEN |
                                        UIDNA_ERROR_TRAILING_HYPHEN | UIDNA_ERROR_HYPHEN_3_4);
    if (errors != 0) {
        throw normalization_error(fmt::format("IDNA ToASCII rejected domain (errors {:#x})", errors));
    }
    ret.resize(static_cast<std::size_t>(sz));
    return ret;
}

std::string Stringprep::nodeprep(std::string_view input) {
    return stringprep(nodeprep_profile(), input);
}

std::string Stringprep::nameprep(std::string_view input) {
    return stringprep(nameprep_profile(), to_ascii(input));
}

std::string Stringprep::resourceprep(std::string_view input) {
    return stringprep(resourceprep_profile(), input);
}

std::string Stringprep::prep(PrepKind kind, std::string_view input) {
    switch (kind) {
        case PrepKind::NODEPREP:
            return nodeprep(input);
        case PrepKind::NAMEPREP:
            return nameprep(input);
        case PrepKind::RESOURCEPREP:
            return resourceprep(input);
    }
    throw std::logic_error("Unknown PrepKind");
}
