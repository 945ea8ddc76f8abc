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

#ifndef JIDKIT_JID_H
#define JIDKIT_JID_H

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/common.h>

#include "normalizer.h"

namespace Jidkit {
    struct skip_prep_t {
        explicit skip_prep_t() = default;
    };

    // Tag selecting the constructors which take components verbatim.
    inline constexpr skip_prep_t skip_prep{};

    /**
     * An XMPP address, [ node "@" ] domain [ "/" resource ].
     *
     * Components are prepped (nodeprep, IDNA and nameprep, resourceprep) on
     * construction, so equal addresses have identical components however they
     * were written. Each component is at most 1023 bytes. Instances never change
     * after construction.
     *
     * Construction from untrusted input throws illegal_address, with the
     * underlying invalid_address, normalization_error or length_exceeded nested
     * inside it.
     */
    class Jid {
        std::optional<std::string> m_local;
        std::string m_domain;
        std::optional<std::string> m_resource;

        std::string m_bare;
        std::string m_full;
    public:
        /**
         * The unprepped components of a textual JID.
         */
        struct Parts {
            std::optional<std::string> local;
            std::string domain;
            std::optional<std::string> resource;
        };

        explicit Jid(std::string_view jid, Normalizer &normalizer = Normalizer::global());

        Jid(std::string_view jid, skip_prep_t);

        Jid(std::optional<std::string> const &local, std::string const &domain,
            std::optional<std::string> const &resource = std::nullopt, Normalizer &normalizer = Normalizer::global());

        Jid(std::optional<std::string> local, std::string domain, std::optional<std::string> resource, skip_prep_t);

        /**
         * Split a textual JID without prepping anything. An '@' after the first
         * '/' is part of the resource, and a trailing '/' gives no resource.
         *
         * Throws invalid_address if the text ends with the node separator.
         */
        static Parts parts(std::string_view jid);

        static Parts parts(std::nullptr_t) {
            return {};
        }

        /**
         * True if both textual JIDs prep to the same address. Throws
         * illegal_address if either is invalid.
         */
        static bool equivalent(std::string_view a, std::string_view b, Normalizer &normalizer = Normalizer::global());

        std::string const &full() const;

        std::string const &bare() const {
            return m_bare;
        }

        // Full form if there's a resource, otherwise the bare form.
        std::string const &str() const {
            return m_full;
        }

        std::string const &domain() const {
            return m_domain;
        }

        Jid bare_jid() const;

        Jid domain_jid() const;

        std::string const &local() const {
            return m_local.value();
        }

        std::optional<std::string> const &local_part() const {
            return m_local;
        }

        std::string const &resource() const;

        std::optional<std::string> const &resource_part() const {
            return m_resource;
        }

        int compare(Jid const &other) const;

        bool operator==(Jid const &other) const;

        std::weak_ordering operator<=>(Jid const &other) const {
            return compare(other) <=> 0;
        }

    private:
        void build();
    };

    std::ostream &operator<<(std::ostream &os, Jid const &jid);
}

template<>
struct std::hash<Jidkit::Jid> {
    std::size_t operator()(Jidkit::Jid const &jid) const noexcept {
        return std::hash<std::string>{}(jid.str());
    }
};

template <>
struct fmt::formatter<Jidkit::Jid> : fmt::formatter<std::string> {
    auto format(const Jidkit::Jid& c, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(c.str(), ctx);
    }
};


#endif
