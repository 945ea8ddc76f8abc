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

#include "jid.h"
#include "jidexcept.h"
#include <exception>

using namespace Jidkit;

namespace {
    std::string literal(std::optional<std::string> const &local, std::string const &domain,
                        std::optional<std::string> const &resource) {
        std::string ret;
        if (local && !local->empty()) {
            ret += *local;
            ret += '@';
        }
        ret += domain;
        if (resource && !resource->empty()) {
            ret += '/';
            ret += *resource;
        }
        return ret;
    }

    std::string_view or_empty(std::optional<std::string> const &part) {
        if (part) return *part;
        return {};
    }
}

Jid::Jid(std::string_view jid, Normalizer &normalizer) {
    try {
        auto p = parts(jid);
        m_local = normalizer.nodeprep(p.local);
        m_domain = normalizer.nameprep(p.domain);
        m_resource = normalizer.resourceprep(p.resource);
    } catch (base::jid_exception &) {
        std::throw_with_nested(illegal_address("Illegal JID: " + std::string(jid)));
    }
    build();
}

Jid::Jid(std::string_view jid, skip_prep_t) {
    try {
        auto p = parts(jid);
        m_local = std::move(p.local);
        m_domain = std::move(p.domain);
        m_resource = std::move(p.resource);
    } catch (base::jid_exception &) {
        std::throw_with_nested(illegal_address("Illegal JID: " + std::string(jid)));
    }
    build();
}

Jid::Jid(std::optional<std::string> const &local, std::string const &domain,
         std::optional<std::string> const &resource, Normalizer &normalizer) {
    try {
        m_local = normalizer.nodeprep(local);
        m_domain = normalizer.nameprep(domain);
        m_resource = normalizer.resourceprep(resource);
    } catch (base::jid_exception &) {
        std::throw_with_nested(illegal_address("Illegal JID: " + literal(local, domain, resource)));
    }
    build();
}

Jid::Jid(std::optional<std::string> local, std::string domain, std::optional<std::string> resource, skip_prep_t)
        : m_local(std::move(local)), m_domain(std::move(domain)), m_resource(std::move(resource)) {
    build();
}

Jid::Parts Jid::parts(std::string_view s) {
    auto constexpr npos = std::string_view::npos;
    std::size_t at_pos{npos};
    std::size_t slash_pos{npos};
    for (std::size_t c{0}; c != s.length(); ++c) {
        switch (s[c]) {
            case '@':
                if (at_pos == npos) {
                    at_pos = c;
                }
                break;
            case '/':
                slash_pos = c;
                goto loop_exit;
        }
    }
    loop_exit:
    if (at_pos != npos && at_pos + 1 == s.length()) {
        throw invalid_address("JID with empty domain not valid");
    }
    Parts ret;
    if (at_pos != npos && at_pos > 0) {
        ret.local.emplace(s.substr(0, at_pos));
    }
    if (slash_pos != npos && slash_pos + 1 < s.length()) {
        ret.resource.emplace(s.substr(slash_pos + 1));
    }
    std::size_t domain_start = (at_pos == npos) ? 0 : at_pos + 1;
    std::size_t domain_end = (slash_pos == npos) ? s.length() : slash_pos;
    ret.domain.assign(s.substr(domain_start, domain_end - domain_start));
    return ret;
}

bool Jid::equivalent(std::string_view a, std::string_view b, Normalizer &normalizer) {
    return Jid(a, normalizer) == Jid(b, normalizer);
}

void Jid::build() {
    if (m_local) {
        m_bare += *m_local;
        m_bare += '@';
    }
    m_bare += m_domain;
    m_full = m_bare;
    if (m_resource) {
        m_full += '/';
        m_full += *m_resource;
    }
}

std::string const &Jid::full() const {
    if (!m_resource) {
        throw no_resource(m_full);
    }
    return m_full;
}

std::string const &Jid::resource() const {
    if (!m_resource) {
        throw no_resource(m_full);
    }
    return *m_resource;
}

Jid Jid::bare_jid() const {
    return Jid(m_local, m_domain, std::nullopt, skip_prep);
}

Jid Jid::domain_jid() const {
    return Jid(std::nullopt, m_domain, std::nullopt, skip_prep);
}

int Jid::compare(Jid const &other) const {
    if (int c = m_domain.compare(other.m_domain); c != 0) {
        return c;
    }
    if (int c = or_empty(m_local).compare(or_empty(other.m_local)); c != 0) {
        return c;
    }
    return or_empty(m_resource).compare(or_empty(other.m_resource));
}

bool Jid::operator==(Jid const &other) const {
    return m_domain == other.m_domain && m_local == other.m_local && m_resource == other.m_resource;
}

std::ostream &Jidkit::operator<<(std::ostream &os, Jid const &jid) {
    return os << jid.str();
}
