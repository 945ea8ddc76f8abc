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

#include "normalizer.h"
#include "fmt-enum.h"
#include "jidexcept.h"
#include "spdlog/spdlog.h"
#include <exception>

using namespace Jidkit;

Normalizer::Normalizer()
        : Normalizer(default_node_capacity, default_domain_capacity, default_resource_capacity) {}

Normalizer::Normalizer(std::size_t node_capacity, std::size_t domain_capacity, std::size_t resource_capacity,
                       std::shared_ptr<spdlog::logger> logger, prep_function_t prep_function)
        : m_node_cache(node_capacity), m_domain_cache(domain_capacity), m_resource_cache(resource_capacity),
          m_prep(std::move(prep_function)), m_logger(std::move(logger)) {
    if (!m_prep) {
        m_prep = Stringprep::prep;
    }
}

std::shared_ptr<spdlog::logger> Normalizer::logger() const {
    if (m_logger) return m_logger;
    return spdlog::default_logger();
}

PrepCache &Normalizer::cache(PrepKind kind) {
    switch (kind) {
        case PrepKind::NODEPREP:
            return m_node_cache;
        case PrepKind::NAMEPREP:
            return m_domain_cache;
        case PrepKind::RESOURCEPREP:
            return m_resource_cache;
    }
    throw std::logic_error("Unknown PrepKind");
}

std::optional<std::string> Normalizer::prep(PrepKind kind, std::optional<std::string> const &value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->empty() && kind != PrepKind::NAMEPREP) {
        return std::nullopt;
    }
    auto &prepped_cache = cache(kind);
    if (prepped_cache.contains(value)) {
        return value;
    }
    auto log = logger();
    log->trace("{} cache miss for [{}]", kind, *value);
    std::string prepped;
    try {
        prepped = m_prep(kind, *value);
    } catch (base::jid_exception &e) {
        log->debug("{} rejected [{}]: {}", kind, *value, e.what());
        throw;
    } catch (std::exception &e) {
        log->debug("{} failed for [{}]: {}", kind, *value, e.what());
        std::throw_with_nested(normalization_error(fmt::format("{} failed: {}", kind, e.what())));
    }
    if (prepped.empty() && kind == PrepKind::NAMEPREP) {
        throw normalization_error("Domain cannot be empty");
    }
    if (prepped.size() > max_component_bytes) {
        throw length_exceeded(fmt::format("{} result cannot be larger than {} bytes. Size is {} bytes.", kind,
                                          max_component_bytes, prepped.size()));
    }
    prepped_cache.put(prepped);
    return prepped;
}

std::string Normalizer::nameprep(std::string const &domain) {
    return *prep(PrepKind::NAMEPREP, domain);
}

Normalizer &Normalizer::global() {
    static Normalizer *s_normalizer = new Normalizer();
    return *s_normalizer;
}
