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

#ifndef JIDKIT_NORMALIZER_H
#define JIDKIT_NORMALIZER_H

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "prepcache.h"
#include "stringprep.h"

namespace Jidkit {
    /**
     * Applies stringprep to JID components, remembering what it produced.
     *
     * Each kind has a PrepCache of prepped values. Stringprep is idempotent, so
     * an input which is already in the cache is its own normal form and is
     * returned without calling the prep function. Anything else is prepped,
     * checked against the 1023 byte ceiling, and then added to the cache.
     *
     * Only the cache bookkeeping is locked; prep calls run unlocked and may
     * proceed concurrently.
     */
    class Normalizer {
    public:
        using prep_function_t = std::function<std::string(PrepKind, std::string_view)>;

        static constexpr std::size_t max_component_bytes = 1023;
        static constexpr std::size_t default_node_capacity = 10000;
        static constexpr std::size_t default_domain_capacity = 500;
        static constexpr std::size_t default_resource_capacity = 10000;

        Normalizer();

        Normalizer(std::size_t node_capacity, std::size_t domain_capacity, std::size_t resource_capacity,
                   std::shared_ptr<spdlog::logger> logger = nullptr, prep_function_t prep_function = nullptr);

        Normalizer(Normalizer const &) = delete;

        Normalizer &operator=(Normalizer const &) = delete;

        /**
         * Prep a component of the given kind. Empty node and resource values are
         * treated as absent. Throws normalization_error or length_exceeded; any
         * other exception from the prep function is nested in a normalization_error.
         */
        std::optional<std::string> prep(PrepKind kind, std::optional<std::string> const &value);

        std::optional<std::string> nodeprep(std::optional<std::string> const &node) {
            return prep(PrepKind::NODEPREP, node);
        }

        std::string nameprep(std::string const &domain);

        std::optional<std::string> resourceprep(std::optional<std::string> const &resource) {
            return prep(PrepKind::RESOURCEPREP, resource);
        }

        PrepCache &cache(PrepKind kind);

        PrepCache const &cache(PrepKind kind) const {
            return const_cast<Normalizer *>(this)->cache(kind);
        }

        /**
         * The logger given at construction or, failing that, whatever is the
         * spdlog default logger at the time of the call.
         */
        std::shared_ptr<spdlog::logger> logger() const;

        /**
         * Process-wide instance with default capacities, created on first use
         * and never destroyed. Used by Jid constructors not given a Normalizer.
         */
        static Normalizer &global();

    private:
        PrepCache m_node_cache;
        PrepCache m_domain_cache;
        PrepCache m_resource_cache;
        prep_function_t m_prep;
        std::shared_ptr<spdlog::logger> m_logger;
    };
}

#endif
