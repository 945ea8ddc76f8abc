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

#ifndef JIDKIT_CONFIG__HPP
#define JIDKIT_CONFIG__HPP

#include <cstddef>
#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "spdlog/spdlog.h"
#include "normalizer.h"

namespace Jidkit {
    class Config {
    public:
        explicit Config(std::string const &filename);

        explicit Config(YAML::Node const &root);

        static Config from_string(std::string const &yaml);

        /**
         * Install the root logger (a daily file when a log file is configured,
         * stderr otherwise) as the spdlog default.
         */
        void log_init();

        [[nodiscard]] std::unique_ptr<Normalizer> normalizer() const;

        [[nodiscard]] std::size_t node_cache_capacity() const {
            return m_node_capacity;
        }

        [[nodiscard]] std::size_t domain_cache_capacity() const {
            return m_domain_capacity;
        }

        [[nodiscard]] std::size_t resource_cache_capacity() const {
            return m_resource_capacity;
        }

        [[nodiscard]] std::string const &log_file() const {
            return m_logfile;
        }

        [[nodiscard]] std::string const &log_level() const {
            return m_log_level;
        }

        [[nodiscard]] std::string const &log_flush() const {
            return m_log_flush;
        }

        [[nodiscard]] spdlog::logger &logger() const {
            return *m_logger;
        }

        [[nodiscard]] std::shared_ptr<spdlog::logger> logger(std::string const &name) const;

    private:
        void load(YAML::Node const &root);

        static std::size_t capacity(YAML::Node const &node, std::size_t def);

        std::size_t m_node_capacity = Normalizer::default_node_capacity;
        std::size_t m_domain_capacity = Normalizer::default_domain_capacity;
        std::size_t m_resource_capacity = Normalizer::default_resource_capacity;
        std::string m_logfile;
        std::string m_log_level;
        std::string m_log_flush;
        std::shared_ptr<spdlog::logger> m_root_logger;
        std::shared_ptr<spdlog::logger> m_logger;
    };
}

#endif
