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

#include "config.h"
#include "log.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include <stdexcept>

using namespace Jidkit;

namespace {
    spdlog::level::level_enum parse_level(std::string const &name) {
        auto level = spdlog::level::from_str(name);
        // from_str maps anything it doesn't recognise to "off".
        if (level == spdlog::level::off && name != "off") {
            throw std::runtime_error("Unknown log level " + name);
        }
        return level;
    }
}

Config::Config(std::string const &filename) {
    load(YAML::LoadFile(filename));
    m_logger->debug("Config loaded from {}", filename);
}

Config::Config(YAML::Node const &root) {
    load(root);
}

Config Config::from_string(std::string const &yaml) {
    return Config(YAML::Load(yaml));
}

std::size_t Config::capacity(YAML::Node const &node, std::size_t def) {
    if (!node) return def;
    auto value = node.as<long long>();
    if (value < 0) {
        throw std::runtime_error("Cache capacity cannot be negative");
    }
    return static_cast<std::size_t>(value);
}

void Config::load(YAML::Node const &root) {
    m_log_level = "info";
    if (auto globals = root["globals"]; globals) {
        if (auto log = globals["log"]; log) {
            m_logfile = log["file"].as<std::string>(m_logfile);
            m_log_level = log["level"].as<std::string>(m_log_level);
            m_log_flush = log["flush"].as<std::string>(m_log_level);
        }
    }
    if (m_log_flush.empty()) {
        m_log_flush = m_log_level;
    }
    parse_level(m_log_level);
    parse_level(m_log_flush);
    if (auto caches = root["caches"]; caches) {
        m_node_capacity = capacity(caches["node"], m_node_capacity);
        m_domain_capacity = capacity(caches["domain"], m_domain_capacity);
        m_resource_capacity = capacity(caches["resource"], m_resource_capacity);
    }
    m_root_logger = spdlog::default_logger();
    m_logger = logger("config");
}

void Config::log_init() {
    spdlog::drop("global");
    if (!m_logfile.empty()) {
        m_root_logger = spdlog::daily_logger_mt("global", m_logfile);
    } else {
        m_root_logger = spdlog::stderr_logger_mt("global");
    }
    m_root_logger->flush_on(parse_level(m_log_flush));
    m_root_logger->set_level(parse_level(m_log_level));
    spdlog::set_default_logger(m_root_logger);
    m_logger = logger("config");
    m_logger->info("Logging initialised at level {}", m_log_level);
}

std::shared_ptr<spdlog::logger> Config::logger(std::string const &name) const {
    return Log::logger(name);
}

std::unique_ptr<Normalizer> Config::normalizer() const {
    m_logger->debug("Creating normalizer with cache capacities node={} domain={} resource={}",
                    m_node_capacity, m_domain_capacity, m_resource_capacity);
    return std::make_unique<Normalizer>(m_node_capacity, m_domain_capacity, m_resource_capacity, logger("prep"));
}
