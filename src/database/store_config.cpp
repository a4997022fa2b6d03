/*
 * @FileName   : store_config.cpp
 * @CreateAt   : 2026/9/19
 * @Description: implement `StoreConfig::FromEndpoint`
 */

#include "database/store_config.hpp"

#include <regex>
#include <stdexcept>

namespace quint {

namespace {

const std::regex SCHEME_PATTERN(R"(^([A-Za-z][A-Za-z0-9+.-]*)://)");

bool startsWith(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

StoreConfig StoreConfig::FromEndpoint(const std::string &endpoint) {
    if (endpoint.empty()) {
        throw std::invalid_argument("empty store endpoint");
    }

    StoreConfig config;
    if (startsWith(endpoint, "postgresql://") || startsWith(endpoint, "postgres://")) {
        config.backend = POSTGRES_BACKEND;
        config.location = endpoint;
        return config;
    }

    config.backend = SQLITE_BACKEND;
    if (endpoint == "sqlite::memory:") {
        config.location = ":memory:";
        return config;
    }
    if (startsWith(endpoint, "sqlite:")) {
        std::string path = endpoint.substr(7);
        // sqlite:///abs/path and sqlite://rel/path
        if (startsWith(path, "//")) {
            path = path.substr(2);
        }
        if (path.empty()) {
            throw std::invalid_argument("sqlite endpoint without a path: " + endpoint);
        }
        config.location = path;
        return config;
    }

    std::smatch match;
    if (std::regex_search(endpoint, match, SCHEME_PATTERN)) {
        throw std::invalid_argument("unsupported store endpoint scheme '" + match.str(1) + "'");
    }
    // legacy form, a bare SQLite path
    config.location = endpoint;
    return config;
}

} // namespace quint
