#include "client_config.hh"
#include "../common/log.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace graphlink {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

int parse_port(const std::string& text, const std::string& entry) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid port in endpoint '" + entry + "'");
    }
    long port = std::strtol(text.c_str(), nullptr, 10);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("port out of range in endpoint '" + entry + "'");
    }
    return static_cast<int>(port);
}

}  // namespace

std::vector<Endpoint> ClientConfig::parse_endpoints(const std::string& endpoints) {
    std::vector<Endpoint> result;
    std::stringstream ss(endpoints);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const std::string entry = trim(item);
        if (entry.empty()) continue;

        const auto colon = entry.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::invalid_argument("endpoint '" + entry + "' is not host:port");
        }
        std::string host = entry.substr(0, colon);
        if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);  // [v6]:port
        }
        result.push_back(Endpoint{host, parse_port(entry.substr(colon + 1), entry)});
    }
    if (result.empty()) {
        throw std::invalid_argument("no endpoints in '" + endpoints + "'");
    }
    return result;
}

ClientConfig ClientConfig::from_env() {
    ClientConfig config;

    const char* endpoints = std::getenv("GRAPHLINK_ENDPOINTS");
    config.endpoints = parse_endpoints(endpoints && endpoints[0] != '\0' ? endpoints
                                                                         : kDefaultEndpoints);

    const char* timeout = std::getenv("GRAPHLINK_TIMEOUT_MS");
    if (timeout && timeout[0] != '\0') {
        char* end = nullptr;
        long ms = std::strtol(timeout, &end, 10);
        if (end == timeout || *end != '\0' || ms <= 0) {
            GRAPHLINK_LOG_WARNING("Ignoring invalid GRAPHLINK_TIMEOUT_MS='%s', using %ld ms",
                                  timeout, kDefaultTimeoutMs);
        } else {
            config.default_timeout = std::chrono::milliseconds(ms);
        }
    }

    GRAPHLINK_LOG_INFO("ClientConfig: %zu endpoint(s), default timeout %lld ms",
                       config.endpoints.size(),
                       static_cast<long long>(config.default_timeout.count()));
    return config;
}

} // namespace graphlink
