#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace graphlink {

struct Endpoint {
    std::string host;
    int port;
};

struct ClientConfig {
    static constexpr const char* kDefaultEndpoints = "127.0.0.1:9080";
    static constexpr long kDefaultTimeoutMs = 10000;

    std::vector<Endpoint> endpoints;
    std::chrono::milliseconds default_timeout{kDefaultTimeoutMs};

    // GRAPHLINK_ENDPOINTS="host:port[,host:port...]", GRAPHLINK_TIMEOUT_MS=<ms>
    static ClientConfig from_env();

    // Throws std::invalid_argument on an empty list or a malformed entry.
    static std::vector<Endpoint> parse_endpoints(const std::string& endpoints);
};

} // namespace graphlink
