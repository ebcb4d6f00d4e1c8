/**
 * @file engine_config.cpp
 * @brief DOCKER_HOST address parsing
 *
 * @date 2025
 */

#include "sandgate/engine/engine_config.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <stdexcept>

namespace sandgate {
namespace engine {

namespace {

constexpr const char* kDefaultHttpPort = "2375";
constexpr const char* kDefaultHttpsPort = "2376";

// Appends the default engine port when the authority has none
std::string WithDefaultPort(const std::string& authority, bool use_tls) {
    // Bracketed IPv6 literal: port follows the closing bracket
    auto bracket = authority.rfind(']');
    auto colon = authority.rfind(':');
    bool has_port = colon != std::string::npos &&
                    (bracket == std::string::npos || colon > bracket);

    if (has_port) {
        if (colon + 1 == authority.size()) {
            throw std::invalid_argument("engine host has an empty port: " + authority);
        }
        return authority;
    }
    return authority + ":" + (use_tls ? kDefaultHttpsPort : kDefaultHttpPort);
}

} // anonymous namespace

EngineEndpoint EngineEndpoint::Parse(const std::string& host, bool use_tls) {
    std::string address = utils::StringUtils::Trim(host);
    if (address.empty()) {
        throw std::invalid_argument("engine host is empty");
    }

    EngineEndpoint endpoint;

    if (utils::StringUtils::StartsWith(address, "unix://")) {
        endpoint.transport = Transport::UNIX_SOCKET;
        endpoint.socket_path = address.substr(std::string("unix://").size());
        if (endpoint.socket_path.empty() || endpoint.socket_path.front() != '/') {
            throw std::invalid_argument("unix engine host needs an absolute socket path: " + address);
        }
        // Host part is ignored by the engine when talking over a socket
        endpoint.base_url = "http://localhost";
        return endpoint;
    }

    std::string scheme;
    std::string authority;

    if (utils::StringUtils::StartsWith(address, "tcp://")) {
        scheme = use_tls ? "https" : "http";
        authority = address.substr(std::string("tcp://").size());
    } else if (utils::StringUtils::StartsWith(address, "http://")) {
        scheme = "http";
        authority = address.substr(std::string("http://").size());
    } else if (utils::StringUtils::StartsWith(address, "https://")) {
        scheme = "https";
        authority = address.substr(std::string("https://").size());
    } else {
        throw std::invalid_argument("unsupported engine host scheme: " + address);
    }

    while (utils::StringUtils::EndsWith(authority, "/")) {
        authority.pop_back();
    }
    if (authority.empty() || authority.find('/') != std::string::npos) {
        throw std::invalid_argument("malformed engine host: " + address);
    }

    endpoint.transport = Transport::TCP;
    endpoint.base_url = scheme + "://" + WithDefaultPort(authority, scheme == "https");
    return endpoint;
}

} // namespace engine
} // namespace sandgate
