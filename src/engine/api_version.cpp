/**
 * @file api_version.cpp
 * @brief Engine API version negotiation
 *
 * @date 2025
 */

#include "sandgate/engine/api_version.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <string>

namespace sandgate {
namespace engine {

namespace {

bool IsNumber(const std::string& str) {
    if (str.empty() || str.size() > 6) {
        return false;
    }
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<ApiVersion> ApiVersion::Parse(const std::string& text) {
    std::string value = utils::StringUtils::Trim(text);
    if (utils::StringUtils::StartsWith(value, "v")) {
        value = value.substr(1);
    }

    auto dot = value.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }

    std::string major_part = value.substr(0, dot);
    std::string minor_part = value.substr(dot + 1);
    if (!IsNumber(major_part) || !IsNumber(minor_part)) {
        return std::nullopt;
    }

    ApiVersion version;
    version.major_number = std::stoi(major_part);
    version.minor_number = std::stoi(minor_part);
    return version;
}

std::string ApiVersion::ToString() const {
    return std::to_string(major_number) + "." + std::to_string(minor_number);
}

std::string NegotiateApiVersion(const std::string& client_max,
                                const std::string& server_version) {
    auto client = ApiVersion::Parse(client_max);
    if (!client) {
        client = ApiVersion::Parse(kClientMaxApiVersion);
    }

    auto server = ApiVersion::Parse(server_version);
    if (!server) {
        if (!server_version.empty()) {
            spdlog::warn("Engine advertised unparsable API version '{}', using {}",
                         server_version, kFallbackApiVersion);
        }
        server = ApiVersion::Parse(kFallbackApiVersion);
    }

    const ApiVersion& chosen = (*server < *client) ? *server : *client;
    spdlog::debug("Negotiated engine API version {} (client {}, server {})",
                  chosen.ToString(), client->ToString(),
                  server_version.empty() ? "<none>" : server_version);
    return chosen.ToString();
}

} // namespace engine
} // namespace sandgate
