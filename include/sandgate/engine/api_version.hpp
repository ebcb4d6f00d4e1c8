/**
 * @file api_version.hpp
 * @brief Engine API version parsing and negotiation
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

namespace sandgate {
namespace engine {

/// Highest engine API version this client speaks
constexpr const char* kClientMaxApiVersion = "1.47";

/// Version assumed when the engine does not advertise one
constexpr const char* kFallbackApiVersion = "1.24";

/**
 * @struct ApiVersion
 * @brief "major.minor" engine API version
 */
struct ApiVersion {
    int major_number{1};
    int minor_number{24};

    /**
     * @brief Parse "1.43" (a leading 'v' is accepted)
     * @return std::nullopt if not of the form major.minor
     */
    static std::optional<ApiVersion> Parse(const std::string& text);

    std::string ToString() const;

    bool operator<(const ApiVersion& other) const {
        return major_number != other.major_number ? major_number < other.major_number
                                                : minor_number < other.minor_number;
    }
    bool operator==(const ApiVersion& other) const {
        return major_number == other.major_number && minor_number == other.minor_number;
    }
};

/**
 * @brief Pick the highest version both sides support
 *
 * @param client_max Highest version the client speaks
 * @param server_version Version advertised by the engine (may be empty)
 * @return min(client_max, server_version); kFallbackApiVersion if the
 *         engine advertised nothing usable
 */
std::string NegotiateApiVersion(const std::string& client_max,
                                const std::string& server_version);

} // namespace engine
} // namespace sandgate
