/**
 * @file engine_config.hpp
 * @brief Container engine connection settings
 *
 * Connection parameters are an explicit value handed to the client
 * factory. Reading DOCKER_HOST and friends from the environment is the
 * startup layer's job (see core/gateway_config.hpp).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace sandgate {
namespace engine {

/// Default Docker Engine endpoint on Linux hosts
constexpr const char* kDefaultEngineHost = "unix:///var/run/docker.sock";

/**
 * @struct TlsConfig
 * @brief Client TLS material for tcp:// endpoints
 */
struct TlsConfig {
    bool enabled{false};               ///< Use https for tcp:// hosts
    bool verify{true};                 ///< Verify the engine certificate
    std::filesystem::path ca_file;     ///< CA bundle (ca.pem)
    std::filesystem::path cert_file;   ///< Client certificate (cert.pem)
    std::filesystem::path key_file;    ///< Client key (key.pem)
};

/**
 * @struct EngineConfig
 * @brief Everything needed to reach the engine control API
 */
struct EngineConfig {
    std::string host{kDefaultEngineHost};        ///< unix://, tcp://, http(s)://
    std::string api_version;                      ///< Pinned version, empty = negotiate
    TlsConfig tls;                                ///< TLS settings
    std::chrono::seconds request_timeout{60};     ///< Per-request transfer timeout
    std::chrono::seconds connect_timeout{10};     ///< Connection establishment timeout
};

/**
 * @struct EngineEndpoint
 * @brief Parsed form of EngineConfig::host
 */
struct EngineEndpoint {
    enum class Transport {
        UNIX_SOCKET,   ///< HTTP over a local socket
        TCP            ///< HTTP(S) over TCP
    };

    Transport transport{Transport::UNIX_SOCKET};
    std::string socket_path;   ///< Socket path for UNIX_SOCKET
    std::string base_url;      ///< URL prefix requests are issued against

    /**
     * @brief Parse a DOCKER_HOST style address
     *
     * @param host Address such as "unix:///var/run/docker.sock" or "tcp://10.0.0.5:2376"
     * @param use_tls Use https for tcp:// addresses
     * @return Parsed endpoint
     *
     * @throws std::invalid_argument for empty, malformed or unsupported addresses
     *
     * **Example**:
     * @code
     * auto ep = EngineEndpoint::Parse("tcp://docker.internal", false);
     * // ep.base_url == "http://docker.internal:2375"
     * @endcode
     */
    static EngineEndpoint Parse(const std::string& host, bool use_tls);
};

} // namespace engine
} // namespace sandgate
