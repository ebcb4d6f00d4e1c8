/**
 * @file docker_client.cpp
 * @brief Docker Engine HTTP API client
 *
 * Requests go through a single libcurl easy handle per client:
 *
 * ```
 * Ping            GET    /_ping
 * ImageExists     GET    /v{V}/images/{ref}/json
 * CreateContainer POST   /v{V}/containers/create
 * StartContainer  POST   /v{V}/containers/{id}/start
 * StopContainer   POST   /v{V}/containers/{id}/stop?t={grace}
 * RemoveContainer DELETE /v{V}/containers/{id}?force={0|1}&v={0|1}
 * ```
 *
 * 2xx and 304 (already started/stopped) count as success. Error bodies
 * are JSON objects with a "message" field.
 *
 * Every transfer is bounded by the smaller of the configured request
 * timeout and the time left on the caller's context, and a progress
 * callback aborts it as soon as the context is cancelled.
 *
 * @date 2025
 */

#include "sandgate/engine/docker_client.hpp"
#include "sandgate/engine/api_version.hpp"
#include "sandgate/core/errors.hpp"
#include "sandgate/utils/string_utils.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

using json = nlohmann::json;

namespace sandgate {
namespace engine {

namespace {

struct HttpResponse {
    long status{0};
    std::string body;
    std::map<std::string, std::string> headers;   ///< Lowercased names
};

struct CurlHandleDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

std::size_t WriteBody(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::size_t WriteHeader(char* data, std::size_t size, std::size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(data, size * nitems);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto name = utils::StringUtils::ToLower(utils::StringUtils::Trim(line.substr(0, colon)));
        (*headers)[name] = utils::StringUtils::Trim(line.substr(colon + 1));
    }
    return size * nitems;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int OnTransferProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const core::OperationContext*>(clientp);
    return ctx->IsCancelled() ? 1 : 0;
}

bool IsSuccess(long status) {
    return (status >= 200 && status < 300) || status == 304;
}

} // anonymous namespace

// ============================================================================
// PRIVATE IMPLEMENTATION
// ============================================================================

class DockerEngineClient::Impl {
public:
    EngineEndpoint endpoint;
    EngineConfig config;
    std::string api_version{kFallbackApiVersion};
    std::unique_ptr<CURL, CurlHandleDeleter> handle;
    char error_buffer[CURL_ERROR_SIZE]{};

    std::string Versioned(const std::string& path) const {
        return "/v" + api_version + path;
    }

    std::string EscapeSegment(const std::string& segment) {
        char* escaped = curl_easy_escape(handle.get(), segment.c_str(),
                                         static_cast<int>(segment.size()));
        if (!escaped) {
            throw EngineError(0, "failed to encode path segment: " + segment);
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    HttpResponse Perform(const std::string& method,
                         const std::string& path,
                         const std::string* body,
                         const core::OperationContext& ctx,
                         std::chrono::seconds extra_timeout = std::chrono::seconds(0));

    void ThrowUnlessSuccess(const HttpResponse& response) const {
        if (!IsSuccess(response.status)) {
            throw EngineError(response.status,
                              DockerEngineClient::ExtractErrorMessage(response.status, response.body));
        }
    }
};

HttpResponse DockerEngineClient::Impl::Perform(const std::string& method,
                                               const std::string& path,
                                               const std::string* body,
                                               const core::OperationContext& ctx,
                                               std::chrono::seconds extra_timeout) {
    ctx.ThrowIfDone();

    CURL* curl = handle.get();
    curl_easy_reset(curl);
    error_buffer[0] = '\0';

    HttpResponse response;
    const std::string url = endpoint.base_url + path;
    static const std::string kEmptyBody;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "sandgate/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, WriteHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, OnTransferProgress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                     static_cast<void*>(const_cast<core::OperationContext*>(&ctx)));

    // Timeouts: configured limits clamped to the caller's deadline
    auto transfer_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        config.request_timeout + extra_timeout);
    auto connect_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        config.connect_timeout);
    if (auto remaining = ctx.Remaining()) {
        auto floor = std::max(*remaining, std::chrono::milliseconds(1));
        transfer_timeout = std::min(transfer_timeout, floor);
        connect_timeout = std::min(connect_timeout, floor);
    }
    if (transfer_timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(transfer_timeout.count()));
    }
    if (connect_timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
    }

    // Transport
    if (endpoint.transport == EngineEndpoint::Transport::UNIX_SOCKET) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, endpoint.socket_path.c_str());
    } else if (utils::StringUtils::StartsWith(endpoint.base_url, "https://")) {
        const auto& tls = config.tls;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, tls.verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, tls.verify ? 2L : 0L);
        if (!tls.ca_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, tls.ca_file.c_str());
        }
        if (!tls.cert_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_SSLCERT, tls.cert_file.c_str());
        }
        if (!tls.key_file.empty()) {
            curl_easy_setopt(curl, CURLOPT_SSLKEY, tls.key_file.c_str());
        }
    }

    // Method and payload
    std::unique_ptr<curl_slist, CurlListDeleter> headers;
    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (method == "POST") {
        const std::string& payload = body ? *body : kEmptyBody;
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        if (body) {
            headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        }
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    spdlog::debug("Engine request: {} {}", method, path);

    CURLcode rc = curl_easy_perform(curl);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        throw core::SandboxError(core::ErrorCode::OPERATION_CANCELLED,
                                 "operation cancelled", method + " " + path);
    }
    if (rc == CURLE_OPERATION_TIMEDOUT && ctx.IsExpired()) {
        throw core::SandboxError(core::ErrorCode::DEADLINE_EXCEEDED,
                                 "operation deadline exceeded", method + " " + path);
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                     : std::string(curl_easy_strerror(rc));
        throw EngineError(0, "cannot reach container engine at " + config.host + ": " + detail);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("Engine response: {} {} -> {}", method, path, response.status);

    return response;
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerEngineClient::DockerEngineClient(EngineEndpoint endpoint, EngineConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->endpoint = std::move(endpoint);
    impl_->config = std::move(config);
    impl_->handle.reset(curl_easy_init());

    if (!impl_->handle) {
        throw std::runtime_error("failed to allocate libcurl handle");
    }
}

DockerEngineClient::~DockerEngineClient() {
    spdlog::debug("Releasing engine connection to {}", impl_->config.host);
}

// ============================================================================
// VERSION NEGOTIATION
// ============================================================================

std::string DockerEngineClient::Ping(const core::OperationContext& ctx) {
    auto response = impl_->Perform("GET", "/_ping", nullptr, ctx);
    impl_->ThrowUnlessSuccess(response);

    auto it = response.headers.find("api-version");
    return it != response.headers.end() ? it->second : std::string();
}

void DockerEngineClient::SetApiVersion(const std::string& version) {
    impl_->api_version = version;
}

std::string DockerEngineClient::ApiVersion() const {
    return impl_->api_version;
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerEngineClient::ImageExists(const std::string& image_reference,
                                     const core::OperationContext& ctx) {
    // References are validated by the caller; '/' and ':' are part of the route
    auto response = impl_->Perform(
        "GET", impl_->Versioned("/images/" + image_reference + "/json"), nullptr, ctx);

    if (response.status == 404) {
        return false;
    }
    impl_->ThrowUnlessSuccess(response);
    return true;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerEngineClient::CreateContainer(const ContainerSpec& spec,
                                                const core::OperationContext& ctx) {
    const std::string body = BuildCreateBody(spec).dump();
    auto response = impl_->Perform("POST", impl_->Versioned("/containers/create"), &body, ctx);
    impl_->ThrowUnlessSuccess(response);

    json reply;
    try {
        reply = json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw EngineError(response.status,
                          std::string("malformed container create response: ") + e.what());
    }

    if (!reply.is_object() || !reply.contains("Id") || !reply["Id"].is_string()) {
        throw EngineError(response.status, "container create response carries no Id");
    }

    if (reply.contains("Warnings") && reply["Warnings"].is_array()) {
        for (const auto& warning : reply["Warnings"]) {
            if (warning.is_string()) {
                spdlog::warn("Engine warning: {}", warning.get<std::string>());
            }
        }
    }

    return reply["Id"].get<std::string>();
}

void DockerEngineClient::StartContainer(const std::string& container_id,
                                        const core::OperationContext& ctx) {
    auto path = "/containers/" + impl_->EscapeSegment(container_id) + "/start";
    auto response = impl_->Perform("POST", impl_->Versioned(path), nullptr, ctx);
    impl_->ThrowUnlessSuccess(response);
}

void DockerEngineClient::StopContainer(const std::string& container_id,
                                       std::chrono::seconds grace,
                                       const core::OperationContext& ctx) {
    auto path = "/containers/" + impl_->EscapeSegment(container_id) +
                "/stop?t=" + std::to_string(grace.count());

    // The engine answers only after the grace period, so allow for it
    auto response = impl_->Perform("POST", impl_->Versioned(path), nullptr, ctx, grace);
    impl_->ThrowUnlessSuccess(response);
}

void DockerEngineClient::RemoveContainer(const std::string& container_id,
                                         const RemoveOptions& options,
                                         const core::OperationContext& ctx) {
    auto path = "/containers/" + impl_->EscapeSegment(container_id) +
                "?force=" + (options.force ? "1" : "0") +
                "&v=" + (options.remove_volumes ? "1" : "0");

    auto response = impl_->Perform("DELETE", impl_->Versioned(path), nullptr, ctx);
    impl_->ThrowUnlessSuccess(response);
}

// ============================================================================
// WIRE FORMAT HELPERS
// ============================================================================

json DockerEngineClient::BuildCreateBody(const ContainerSpec& spec) {
    json body;
    body["Image"] = spec.image;
    body["Tty"] = spec.tty;
    body["OpenStdin"] = spec.open_stdin;
    body["StdinOnce"] = spec.stdin_once;

    if (!spec.working_dir.empty()) {
        body["WorkingDir"] = spec.working_dir;
    }
    if (!spec.command.empty()) {
        body["Cmd"] = spec.command;
    }
    if (!spec.labels.empty()) {
        body["Labels"] = spec.labels;
    }

    // Unset limits are omitted so the engine defaults apply
    json host_config = json::object();
    if (spec.limits.memory_bytes > 0) {
        host_config["Memory"] = spec.limits.memory_bytes;
    }
    if (spec.limits.nano_cpus > 0) {
        host_config["NanoCpus"] = spec.limits.nano_cpus;
    }
    if (spec.limits.pids_limit > 0) {
        host_config["PidsLimit"] = spec.limits.pids_limit;
    }
    body["HostConfig"] = host_config;

    return body;
}

std::string DockerEngineClient::ExtractErrorMessage(long status_code, const std::string& body) {
    std::string trimmed = utils::StringUtils::Trim(body);
    if (trimmed.empty()) {
        return "engine returned HTTP " + std::to_string(status_code);
    }

    try {
        auto parsed = json::parse(trimmed);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    }
    catch (const json::parse_error&) {
        // Plain-text body, reported as is
    }

    return utils::StringUtils::Truncate(trimmed, 512);
}

} // namespace engine
} // namespace sandgate
