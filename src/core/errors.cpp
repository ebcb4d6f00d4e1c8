/**
 * @file errors.cpp
 * @brief SandboxError and its error category
 *
 * @date 2025
 */

#include "sandgate/core/errors.hpp"

namespace sandgate {
namespace core {

namespace {

std::string ComposeMessage(const std::string& summary, const std::string& cause) {
    if (cause.empty()) {
        return summary;
    }
    if (summary.empty()) {
        return cause;
    }
    return summary + ": " + cause;
}

} // anonymous namespace

std::string SandboxErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::CONNECTION_ERROR:
            return "Container engine connection failed";
        case ErrorCode::IMAGE_NOT_AVAILABLE:
            return "Image not available locally";
        case ErrorCode::ENGINE_CREATE_FAILED:
            return "Container create failed";
        case ErrorCode::ENGINE_START_FAILED:
            return "Container start failed";
        case ErrorCode::MISSING_IDENTITY:
            return "Container identity missing";
        case ErrorCode::REMOVAL_FAILED:
            return "Container removal failed";
        case ErrorCode::OPERATION_CANCELLED:
            return "Operation cancelled";
        case ErrorCode::DEADLINE_EXCEEDED:
            return "Operation deadline exceeded";
        case ErrorCode::CONFIG_INVALID:
            return "Invalid configuration";
        default:
            return "Unknown error";
    }
}

const SandboxErrorCategory& GetSandboxErrorCategory() {
    static SandboxErrorCategory category;
    return category;
}

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_ERROR: return "ConnectionError";
        case ErrorCode::IMAGE_NOT_AVAILABLE: return "ImageNotAvailable";
        case ErrorCode::ENGINE_CREATE_FAILED: return "EngineCreateFailed";
        case ErrorCode::ENGINE_START_FAILED: return "EngineStartFailed";
        case ErrorCode::MISSING_IDENTITY: return "MissingIdentity";
        case ErrorCode::REMOVAL_FAILED: return "RemovalFailed";
        case ErrorCode::OPERATION_CANCELLED: return "OperationCancelled";
        case ErrorCode::DEADLINE_EXCEEDED: return "DeadlineExceeded";
        case ErrorCode::CONFIG_INVALID: return "ConfigInvalid";
        default: return "Unknown";
    }
}

SandboxError::SandboxError(ErrorCode code, const std::string& summary,
                           const std::string& cause)
    : std::runtime_error(ComposeMessage(summary, cause))
    , code_(code)
    , summary_(summary)
    , cause_(cause) {
}

std::error_code SandboxError::code() const noexcept {
    return std::error_code(static_cast<int>(code_), GetSandboxErrorCategory());
}

} // namespace core
} // namespace sandgate
