/**
 * @file errors.hpp
 * @brief Error taxonomy for sandbox lifecycle operations
 *
 * Every failure a caller can observe is a SandboxError carrying one of the
 * codes below. The message returned by what() is caller-facing and keeps
 * the engine's own error text for diagnostics.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace sandgate {
namespace core {

/**
 * @enum ErrorCode
 * @brief Failure classes of the gateway
 */
enum class ErrorCode {
    CONNECTION_ERROR = 1000,       ///< Engine unreachable or misconfigured
    IMAGE_NOT_AVAILABLE = 2000,    ///< Image absent from the local store
    ENGINE_CREATE_FAILED = 3000,   ///< Engine rejected container create
    ENGINE_START_FAILED = 3001,    ///< Engine rejected container start
    MISSING_IDENTITY = 4000,       ///< No container identity supplied
    REMOVAL_FAILED = 5000,         ///< Container could not be removed (leak!)
    OPERATION_CANCELLED = 6000,    ///< Caller cancelled the operation
    DEADLINE_EXCEEDED = 6001,      ///< Caller deadline expired
    CONFIG_INVALID = 9000          ///< Invalid configuration
};

/**
 * @class SandboxErrorCategory
 * @brief std::error_category for ErrorCode values
 */
class SandboxErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "sandgate"; }
    std::string message(int ev) const override;
};

/**
 * @brief Singleton category instance
 */
const SandboxErrorCategory& GetSandboxErrorCategory();

/**
 * @brief Symbolic name of an error code ("ImageNotAvailable", ...)
 */
const char* ErrorCodeName(ErrorCode code);

/**
 * @class SandboxError
 * @brief Caller-visible failure of a gateway operation
 *
 * @code
 * throw SandboxError(ErrorCode::ENGINE_CREATE_FAILED,
 *                    "failed to create container", engine_error.what());
 * // what() == "failed to create container: <engine text>"
 * @endcode
 */
class SandboxError : public std::runtime_error {
public:
    /**
     * @param code Failure class
     * @param summary Human readable summary
     * @param cause Underlying engine/transport text (optional)
     */
    SandboxError(ErrorCode code, const std::string& summary,
                 const std::string& cause = "");

    ErrorCode GetErrorCode() const noexcept { return code_; }
    std::error_code code() const noexcept;

    const std::string& Summary() const noexcept { return summary_; }
    const std::string& Cause() const noexcept { return cause_; }

private:
    ErrorCode code_;
    std::string summary_;
    std::string cause_;
};

} // namespace core
} // namespace sandgate
