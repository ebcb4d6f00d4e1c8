/**
 * @file operation_context.hpp
 * @brief Deadline and cancellation carried through every engine call
 *
 * Copies of an OperationContext share the same cancellation flag, so a
 * context handed to a worker can be cancelled from the thread that
 * created it.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace sandgate {
namespace core {

/**
 * @class OperationContext
 * @brief Caller-supplied deadline and cancellation flag
 *
 * **Usage Example**:
 * @code
 * auto ctx = OperationContext::WithTimeout(std::chrono::seconds(120));
 * auto id = creation.CreateSandbox(std::nullopt, ctx);
 * @endcode
 */
class OperationContext {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Context without deadline
     */
    OperationContext();

    /**
     * @brief Context expiring @p timeout from now
     */
    static OperationContext WithTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Context expiring at @p deadline
     */
    static OperationContext WithDeadline(Clock::time_point deadline);

    /**
     * @brief Request cancellation (visible to every copy)
     */
    void Cancel() const;

    bool IsCancelled() const;
    bool IsExpired() const;
    bool HasDeadline() const { return deadline_.has_value(); }

    /**
     * @brief Time left before the deadline
     * @return std::nullopt when no deadline is set, zero once expired
     */
    std::optional<std::chrono::milliseconds> Remaining() const;

    /**
     * @brief Throw if cancelled or expired
     *
     * @throws SandboxError(OPERATION_CANCELLED) if cancelled
     * @throws SandboxError(DEADLINE_EXCEEDED) if the deadline passed
     */
    void ThrowIfDone() const;

private:
    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace core
} // namespace sandgate
