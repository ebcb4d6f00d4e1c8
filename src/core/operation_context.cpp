/**
 * @file operation_context.cpp
 * @brief Deadline/cancellation context implementation
 *
 * @date 2025
 */

#include "sandgate/core/operation_context.hpp"
#include "sandgate/core/errors.hpp"

namespace sandgate {
namespace core {

OperationContext::OperationContext()
    : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

OperationContext OperationContext::WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(Clock::now() + timeout);
}

OperationContext OperationContext::WithDeadline(Clock::time_point deadline) {
    OperationContext ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

void OperationContext::Cancel() const {
    cancelled_->store(true);
}

bool OperationContext::IsCancelled() const {
    return cancelled_->load();
}

bool OperationContext::IsExpired() const {
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> OperationContext::Remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - Clock::now());
    if (left.count() < 0) {
        return std::chrono::milliseconds(0);
    }
    return left;
}

void OperationContext::ThrowIfDone() const {
    if (IsCancelled()) {
        throw SandboxError(ErrorCode::OPERATION_CANCELLED, "operation cancelled");
    }
    if (IsExpired()) {
        throw SandboxError(ErrorCode::DEADLINE_EXCEEDED, "operation deadline exceeded");
    }
}

} // namespace core
} // namespace sandgate
