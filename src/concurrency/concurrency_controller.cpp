#include <opd/concurrency/concurrency_controller.hpp>

#include "utils/logger.hpp"

#include <string_view>

namespace opd {
namespace concurrency {

void ConcurrencyController::check_deadline(const OperationContext& context, int attempt) {
    if (context.deadline_ms <= 0 || clock_.now_ms() < context.deadline_ms)
        return;
    throw_deadline(context, attempt);
}

void ConcurrencyController::throw_deadline(const OperationContext& context, int attempt) {
    stats_.deadline_expired.fetch_add(1, std::memory_order_relaxed);
    log_warn("Operation ", context.operation, " ran past its deadline after ", attempt,
             " attempt(s)");

    auto details = context.details;
    details["operation"] = context.operation;
    details["attempts"] = std::to_string(attempt);
    throw Error(ErrorCode::ServiceUnavailable,
                "Operation '" + context.operation + "' exceeded its time budget", details,
                {"Retry the request later"});
}

void ConcurrencyController::record_success(const OperationContext& context, int attempt) {
    if (attempt > 0) {
        stats_.successes_after_retry.fetch_add(1, std::memory_order_relaxed);
        log_debug("Operation ", context.operation, " succeeded after ", attempt, " retr",
                  attempt == 1 ? "y" : "ies");
    }
}

void ConcurrencyController::back_off(const OperationContext& context, const RetryConfig& config,
                                     int retry, const std::exception& error) {
    auto delay = calculate_delay(config, retry);
    if (context.deadline_ms > 0 && clock_.now_ms() + delay.count() >= context.deadline_ms) {
        throw_deadline(context, retry);
    }

    stats_.retries.fetch_add(1, std::memory_order_relaxed);
    log_debug("Retrying ", context.operation, " (retry ", retry, ") in ", delay.count(),
              "ms after: ", error.what());
    clock_.sleep_for(delay);
}

void ConcurrencyController::throw_exhausted(const OperationContext& context, int attempts,
                                            const std::exception& last_error) {
    stats_.exhausted.fetch_add(1, std::memory_order_relaxed);

    auto details = context.details;
    details["operation"] = context.operation;
    details["attempts"] = std::to_string(attempts);
    details["last_error"] = last_error.what();

    if (is_version_conflict(last_error)) {
        log_warn("Operation ", context.operation, " lost ", attempts,
                 " optimistic lock race(s): ", last_error.what());
        throw Error(ErrorCode::ConcurrentModification,
                    "The record was modified by another request", details,
                    {"Reload the record and retry the request"});
    }

    log_error("Operation ", context.operation, " failed after ", attempts,
              " attempt(s): ", last_error.what());
    throw Error(ErrorCode::MaxRetriesExceeded,
                "Operation '" + context.operation + "' failed after " + std::to_string(attempts) +
                    " attempt(s)",
                details, {"Retry the request later"});
}

void ConcurrencyController::throw_not_found(const char *entity, const std::string& id) {
    if (std::string_view(entity) == "slot")
        throw Error(ErrorCode::SlotNotFound, "Slot '" + id + "' not found", {{"slot_id", id}});
    throw Error(ErrorCode::TokenNotFound, "Token '" + id + "' not found", {{"token_id", id}});
}

} // namespace concurrency
} // namespace opd
