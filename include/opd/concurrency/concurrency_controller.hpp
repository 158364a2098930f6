#pragma once

#include <opd/concepts/store_concepts.hpp>
#include <opd/concurrency/in_flight.hpp>
#include <opd/concurrency/retry.hpp>
#include <opd/core/clock.hpp>
#include <opd/core/error.hpp>
#include <opd/store/database.hpp>

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace opd {
namespace concurrency {

/**
 * @brief Retry, transaction and optimistic-lock plumbing shared by the
 * capacity manager, the allocator and the lifecycle operations
 *
 * Transient failures (busy store, write conflicts, version mismatches) are
 * retried with exponential backoff. Once retries are exhausted the caller
 * sees CONCURRENT_MODIFICATION when the last failure was a version
 * mismatch and MAX_RETRIES_EXCEEDED otherwise. A context deadline stops
 * further attempts with SERVICE_UNAVAILABLE. Every other exception
 * propagates untouched.
 */
class ConcurrencyController {
public:
    ConcurrencyController(store::Database& db, Clock& clock, InFlightRegistry& in_flight)
        : db_(db), clock_(clock), in_flight_(in_flight) {}

    /**
     * @brief Run op(attempt) until it succeeds or a non-transient error
     * occurs
     */
    template <typename F>
    auto execute_with_retry(F&& op, const OperationContext& context, const RetryConfig& config)
        -> std::invoke_result_t<F&, int> {
        for (int attempt = 0;; ++attempt) {
            check_deadline(context, attempt);
            stats_.attempts.fetch_add(1, std::memory_order_relaxed);
            try {
                if constexpr (std::is_void_v<std::invoke_result_t<F&, int>>) {
                    op(attempt);
                    record_success(context, attempt);
                    return;
                } else {
                    auto result = op(attempt);
                    record_success(context, attempt);
                    return result;
                }
            } catch (const std::exception& e) {
                if (!is_retryable(e))
                    throw;
                if (attempt >= config.max_retries)
                    throw_exhausted(context, attempt + 1, e);
                back_off(context, config, attempt + 1, e);
            }
        }
    }

    /**
     * @brief Run fn(attempt) inside one store transaction, retried as a
     * whole on transient failures
     */
    template <typename F>
    auto execute_transaction(F&& fn, const OperationContext& context, const RetryConfig& config)
        -> std::invoke_result_t<F&, int> {
        return execute_with_retry(
            [&](int attempt) { return db_.transaction([&]() { return fn(attempt); }); }, context,
            config);
    }

    /**
     * @brief Load, mutate and conditionally write one record
     *
     * The write only succeeds when the stored version still matches the
     * loaded one; otherwise the whole read-modify-write is retried.
     *
     * @throws Error SLOT_NOT_FOUND / TOKEN_NOT_FOUND when the record is gone
     */
    template <concepts::VersionedStore S, typename M>
        requires concepts::RecordMutator<M, typename S::record_type>
    typename S::record_type update_with_optimistic_lock(S& store, const std::string& id,
                                                        M&& mutate,
                                                        const OperationContext& context,
                                                        const RetryConfig& config) {
        return execute_with_retry(
            [&](int) {
                auto record = store.load(id);
                if (!record)
                    throw_not_found(S::entity_name(), id);
                mutate(*record);
                store.save(*record);
                return *record;
            },
            context, config);
    }

    /**
     * @brief Epoch ms deadline for an operation starting now
     */
    int64_t deadline_after(std::chrono::milliseconds budget) const {
        return clock_.now_ms() + budget.count();
    }

    store::Database& database() {
        return db_;
    }
    InFlightRegistry& in_flight() {
        return in_flight_;
    }
    Clock& clock() {
        return clock_;
    }
    const RetryStats& stats() const {
        return stats_;
    }

private:
    void check_deadline(const OperationContext& context, int attempt);
    [[noreturn]] void throw_deadline(const OperationContext& context, int attempt);
    void record_success(const OperationContext& context, int attempt);
    void back_off(const OperationContext& context, const RetryConfig& config, int retry,
                  const std::exception& error);
    [[noreturn]] void throw_exhausted(const OperationContext& context, int attempts,
                                      const std::exception& last_error);
    [[noreturn]] static void throw_not_found(const char *entity, const std::string& id);

    store::Database& db_;
    Clock& clock_;
    InFlightRegistry& in_flight_;
    RetryStats stats_;
};

} // namespace concurrency
} // namespace opd
