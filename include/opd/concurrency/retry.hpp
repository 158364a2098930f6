#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <string>

namespace opd {
namespace concurrency {

/**
 * @brief Backoff parameters for transient store failures
 *
 * Delay for retry n (1-based) is base_delay * backoff_factor^(n-1), capped
 * at max_delay, then scaled by a jitter factor drawn from [jitter_min, 1).
 */
struct RetryConfig {
    int max_retries = 1;
    std::chrono::milliseconds base_delay = std::chrono::milliseconds(50);
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(200);
    double backoff_factor = 1.5;
    bool jitter_enabled = true;
    double jitter_min = 0.5;
};

/**
 * @brief Identity and limits of one guarded operation
 */
struct OperationContext {
    std::string operation;       ///< e.g. "allocate", "cancel"
    std::string key;             ///< in-flight key, if any
    int64_t deadline_ms = 0;     ///< epoch ms after which no attempt starts, 0 for none
    std::map<std::string, std::string> details;
};

struct RetryStats {
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> successes_after_retry{0};
    std::atomic<uint64_t> exhausted{0};
    std::atomic<uint64_t> deadline_expired{0};
};

/**
 * @brief Delay before retry number @p retry (1-based) for a given jitter
 * sample in [0, 1)
 */
std::chrono::milliseconds calculate_delay(const RetryConfig& config, int retry,
                                          double jitter_sample);

/**
 * @brief Delay before retry number @p retry using a random jitter sample
 */
std::chrono::milliseconds calculate_delay(const RetryConfig& config, int retry);

/**
 * @brief True for failures worth another attempt: busy or locked store,
 * write conflicts, version mismatches
 */
bool is_retryable(const std::exception& error);

/**
 * @brief True when the failure was an optimistic version mismatch
 */
bool is_version_conflict(const std::exception& error);

} // namespace concurrency
} // namespace opd
