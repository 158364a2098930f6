#include <opd/concurrency/retry.hpp>

#include <opd/core/error.hpp>
#include <opd/store/database.hpp>

#include "utils/random_utils.hpp"

#include <algorithm>
#include <cmath>

namespace opd {
namespace concurrency {

std::chrono::milliseconds calculate_delay(const RetryConfig& config, int retry,
                                          double jitter_sample) {
    if (retry < 1)
        retry = 1;

    double delay = static_cast<double>(config.base_delay.count()) *
                   std::pow(config.backoff_factor, retry - 1);
    delay = std::min(delay, static_cast<double>(config.max_delay.count()));

    if (config.jitter_enabled) {
        double sample = std::clamp(jitter_sample, 0.0, 1.0);
        double factor = config.jitter_min + (1.0 - config.jitter_min) * sample;
        delay *= factor;
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::floor(delay)));
}

std::chrono::milliseconds calculate_delay(const RetryConfig& config, int retry) {
    return calculate_delay(config, retry, ThreadSafeRandom::random_double(0.0, 1.0));
}

bool is_version_conflict(const std::exception& error) {
    if (dynamic_cast<const store::VersionConflict *>(&error))
        return true;
    if (const auto *opd_error = dynamic_cast<const Error *>(&error))
        return opd_error->code() == ErrorCode::ConcurrentModification;
    return false;
}

bool is_retryable(const std::exception& error) {
    if (is_version_conflict(error))
        return true;
    if (const auto *store_error = dynamic_cast<const store::StoreError *>(&error))
        return store_error->transient();
    return false;
}

} // namespace concurrency
} // namespace opd
