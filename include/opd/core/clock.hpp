#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace opd {

/**
 * @brief Source of wall-clock time and of retry sleeps
 *
 * Injected into every component that reads the time so that tests can run
 * against a manually advanced clock.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Epoch milliseconds
     */
    virtual int64_t now_ms() const = 0;

    /**
     * @brief Block the calling thread for the given duration
     */
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;

    /**
     * @brief Current UTC date as YYYY-MM-DD
     */
    std::string today() const;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

/**
 * @brief Clock that only moves when told to
 *
 * sleep_for() advances the clock instead of blocking and records the
 * requested durations.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override {
        return now_.load(std::memory_order_acquire);
    }
    void sleep_for(std::chrono::milliseconds duration) override;

    void set(int64_t epoch_ms) {
        now_.store(epoch_ms, std::memory_order_release);
    }
    void advance(std::chrono::milliseconds duration) {
        now_.fetch_add(duration.count(), std::memory_order_acq_rel);
    }

    std::vector<std::chrono::milliseconds> sleeps() const;

private:
    std::atomic<int64_t> now_;
    mutable std::mutex sleeps_mutex_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace opd
