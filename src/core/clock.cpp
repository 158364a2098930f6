#include <opd/core/clock.hpp>

#include "utils/time_utils.hpp"

#include <thread>

namespace opd {

std::string Clock::today() const {
    return dates::format_date(now_ms());
}

int64_t SystemClock::now_ms() const {
    return static_cast<int64_t>(get_now());
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0)
        std::this_thread::sleep_for(duration);
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
    {
        std::lock_guard<std::mutex> lock(sleeps_mutex_);
        sleeps_.push_back(duration);
    }
    advance(duration);
}

std::vector<std::chrono::milliseconds> ManualClock::sleeps() const {
    std::lock_guard<std::mutex> lock(sleeps_mutex_);
    return sleeps_;
}

} // namespace opd
