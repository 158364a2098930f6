#include <opd/concurrency/in_flight.hpp>

#include <opd/core/error.hpp>

#include "utils/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <vector>

namespace opd {
namespace concurrency {

uint64_t InFlightRegistry::claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t ticket = next_ticket_;
    if (!claims_.emplace(key, Claim{clock_.now_ms(), ticket}).second)
        return 0;
    ++next_ticket_;
    return ticket;
}

bool InFlightRegistry::try_acquire(const std::string& key) {
    return claim(key) != 0;
}

InFlightRegistry::Guard InFlightRegistry::acquire(const std::string& key) {
    uint64_t ticket = claim(key);
    if (ticket == 0) {
        throw Error(ErrorCode::OperationInProgress,
                    "An identical operation is already in progress", {{"operation_key", key}},
                    {"Wait for the running request to finish before retrying"});
    }
    return Guard(this, key, ticket);
}

void InFlightRegistry::release(const std::string& key, uint64_t ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(key);
    if (it != claims_.end() && it->second.ticket == ticket)
        claims_.erase(it);
}

bool InFlightRegistry::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claims_.count(key) != 0;
}

size_t InFlightRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claims_.size();
}

size_t InFlightRegistry::sweep(std::chrono::milliseconds max_age) {
    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t cutoff = clock_.now_ms() - max_age.count();
        for (auto it = claims_.begin(); it != claims_.end();) {
            if (it->second.started_at < cutoff) {
                stale.push_back(it->first);
                it = claims_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& key : stale)
        log_warn("Evicted stale in-flight operation ", key);
    return stale.size();
}

std::string InFlightRegistry::allocate_key(const std::string& slot_id,
                                           const std::string& patient_id) {
    return "allocate:" + slot_id + ":" + patient_id;
}

std::string InFlightRegistry::token_key(const std::string& operation,
                                        const std::string& token_id) {
    return operation + ":" + token_id;
}

std::string InFlightRegistry::move_key(const std::string& token_id, const std::string& slot_id) {
    return "move:" + token_id + ":" + slot_id;
}

// InFlightSweeper

struct InFlightSweeper::TimerState {
    explicit TimerState(boost::asio::io_context& io)
        : timer(io), work(boost::asio::make_work_guard(io)) {}

    boost::asio::steady_timer timer;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
};

InFlightSweeper::InFlightSweeper(InFlightRegistry& registry, std::chrono::milliseconds interval,
                                 std::chrono::milliseconds max_age)
    : registry_(registry), interval_(interval), max_age_(max_age) {}

InFlightSweeper::~InFlightSweeper() {
    stop();
}

void InFlightSweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire))
        return;

    io_context_ = std::make_unique<boost::asio::io_context>();
    timer_ = std::make_unique<TimerState>(*io_context_);
    running_.store(true, std::memory_order_release);
    schedule();

    thread_ = std::thread([this]() {
        set_thread_context("inflight-sweeper");
        io_context_->run();
    });
    log_debug("In-flight sweeper started, interval ", interval_.count(), "ms");
}

void InFlightSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel))
            return;
        if (timer_) {
            timer_->timer.cancel();
            timer_->work.reset();
        }
        if (io_context_)
            io_context_->stop();
    }

    if (thread_.joinable())
        thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    timer_.reset();
    io_context_.reset();
}

void InFlightSweeper::schedule() {
    timer_->timer.expires_after(interval_);
    timer_->timer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_.load(std::memory_order_acquire))
            return;
        sweeps_.fetch_add(1, std::memory_order_relaxed);
        size_t evicted = registry_.sweep(max_age_);
        if (evicted > 0)
            log_info("In-flight sweep evicted ", evicted, " stale operation(s)");
        schedule();
    });
}

} // namespace concurrency
} // namespace opd
