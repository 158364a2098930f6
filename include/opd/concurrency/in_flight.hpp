#pragma once

#include <opd/core/clock.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace boost {
namespace asio {
class io_context;
}
} // namespace boost

namespace opd {
namespace concurrency {

/**
 * @brief Process-local map of operations currently running
 *
 * Keys name the operation and its target, e.g. "allocate:{slot}:{patient}",
 * "cancel:{token}" or "move:{token}:{slot}". A second operation with the
 * same key is refused until the first releases it.
 */
class InFlightRegistry {
public:
    explicit InFlightRegistry(const Clock& clock) : clock_(clock) {}

    /**
     * @brief RAII ownership of one key
     *
     * A guard only releases the claim it made. If its key was swept and
     * claimed again, the newer claim survives the old guard.
     */
    class Guard {
    public:
        Guard() = default;
        Guard(InFlightRegistry *registry, std::string key, uint64_t ticket)
            : registry_(registry), key_(std::move(key)), ticket_(ticket) {}
        ~Guard() {
            release();
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept
            : registry_(other.registry_), key_(std::move(other.key_)), ticket_(other.ticket_) {
            other.registry_ = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                registry_ = other.registry_;
                key_ = std::move(other.key_);
                ticket_ = other.ticket_;
                other.registry_ = nullptr;
            }
            return *this;
        }

        void release() {
            if (registry_) {
                registry_->release(key_, ticket_);
                registry_ = nullptr;
            }
        }

        const std::string& key() const {
            return key_;
        }

    private:
        InFlightRegistry *registry_ = nullptr;
        std::string key_;
        uint64_t ticket_ = 0;
    };

    /**
     * @brief Claim a key
     * @return false when the key is already held
     */
    bool try_acquire(const std::string& key);

    /**
     * @brief Claim a key or throw OPERATION_IN_PROGRESS
     */
    Guard acquire(const std::string& key);

    bool contains(const std::string& key) const;
    size_t size() const;

    /**
     * @brief Drop keys held for longer than @p max_age
     * @return number of keys dropped
     */
    size_t sweep(std::chrono::milliseconds max_age);

    static std::string allocate_key(const std::string& slot_id, const std::string& patient_id);
    static std::string token_key(const std::string& operation, const std::string& token_id);
    static std::string move_key(const std::string& token_id, const std::string& slot_id);

private:
    struct Claim {
        int64_t started_at;
        uint64_t ticket;
    };

    /// @return the ticket of a new claim, or 0 when the key is held
    uint64_t claim(const std::string& key);
    void release(const std::string& key, uint64_t ticket);

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Claim> claims_;
    uint64_t next_ticket_ = 1;
};

/**
 * @brief Periodically evicts stale in-flight keys on a private Asio timer
 * thread
 */
class InFlightSweeper {
public:
    InFlightSweeper(InFlightRegistry& registry, std::chrono::milliseconds interval,
                    std::chrono::milliseconds max_age);
    ~InFlightSweeper();

    InFlightSweeper(const InFlightSweeper&) = delete;
    InFlightSweeper& operator=(const InFlightSweeper&) = delete;

    void start();
    void stop();

    bool running() const {
        return running_.load(std::memory_order_acquire);
    }

    uint64_t sweeps() const {
        return sweeps_.load(std::memory_order_relaxed);
    }

private:
    struct TimerState;

    void schedule();

    InFlightRegistry& registry_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds max_age_;

    std::mutex mutex_;
    std::unique_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<TimerState> timer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sweeps_{0};
};

} // namespace concurrency
} // namespace opd
