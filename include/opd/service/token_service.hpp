#pragma once

#include <opd/allocation/token_allocator.hpp>
#include <opd/allocation/token_lifecycle.hpp>
#include <opd/capacity/slot_capacity_manager.hpp>
#include <opd/concurrency/concurrency_controller.hpp>
#include <opd/concurrency/in_flight.hpp>
#include <opd/config/config.hpp>
#include <opd/config/config_store.hpp>
#include <opd/core/clock.hpp>
#include <opd/store/database.hpp>
#include <opd/store/invariants.hpp>
#include <opd/store/slot_store.hpp>
#include <opd/store/token_store.hpp>

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace boost {
namespace asio {
class thread_pool;
}
} // namespace boost

namespace opd {
namespace service {

/**
 * @brief Everything the engine needs, wired over one database
 *
 * Owns the connection, the stores, the in-flight registry with its sweeper
 * and a worker pool for allocate_async(). The clock and configuration view
 * are injected; when no view is given a CachedConfigView over the
 * configurations table is used.
 */
class TokenService {
public:
    struct Options {
        std::string database_path = ":memory:";
        size_t worker_threads = 4;
        bool start_sweeper = true;
    };

    TokenService(Options options, std::shared_ptr<Clock> clock,
                 std::shared_ptr<config::ConfigView> config = nullptr);
    ~TokenService();

    TokenService(const TokenService&) = delete;
    TokenService& operator=(const TokenService&) = delete;

    Outcome allocate(const AllocationRequest& request) {
        return allocator_->allocate_token(request);
    }

    /**
     * @brief Run allocate() on the worker pool
     */
    std::future<Outcome> allocate_async(AllocationRequest request);

    Outcome emergency_insertion(const EmergencyRequest& request) {
        return allocator_->emergency_insertion(request);
    }

    BatchResult reallocate_batch(const ReallocationCriteria& criteria, const std::string& reason,
                                 const std::string& actor_id = {}) {
        return allocator_->reallocate_batch(criteria, reason, actor_id);
    }

    Token confirm(const std::string& token_id, const std::string& actor_id,
                  const std::string& notes = {}) {
        return lifecycle_->confirm(token_id, actor_id, notes);
    }
    Token start_consultation(const std::string& token_id, const std::string& actor_id) {
        return lifecycle_->start_consultation(token_id, actor_id);
    }
    Token complete(const std::string& token_id, const std::string& actor_id,
                   const std::string& notes = {}) {
        return lifecycle_->complete(token_id, actor_id, notes);
    }
    Token cancel(const std::string& token_id, CancellationReason reason,
                 const std::string& cancelled_by) {
        return lifecycle_->cancel(token_id, reason, cancelled_by);
    }
    Token mark_no_show(const std::string& token_id, const std::string& actor_id,
                       const std::string& notes = {}) {
        return lifecycle_->mark_no_show(token_id, actor_id, notes);
    }
    Token move(const std::string& token_id, const std::string& new_slot_id,
               const std::string& actor_id) {
        return lifecycle_->move(token_id, new_slot_id, actor_id);
    }

    Slot create_slot(const capacity::SlotSpec& spec) {
        return capacity_->create_slot(spec);
    }
    Slot change_slot_status(const std::string& slot_id, SlotStatus status) {
        return capacity_->change_slot_status(slot_id, status);
    }
    Slot change_capacity(const std::string& slot_id, int max_capacity, int emergency_reserved) {
        return capacity_->change_capacity(slot_id, max_capacity, emergency_reserved);
    }

    Slot slot(const std::string& slot_id) {
        return slots_.get(slot_id);
    }
    Token token(const std::string& token_id) {
        return tokens_.get(token_id);
    }
    std::vector<Token> tokens_in_slot(const std::string& slot_id) {
        return tokens_.in_slot(slot_id);
    }

    std::vector<store::InvariantViolation> check_invariants() {
        return store::check_invariants(slots_, tokens_);
    }

    store::Database& database() {
        return db_;
    }
    store::SlotStore& slots() {
        return slots_;
    }
    store::TokenStore& tokens() {
        return tokens_;
    }
    config::ConfigurationStore& configuration() {
        return configuration_;
    }
    config::ConfigView& config_view() {
        return *config_;
    }
    concurrency::InFlightRegistry& in_flight() {
        return in_flight_;
    }
    concurrency::ConcurrencyController& controller() {
        return controller_;
    }
    capacity::SlotCapacityManager& capacity() {
        return *capacity_;
    }
    allocation::TokenAllocator& allocator() {
        return *allocator_;
    }
    Clock& clock() {
        return *clock_;
    }

private:
    Options options_;
    std::shared_ptr<Clock> clock_;

    store::Database db_;
    store::SlotStore slots_;
    store::TokenStore tokens_;
    config::ConfigurationStore configuration_;
    std::shared_ptr<config::ConfigView> config_;

    concurrency::InFlightRegistry in_flight_;
    concurrency::ConcurrencyController controller_;
    std::unique_ptr<concurrency::InFlightSweeper> sweeper_;

    std::unique_ptr<capacity::SlotCapacityManager> capacity_;
    std::unique_ptr<allocation::TokenAllocator> allocator_;
    std::unique_ptr<allocation::TokenLifecycle> lifecycle_;

    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace service
} // namespace opd
