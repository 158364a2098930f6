#include <opd/service/token_service.hpp>

#include <opd/store/schema.hpp>

#include "utils/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>

namespace opd {
namespace service {

TokenService::TokenService(Options options, std::shared_ptr<Clock> clock,
                           std::shared_ptr<config::ConfigView> config)
    : options_(std::move(options)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()), slots_(db_),
      tokens_(db_), configuration_(db_), in_flight_(*clock_),
      controller_(db_, *clock_, in_flight_) {
    db_.open(options_.database_path);
    store::ensure_schema(db_);

    if (config) {
        config_ = std::move(config);
    } else {
        config_ = std::make_shared<config::CachedConfigView>(configuration_, *clock_);
    }
    auto snapshot = config_->snapshot();

    capacity_ = std::make_unique<capacity::SlotCapacityManager>(slots_, controller_, *config_);
    allocator_ = std::make_unique<allocation::TokenAllocator>(slots_, tokens_, *capacity_,
                                                              controller_, *config_);
    lifecycle_ = std::make_unique<allocation::TokenLifecycle>(slots_, tokens_, *capacity_,
                                                              controller_, *config_);

    if (options_.start_sweeper) {
        sweeper_ = std::make_unique<concurrency::InFlightSweeper>(
            in_flight_, snapshot->allocation.sweep_interval,
            snapshot->allocation.stale_operation_age);
        sweeper_->start();
    }

    size_t workers = std::max<size_t>(1, options_.worker_threads);
    pool_ = std::make_unique<boost::asio::thread_pool>(workers);

    log_info("Token service ready on ", options_.database_path, " (profile ",
             config::to_string(snapshot->profile), ", ", workers, " worker(s))");
}

TokenService::~TokenService() {
    if (pool_)
        pool_->join();
    if (sweeper_)
        sweeper_->stop();
    log_debug("Token service stopped");
}

std::future<Outcome> TokenService::allocate_async(AllocationRequest request) {
    auto task = std::make_shared<std::packaged_task<Outcome()>>(
        [this, request = std::move(request)]() {
            set_thread_context("alloc-worker");
            return allocator_->allocate_token(request);
        });
    auto future = task->get_future();
    boost::asio::post(*pool_, [task]() { (*task)(); });
    return future;
}

} // namespace service
} // namespace opd
