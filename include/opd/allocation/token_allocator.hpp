#pragma once

#include <opd/allocation/slot_finder.hpp>
#include <opd/allocation/token_issuer.hpp>
#include <opd/capacity/slot_capacity_manager.hpp>
#include <opd/concurrency/concurrency_controller.hpp>
#include <opd/config/config.hpp>
#include <opd/core/outcome.hpp>
#include <opd/core/request.hpp>
#include <opd/priority/priority_calculator.hpp>
#include <opd/store/slot_store.hpp>
#include <opd/store/token_store.hpp>

#include <optional>
#include <set>
#include <string>

namespace opd {
namespace allocation {

/**
 * @brief Places patients into slots: direct allocation, preemption of
 * lower-priority tokens and reallocation of displaced ones
 *
 * allocate_token() and emergency_insertion() never throw for request or
 * store failures; they report them as a Rejected outcome.
 */
class TokenAllocator {
public:
    TokenAllocator(store::SlotStore& slots, store::TokenStore& tokens,
                   capacity::SlotCapacityManager& capacity,
                   concurrency::ConcurrencyController& controller, config::ConfigView& config);

    Outcome allocate_token(const AllocationRequest& request);

    /**
     * @brief Place an emergency arrival, scanning the doctor's slots for
     * today when no slot is preferred
     */
    Outcome emergency_insertion(const EmergencyRequest& request);

    /**
     * @brief Move every token matching @p criteria to another slot,
     * highest priority first
     *
     * Each token moves in its own transaction. A token that cannot move
     * stays where it is, marked as pending reallocation.
     */
    BatchResult reallocate_batch(const ReallocationCriteria& criteria, const std::string& reason,
                                 const std::string& actor_id = {});

    const SlotFinder& finder() const {
        return finder_;
    }

private:
    struct Placement;

    Outcome allocate(const AllocationRequest& request, const config::ConfigSnapshot& config);
    Placement place(const AllocationRequest& request, const std::string& slot_id,
                    const priority::PriorityScore& score, const config::ConfigSnapshot& config);
    std::optional<Token> choose_victim(const std::string& slot_id, int priority,
                                       bool emergency_request, int threshold);
    PreemptedToken reallocate_displaced(const Token& displaced,
                                        const config::ConfigSnapshot& config,
                                        const concurrency::OperationContext& parent);
    std::optional<Token> relocate(const std::string& token_id, const std::vector<Slot>& candidates,
                                  AllocationMethod method, const std::string& reason,
                                  const std::string& actor_id);
    void mark_pending(const std::string& token_id, const config::ConfigSnapshot& config);

    store::SlotStore& slots_;
    store::TokenStore& tokens_;
    capacity::SlotCapacityManager& capacity_;
    concurrency::ConcurrencyController& controller_;
    config::ConfigView& config_;
    SlotFinder finder_;
    TokenIssuer issuer_;
};

} // namespace allocation
} // namespace opd
