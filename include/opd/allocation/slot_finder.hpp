#pragma once

#include <opd/config/config.hpp>
#include <opd/core/outcome.hpp>
#include <opd/core/request.hpp>
#include <opd/store/slot_store.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opd {
namespace allocation {

/**
 * @brief Read-only slot searches behind target resolution, alternatives and
 * reallocation
 *
 * Every search runs outside a transaction on committed data; callers
 * re-check capacity when they write.
 */
class SlotFinder {
public:
    explicit SlotFinder(store::SlotStore& slots) : slots_(slots) {}

    /**
     * @brief Pick a slot for a request that names a doctor or department
     * but no slot
     *
     * Only bookable slots dated @p today or later (the preferred date when
     * given) with room for the request's source are considered. Follow-ups
     * prefer their last doctor, then earliest date, slots starting at or
     * after the preferred time, earliest start, and most free seats.
     */
    std::optional<Slot> resolve_target(const AllocationRequest& request,
                                       const std::string& today) const;

    /**
     * @brief Bookable slots with room for the request's doctor or
     * department from @p today on, earliest first, ignoring date and time
     * preferences
     */
    std::vector<AlternativeSlot> future_slots(const AllocationRequest& request,
                                              const std::string& today, size_t limit) const;

    /**
     * @brief Offers for a request whose slot is full
     *
     * Searches other doctors of the same department on the same day, the
     * same doctor over the following days and the department over the next
     * few days. The recommended action names the first non-empty group;
     * emergencies get the "emergency_" variants. An empty alternatives list
     * means nothing was found.
     */
    Alternatives find_alternatives(const Slot& requested, TokenSource source,
                                   const config::ConfigSnapshot& config,
                                   const std::string& today) const;

    /**
     * @brief Slots that could take a token displaced from @p original, in
     * the configured tier order, at most allocation.reallocation_candidates
     */
    std::vector<Slot> reallocation_candidates(const Slot& original, bool use_emergency_reserve,
                                              const config::ConfigSnapshot& config,
                                              const std::set<std::string>& excluded,
                                              const std::string& today) const;

private:
    std::vector<Slot> open_slots(const store::SlotQuery& query, bool use_emergency_reserve) const;

    store::SlotStore& slots_;
};

} // namespace allocation
} // namespace opd
