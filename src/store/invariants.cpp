#include <opd/store/invariants.hpp>

namespace opd {
namespace store {

std::vector<InvariantViolation> check_invariants(SlotStore& slots, TokenStore& tokens) {
    std::vector<InvariantViolation> violations;

    SlotQuery all;
    all.bookable_only = false;
    for (const Slot& slot : slots.query(all)) {
        std::vector<Token> in_slot = tokens.in_slot(slot.slot_id);

        int active = 0;
        int64_t previous = 0;
        for (const Token& token : in_slot) {
            if (token.is_active())
                active++;
            if (token.token_number <= previous) {
                violations.push_back({slot.slot_id, "token number " +
                                                        std::to_string(token.token_number) +
                                                        " is not strictly increasing"});
            }
            previous = token.token_number;
        }

        if (active != slot.current_allocation) {
            violations.push_back({slot.slot_id, "current_allocation " +
                                                    std::to_string(slot.current_allocation) +
                                                    " but " + std::to_string(active) +
                                                    " active tokens"});
        }
        if (slot.current_allocation > slot.max_capacity) {
            violations.push_back({slot.slot_id, "current_allocation " +
                                                    std::to_string(slot.current_allocation) +
                                                    " exceeds max_capacity " +
                                                    std::to_string(slot.max_capacity)});
        }
        if (previous != slot.last_token_number) {
            violations.push_back({slot.slot_id, "highest token number " +
                                                    std::to_string(previous) +
                                                    " differs from last_token_number " +
                                                    std::to_string(slot.last_token_number)});
        }
    }
    return violations;
}

} // namespace store
} // namespace opd
