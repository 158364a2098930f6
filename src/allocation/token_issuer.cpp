#include <opd/allocation/token_issuer.hpp>

#include "utils/logger.hpp"
#include "utils/random_utils.hpp"

namespace opd {
namespace allocation {

std::string TokenIssuer::new_token_id() {
    return generate_id("tok");
}

Token TokenIssuer::finish(Token draft, const Slot& slot, int64_t token_number) {
    int64_t now = clock_.now_ms();
    if (draft.token_id.empty())
        draft.token_id = new_token_id();
    draft.slot_id = slot.slot_id;
    draft.doctor_id = slot.doctor_id;
    draft.token_number = token_number;
    draft.status = TokenStatus::Allocated;
    draft.created_at = now;
    draft.updated_at = now;
    draft.version = 0;
    tokens_.insert(draft);
    return draft;
}

Token TokenIssuer::issue(Token draft, const Slot& slot, bool use_emergency_reserve) {
    auto reservation = capacity_.reserve_capacity(slot.slot_id, use_emergency_reserve);
    return finish(std::move(draft), reservation.slot, reservation.token_number);
}

Token TokenIssuer::issue_in_place(Token draft, const Slot& slot, int reserved_count) {
    auto reservation = capacity_.swap_within_slot(slot.slot_id, reserved_count);
    return finish(std::move(draft), reservation.slot, reservation.token_number);
}

Token TokenIssuer::replacement_draft(const Token& original, AllocationMethod method,
                                     const std::string& actor_id) const {
    Token draft;
    draft.patient_id = original.patient_id;
    draft.source = original.source;
    draft.priority = original.priority;
    draft.metadata.urgency_level = original.metadata.urgency_level;
    draft.metadata.waiting_time = original.metadata.waiting_time;
    draft.metadata.original_slot_id = original.slot_id;
    draft.metadata.reallocated_from = original.token_id;
    draft.metadata.allocation_method = method;
    draft.metadata.actor_id = actor_id;
    return draft;
}

Token TokenIssuer::retire(Token original, const std::string& replacement_id,
                          const std::string& reason, const std::string& actor_id) {
    bool counted = original.is_active();

    original.status = TokenStatus::Cancelled;
    original.updated_at = clock_.now_ms();
    original.metadata.reallocated_to = replacement_id;
    original.metadata.reallocation_status = ReallocationStatus::Reallocated;
    original.metadata.cancellation_reason = reason;
    if (!actor_id.empty())
        original.metadata.actor_id = actor_id;
    tokens_.save(original);

    if (counted)
        capacity_.release_capacity(original.slot_id);
    return original;
}

Token TokenIssuer::transition(Token token, TokenStatus status, const std::string& actor_id) {
    bool counted = token.is_active();

    token.status = status;
    token.updated_at = clock_.now_ms();
    if (!actor_id.empty())
        token.metadata.actor_id = actor_id;
    tokens_.save(token);

    if (counted && !is_counted(status))
        capacity_.release_capacity(token.slot_id);

    log_debug("Token ", token.token_id, " is now ", to_string(status));
    return token;
}

} // namespace allocation
} // namespace opd
