#pragma once

#include <opd/capacity/slot_capacity_manager.hpp>
#include <opd/core/clock.hpp>
#include <opd/core/records.hpp>
#include <opd/store/token_store.hpp>

#include <string>

namespace opd {
namespace allocation {

/**
 * @brief Writes new tokens and retires old ones together with the slot
 * counter changes they imply
 *
 * Every method expects to run inside a store transaction opened by the
 * caller.
 */
class TokenIssuer {
public:
    TokenIssuer(store::TokenStore& tokens, capacity::SlotCapacityManager& capacity,
                const Clock& clock)
        : tokens_(tokens), capacity_(capacity), clock_(clock) {}

    static std::string new_token_id();

    /**
     * @brief Reserve a seat in @p slot and insert @p draft with the issued
     * number
     *
     * The draft supplies patient, source, priority and metadata; slot,
     * doctor, number, status and timestamps are filled in here.
     */
    Token issue(Token draft, const Slot& slot, bool use_emergency_reserve);

    /**
     * @brief Insert @p draft on a seat freed in the same transaction
     */
    Token issue_in_place(Token draft, const Slot& slot, int reserved_count);

    /**
     * @brief Draft of a token carrying @p original's patient, source and
     * priority into another slot
     */
    Token replacement_draft(const Token& original, AllocationMethod method,
                            const std::string& actor_id) const;

    /**
     * @brief Cancel @p original as relocated to @p replacement_id and give
     * back its seat
     */
    Token retire(Token original, const std::string& replacement_id, const std::string& reason,
                 const std::string& actor_id);

    /**
     * @brief Move @p token to @p status, releasing its seat when it leaves
     * the counted set
     */
    Token transition(Token token, TokenStatus status, const std::string& actor_id);

private:
    Token finish(Token draft, const Slot& slot, int64_t token_number);

    store::TokenStore& tokens_;
    capacity::SlotCapacityManager& capacity_;
    const Clock& clock_;
};

} // namespace allocation
} // namespace opd
