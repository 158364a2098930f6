#pragma once

#include <opd/allocation/token_issuer.hpp>
#include <opd/capacity/slot_capacity_manager.hpp>
#include <opd/concurrency/concurrency_controller.hpp>
#include <opd/config/config.hpp>
#include <opd/core/records.hpp>
#include <opd/store/slot_store.hpp>
#include <opd/store/token_store.hpp>

#include <initializer_list>
#include <string>

namespace opd {
namespace allocation {

/**
 * @brief Status changes of an existing token
 *
 * allocated -> confirmed -> in_consultation -> completed, with cancel and
 * no-show allowed from allocated or confirmed. Each operation claims
 * "{op}:{token_id}" in the in-flight registry and runs in one transaction.
 * Leaving the counted set gives the seat back to the slot.
 *
 * @throws Error TOKEN_NOT_FOUND, TOKEN_ALREADY_PROCESSED from a terminal
 * status, INVALID_TOKEN_STATUS for any other illegal transition,
 * OPERATION_IN_PROGRESS
 */
class TokenLifecycle {
public:
    TokenLifecycle(store::SlotStore& slots, store::TokenStore& tokens,
                   capacity::SlotCapacityManager& capacity,
                   concurrency::ConcurrencyController& controller, config::ConfigView& config);

    Token confirm(const std::string& token_id, const std::string& actor_id,
                  const std::string& notes = {});
    Token start_consultation(const std::string& token_id, const std::string& actor_id);
    Token complete(const std::string& token_id, const std::string& actor_id,
                   const std::string& notes = {});
    Token cancel(const std::string& token_id, CancellationReason reason,
                 const std::string& cancelled_by);
    Token mark_no_show(const std::string& token_id, const std::string& actor_id,
                       const std::string& notes = {});

    /**
     * @brief Re-home a token in another slot
     *
     * @return the new token; the old one is cancelled as "moved" and points
     * at it
     * @throws Error SLOT_NOT_FOUND, SLOT_NOT_AVAILABLE,
     * SLOT_CAPACITY_EXCEEDED, SCHEDULING_CONFLICT when the patient already
     * holds a token there
     */
    Token move(const std::string& token_id, const std::string& new_slot_id,
               const std::string& actor_id);

private:
    Token transition(const char *operation, const std::string& token_id,
                     std::initializer_list<TokenStatus> allowed, TokenStatus target,
                     const std::string& actor_id, const std::string& notes,
                     const std::string& cancellation_reason);

    static void check_transition(const Token& token, const char *operation,
                                 std::initializer_list<TokenStatus> allowed);

    store::SlotStore& slots_;
    store::TokenStore& tokens_;
    concurrency::ConcurrencyController& controller_;
    config::ConfigView& config_;
    TokenIssuer issuer_;
};

} // namespace allocation
} // namespace opd
