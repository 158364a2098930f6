#include <opd/allocation/token_lifecycle.hpp>

#include "utils/logger.hpp"

#include <algorithm>

namespace opd {
namespace allocation {

using concurrency::InFlightRegistry;
using concurrency::OperationContext;

TokenLifecycle::TokenLifecycle(store::SlotStore& slots, store::TokenStore& tokens,
                               capacity::SlotCapacityManager& capacity,
                               concurrency::ConcurrencyController& controller,
                               config::ConfigView& config)
    : slots_(slots), tokens_(tokens), controller_(controller), config_(config),
      issuer_(tokens, capacity, controller.clock()) {}

void TokenLifecycle::check_transition(const Token& token, const char *operation,
                                      std::initializer_list<TokenStatus> allowed) {
    if (std::find(allowed.begin(), allowed.end(), token.status) != allowed.end())
        return;

    std::map<std::string, std::string> details = {{"token_id", token.token_id},
                                                  {"status", to_string(token.status)},
                                                  {"operation", operation}};
    if (is_terminal(token.status)) {
        throw Error(ErrorCode::TokenAlreadyProcessed,
                    "Token '" + token.token_id + "' is already " + to_string(token.status),
                    details);
    }
    throw Error(ErrorCode::InvalidTokenStatus,
                std::string("Cannot ") + operation + " token '" + token.token_id + "' while " +
                    to_string(token.status),
                details);
}

Token TokenLifecycle::transition(const char *operation, const std::string& token_id,
                                 std::initializer_list<TokenStatus> allowed, TokenStatus target,
                                 const std::string& actor_id, const std::string& notes,
                                 const std::string& cancellation_reason) {
    auto config = config_.snapshot();
    auto guard = controller_.in_flight().acquire(InFlightRegistry::token_key(operation, token_id));

    OperationContext context;
    context.operation = operation;
    context.key = guard.key();
    context.deadline_ms = controller_.deadline_after(config->allocation.soft_deadline);
    context.details = {{"token_id", token_id}};

    Token token = controller_.execute_transaction(
        [&](int) {
            Token current = tokens_.get(token_id);
            check_transition(current, operation, allowed);
            if (!notes.empty())
                current.metadata.notes = notes;
            if (!cancellation_reason.empty())
                current.metadata.cancellation_reason = cancellation_reason;
            return issuer_.transition(std::move(current), target, actor_id);
        },
        context, config->retry);

    log_info("Token ", token_id, " ", operation, " -> ", to_string(target),
             actor_id.empty() ? std::string() : " by " + actor_id);
    return token;
}

Token TokenLifecycle::confirm(const std::string& token_id, const std::string& actor_id,
                              const std::string& notes) {
    return transition("confirm", token_id, {TokenStatus::Allocated}, TokenStatus::Confirmed,
                      actor_id, notes, {});
}

Token TokenLifecycle::start_consultation(const std::string& token_id,
                                         const std::string& actor_id) {
    return transition("start", token_id, {TokenStatus::Confirmed}, TokenStatus::InConsultation,
                      actor_id, {}, {});
}

Token TokenLifecycle::complete(const std::string& token_id, const std::string& actor_id,
                               const std::string& notes) {
    return transition("complete", token_id, {TokenStatus::InConsultation},
                      TokenStatus::Completed, actor_id, notes, {});
}

Token TokenLifecycle::cancel(const std::string& token_id, CancellationReason reason,
                             const std::string& cancelled_by) {
    return transition("cancel", token_id, {TokenStatus::Allocated, TokenStatus::Confirmed},
                      TokenStatus::Cancelled, cancelled_by, {}, to_string(reason));
}

Token TokenLifecycle::mark_no_show(const std::string& token_id, const std::string& actor_id,
                                   const std::string& notes) {
    return transition("noshow", token_id, {TokenStatus::Allocated, TokenStatus::Confirmed},
                      TokenStatus::NoShow, actor_id, notes, {});
}

Token TokenLifecycle::move(const std::string& token_id, const std::string& new_slot_id,
                           const std::string& actor_id) {
    auto config = config_.snapshot();
    auto guard =
        controller_.in_flight().acquire(InFlightRegistry::move_key(token_id, new_slot_id));

    OperationContext context;
    context.operation = "move";
    context.key = guard.key();
    context.deadline_ms = controller_.deadline_after(config->allocation.soft_deadline);
    context.details = {{"token_id", token_id}, {"slot_id", new_slot_id}};

    Token moved = controller_.execute_transaction(
        [&](int) {
            Token original = tokens_.get(token_id);
            check_transition(original, "move", {TokenStatus::Allocated, TokenStatus::Confirmed});

            if (original.slot_id == new_slot_id) {
                throw Error(ErrorCode::ValidationError, "Token is already in the target slot",
                            {{"token_id", token_id}, {"slot_id", new_slot_id}});
            }

            Slot target = slots_.get(new_slot_id);
            if (!target.is_bookable() || target.date < controller_.clock().today()) {
                throw Error(ErrorCode::SlotNotAvailable,
                            "Slot '" + new_slot_id + "' is not open for booking",
                            {{"slot_id", new_slot_id}, {"status", to_string(target.status)}});
            }
            if (auto existing = tokens_.find_active_for_patient(new_slot_id, original.patient_id)) {
                throw Error(ErrorCode::SchedulingConflict,
                            "Patient already holds a token in slot '" + new_slot_id + "'",
                            {{"slot_id", new_slot_id}, {"token_id", existing->token_id}});
            }

            const bool emergency = original.source == TokenSource::Emergency;
            Token replacement = issuer_.issue(
                issuer_.replacement_draft(original, AllocationMethod::Reallocation, actor_id),
                target, emergency);
            issuer_.retire(std::move(original), replacement.token_id,
                           to_string(CancellationReason::Moved), actor_id);
            return replacement;
        },
        context, config->retry);

    log_info("Token ", token_id, " moved to ", new_slot_id, " as ", moved.token_id, " (#",
             moved.token_number, ")");
    return moved;
}

} // namespace allocation
} // namespace opd
