#include <opd/allocation/token_allocator.hpp>

#include "utils/logger.hpp"
#include "utils/time_utils.hpp"

#include <utility>

namespace opd {
namespace allocation {

using concurrency::InFlightRegistry;
using concurrency::OperationContext;

struct TokenAllocator::Placement {
    enum class Kind { Direct, Preempted, Full };

    Kind kind = Kind::Full;
    Token token;      ///< the new token (Direct, Preempted)
    Token displaced;  ///< the cancelled token (Preempted)
    Slot slot;        ///< the full slot (Full)
};

namespace {

void validate(const AllocationRequest& request) {
    std::map<std::string, std::string> details;
    std::vector<std::string> problems;
    auto problem = [&](const char *field, std::string message) {
        details[field] = message;
        problems.push_back(std::move(message));
    };

    if (request.patient_id.empty())
        problem("patient_id", "patient_id is required");
    if (request.slot_id.empty() && request.doctor_id.empty() && request.department.empty())
        problem("slot_id", "one of slot_id, doctor_id or department is required");
    if (request.waiting_time < 0)
        problem("waiting_time", "waiting_time must not be negative");
    if (!request.preferences.preferred_date.empty() &&
        !dates::parse_date(request.preferences.preferred_date))
        problem("preferred_date", "preferred_date must be YYYY-MM-DD");
    if (!request.preferences.preferred_time.empty() &&
        !dates::parse_time_of_day(request.preferences.preferred_time))
        problem("preferred_time", "preferred_time must be HH:MM");

    if (!problems.empty())
        throw Error(ErrorCode::ValidationError, "Invalid allocation request", details, problems);
}

Rejected rejected(const std::exception& error, const std::string& patient_id) {
    if (const auto *e = dynamic_cast<const Error *>(&error)) {
        log_info("Allocation for patient ", patient_id, " rejected: ", e->what());
        return Rejected{e->info()};
    }
    log_error("Allocation for patient ", patient_id, " failed: ", error.what());
    return Rejected{ErrorInfo::make(ErrorCode::InternalServerError, "Allocation failed",
                                    {{"patient_id", patient_id}, {"error", error.what()}},
                                    {"Retry the request later"})};
}

} // namespace

TokenAllocator::TokenAllocator(store::SlotStore& slots, store::TokenStore& tokens,
                               capacity::SlotCapacityManager& capacity,
                               concurrency::ConcurrencyController& controller,
                               config::ConfigView& config)
    : slots_(slots), tokens_(tokens), capacity_(capacity), controller_(controller),
      config_(config), finder_(slots), issuer_(tokens, capacity, controller.clock()) {}

Outcome TokenAllocator::allocate_token(const AllocationRequest& request) {
    auto config = config_.snapshot();
    try {
        return allocate(request, *config);
    } catch (const std::exception& e) {
        return rejected(e, request.patient_id);
    }
}

Outcome TokenAllocator::emergency_insertion(const EmergencyRequest& request) {
    auto config = config_.snapshot();
    try {
        if (request.urgency_level != UrgencyLevel::High &&
            request.urgency_level != UrgencyLevel::Emergency) {
            throw Error(ErrorCode::ValidationError, "Emergency urgency must be high or emergency",
                        {{"urgency_level", to_string(request.urgency_level)}});
        }

        AllocationRequest allocation;
        allocation.patient_id = request.patient_id;
        allocation.doctor_id = request.doctor_id;
        allocation.slot_id = request.preferred_slot_id;
        allocation.source = TokenSource::Emergency;
        allocation.patient = request.patient;
        allocation.urgency_level = request.urgency_level;
        allocation.allow_preemption = request.allow_preemption;
        allocation.actor_id = request.actor_id;

        if (allocation.slot_id.empty() && !allocation.doctor_id.empty()) {
            std::string today = controller_.clock().today();

            PatientInfo patient = request.patient;
            patient.urgency = request.urgency_level;
            int priority = priority::PriorityCalculator(config->priority)
                               .calculate(TokenSource::Emergency, patient, 0, request.doctor_id)
                               .final_priority;

            store::SlotQuery query;
            query.doctor_id = request.doctor_id;
            query.date_from = query.date_to = today;
            std::vector<Slot> slots = slots_.query(query);

            for (const Slot& slot : slots) {
                if (slot.available(true) > 0) {
                    allocation.slot_id = slot.slot_id;
                    break;
                }
            }
            if (allocation.slot_id.empty() && request.allow_preemption) {
                for (const Slot& slot : slots) {
                    if (choose_victim(slot.slot_id, priority, true,
                                      config->priority.preemption_threshold)) {
                        allocation.slot_id = slot.slot_id;
                        break;
                    }
                }
            }
            if (allocation.slot_id.empty())
                allocation.preferences.preferred_date = today;
        }

        log_info("Emergency insertion for patient ", request.patient_id, " (",
                 to_string(request.urgency_level), ") into ",
                 allocation.slot_id.empty() ? std::string("any slot") : allocation.slot_id);
        return allocate(allocation, *config);
    } catch (const std::exception& e) {
        return rejected(e, request.patient_id);
    }
}

Outcome TokenAllocator::allocate(const AllocationRequest& request,
                                 const config::ConfigSnapshot& config) {
    validate(request);
    const std::string today = controller_.clock().today();
    const bool emergency = request.source == TokenSource::Emergency;

    Slot slot;
    if (!request.slot_id.empty()) {
        slot = slots_.get(request.slot_id);
    } else if (auto resolved = finder_.resolve_target(request, today)) {
        slot = std::move(*resolved);
    } else {
        Alternatives alternatives;
        alternatives.alternatives =
            finder_.future_slots(request, today, config.allocation.max_alternatives);
        if (alternatives.alternatives.empty()) {
            throw Error(ErrorCode::SlotNotAvailable, "No slot is available for the request",
                        {{"doctor_id", request.doctor_id}, {"department", request.department}},
                        {"Try another doctor or department", "Try booking for a later date"});
        }
        alternatives.recommended_action = emergency ? "emergency_next_available" : "future_booking";
        alternatives.suggestions.push_back("No slot matches the preferred date; later slots "
                                           "have room");
        return alternatives;
    }

    if (!slot.is_bookable() || slot.date < today) {
        throw Error(ErrorCode::SlotNotAvailable,
                    "Slot '" + slot.slot_id + "' is not open for booking",
                    {{"slot_id", slot.slot_id},
                     {"status", to_string(slot.status)},
                     {"date", slot.date}},
                    {"Choose an active slot dated today or later"});
    }

    AllocationRequest effective = request;
    if (request.urgency_level)
        effective.patient.urgency = *request.urgency_level;
    auto score = priority::PriorityCalculator(config.priority)
                     .calculate(request.source, effective.patient, request.waiting_time,
                                slot.doctor_id);

    auto guard = controller_.in_flight().acquire(
        InFlightRegistry::allocate_key(slot.slot_id, request.patient_id));

    OperationContext context;
    context.operation = "allocate";
    context.key = guard.key();
    context.deadline_ms = controller_.deadline_after(config.allocation.soft_deadline);
    context.details = {{"slot_id", slot.slot_id}, {"patient_id", request.patient_id}};

    Placement placement = controller_.execute_transaction(
        [&](int) { return place(effective, slot.slot_id, score, config); }, context,
        config.retry);

    switch (placement.kind) {
    case Placement::Kind::Direct:
        log_info("Allocated token #", placement.token.token_number, " in ", slot.slot_id,
                 " to patient ", request.patient_id, " (priority ", score.final_priority, ")");
        return Allocated{placement.token, AllocationMethod::Direct, {}};

    case Placement::Kind::Preempted: {
        log_info("Allocated token #", placement.token.token_number, " in ", slot.slot_id,
                 " to patient ", request.patient_id, " (priority ", score.final_priority,
                 ") by preempting ", placement.displaced.token_id, " (priority ",
                 placement.displaced.priority, ")");
        Allocated allocated{placement.token, AllocationMethod::Preemption, {}};
        allocated.preempted_tokens.push_back(
            reallocate_displaced(placement.displaced, config, context));
        return allocated;
    }

    case Placement::Kind::Full:
        break;
    }

    Alternatives alternatives =
        finder_.find_alternatives(placement.slot, request.source, config, today);
    if (alternatives.alternatives.empty()) {
        throw Error(ErrorCode::SlotCapacityExceeded,
                    "Slot '" + slot.slot_id + "' is full and no alternative is available",
                    {{"slot_id", slot.slot_id},
                     {"current_allocation", std::to_string(placement.slot.current_allocation)},
                     {"max_capacity", std::to_string(placement.slot.max_capacity)},
                     {"recommended_action", alternatives.recommended_action}},
                    alternatives.suggestions);
    }
    log_debug("Slot ", slot.slot_id, " full, offering ", alternatives.alternatives.size(),
              " alternative(s) (", alternatives.recommended_action, ")");
    return alternatives;
}

TokenAllocator::Placement TokenAllocator::place(const AllocationRequest& request,
                                                const std::string& slot_id,
                                                const priority::PriorityScore& score,
                                                const config::ConfigSnapshot& config) {
    Slot slot = slots_.get(slot_id);
    if (!slot.is_bookable()) {
        throw Error(ErrorCode::SlotNotAvailable, "Slot '" + slot_id + "' is not open for booking",
                    {{"slot_id", slot_id}, {"status", to_string(slot.status)}});
    }
    if (auto existing = tokens_.find_active_for_patient(slot_id, request.patient_id)) {
        throw Error(ErrorCode::SchedulingConflict,
                    "Patient '" + request.patient_id + "' already holds token #" +
                        std::to_string(existing->token_number) + " in slot '" + slot_id + "'",
                    {{"slot_id", slot_id},
                     {"patient_id", request.patient_id},
                     {"token_id", existing->token_id}},
                    {"Use the existing token or cancel it first"});
    }

    const bool emergency = request.source == TokenSource::Emergency;

    Token draft;
    draft.token_id = TokenIssuer::new_token_id();
    draft.patient_id = request.patient_id;
    draft.source = request.source;
    draft.priority = score.final_priority;
    draft.metadata.urgency_level = request.patient.urgency;
    draft.metadata.waiting_time = request.waiting_time;
    draft.metadata.actor_id = request.actor_id;

    Placement placement;
    if (slot.available(emergency) > 0) {
        draft.metadata.allocation_method = AllocationMethod::Direct;
        placement.kind = Placement::Kind::Direct;
        placement.token = issuer_.issue(std::move(draft), slot, emergency);
        return placement;
    }

    if (request.allow_preemption) {
        auto victim = choose_victim(slot_id, score.final_priority, emergency,
                                    config.priority.preemption_threshold);
        if (victim) {
            Token displaced = std::move(*victim);
            displaced.status = TokenStatus::Cancelled;
            displaced.updated_at = controller_.clock().now_ms();
            displaced.metadata.preempted_by = draft.token_id;
            displaced.metadata.reallocation_status = ReallocationStatus::Pending;
            displaced.metadata.cancellation_reason = to_string(CancellationReason::Preempted);
            if (!request.actor_id.empty())
                displaced.metadata.actor_id = request.actor_id;
            tokens_.save(displaced);

            draft.metadata.allocation_method = AllocationMethod::Preemption;
            placement.kind = Placement::Kind::Preempted;
            placement.token = issuer_.issue_in_place(std::move(draft), slot,
                                                     slot.current_allocation);
            placement.displaced = std::move(displaced);
            return placement;
        }
    }

    placement.slot = std::move(slot);
    return placement;
}

std::optional<Token> TokenAllocator::choose_victim(const std::string& slot_id, int priority,
                                                   bool emergency_request, int threshold) {
    for (Token& token : tokens_.active_in_slot(slot_id)) {
        if (!is_preemptable(token.status))
            continue;
        if (!emergency_request && token.source == TokenSource::Emergency)
            continue;
        if (priority - token.priority > threshold)
            return std::move(token);
    }
    return std::nullopt;
}

PreemptedToken TokenAllocator::reallocate_displaced(const Token& displaced,
                                                    const config::ConfigSnapshot& config,
                                                    const OperationContext& parent) {
    PreemptedToken result;
    result.token = displaced;
    result.reallocation_status = ReallocationStatus::Pending;

    try {
        Slot original = slots_.get(displaced.slot_id);
        auto candidates = finder_.reallocation_candidates(
            original, displaced.source == TokenSource::Emergency, config, {},
            controller_.clock().today());

        OperationContext context = parent;
        context.operation = "reallocate";
        context.details["token_id"] = displaced.token_id;

        auto replacement = controller_.execute_transaction(
            [&](int) {
                return relocate(displaced.token_id, candidates, AllocationMethod::Reallocation,
                                to_string(CancellationReason::Preempted), {});
            },
            context, config.retry);

        if (!replacement) {
            log_warn("No slot could take displaced token ", displaced.token_id,
                     "; left pending reallocation");
            return result;
        }

        result.token = tokens_.get(displaced.token_id);
        result.reallocation_status = ReallocationStatus::Reallocated;
        result.replacement = std::move(replacement);
        log_info("Displaced token ", displaced.token_id, " reallocated to ",
                 result.replacement->slot_id, " as #", result.replacement->token_number);
    } catch (const std::exception& e) {
        log_error("Reallocation of displaced token ", displaced.token_id,
                  " failed; left pending: ", e.what());
    }
    return result;
}

std::optional<Token> TokenAllocator::relocate(const std::string& token_id,
                                              const std::vector<Slot>& candidates,
                                              AllocationMethod method, const std::string& reason,
                                              const std::string& actor_id) {
    Token original = tokens_.get(token_id);
    const bool emergency = original.source == TokenSource::Emergency;

    for (const Slot& candidate : candidates) {
        auto slot = slots_.load(candidate.slot_id);
        if (!slot || !slot->is_bookable() || slot->available(emergency) <= 0)
            continue;
        if (tokens_.find_active_for_patient(slot->slot_id, original.patient_id))
            continue;

        Token replacement =
            issuer_.issue(issuer_.replacement_draft(original, method, actor_id), *slot, emergency);
        issuer_.retire(std::move(original), replacement.token_id, reason, actor_id);
        return replacement;
    }
    return std::nullopt;
}

void TokenAllocator::mark_pending(const std::string& token_id,
                                  const config::ConfigSnapshot& config) {
    OperationContext context;
    context.operation = "mark_pending";
    context.details = {{"token_id", token_id}};
    try {
        controller_.update_with_optimistic_lock(
            tokens_, token_id,
            [&](Token& token) {
                if (token.is_active()) {
                    token.metadata.reallocation_status = ReallocationStatus::Pending;
                    token.updated_at = controller_.clock().now_ms();
                }
            },
            context, config.retry);
    } catch (const Error& e) {
        log_warn("Could not mark token ", token_id, " pending reallocation: ", e.what());
    }
}

BatchResult TokenAllocator::reallocate_batch(const ReallocationCriteria& criteria,
                                             const std::string& reason,
                                             const std::string& actor_id) {
    auto config = config_.snapshot();
    const std::string today = controller_.clock().today();

    store::TokenQuery query;
    query.doctor_id = criteria.doctor_id;
    query.slot_id = criteria.slot_id;
    query.date_from = criteria.date_from;
    query.date_to = criteria.date_to;
    query.statuses = criteria.statuses;
    if (query.statuses.empty())
        query.statuses = {TokenStatus::Allocated, TokenStatus::Confirmed};
    std::vector<Token> matched = tokens_.query(query);

    // Targets never include a slot the batch is emptying.
    std::set<std::string> excluded;
    if (!criteria.slot_id.empty()) {
        excluded.insert(criteria.slot_id);
    } else if (!criteria.doctor_id.empty() || !criteria.date_from.empty() ||
               !criteria.date_to.empty()) {
        store::SlotQuery slot_query;
        slot_query.doctor_id = criteria.doctor_id;
        slot_query.date_from = criteria.date_from;
        slot_query.date_to = criteria.date_to;
        slot_query.bookable_only = false;
        for (const Slot& slot : slots_.query(slot_query))
            excluded.insert(slot.slot_id);
    }
    for (const Token& token : matched)
        excluded.insert(token.slot_id);

    log_info("Batch reallocation of ", matched.size(), " token(s), reason: ", reason);

    BatchResult result;
    for (const Token& token : matched) {
        try {
            auto guard = controller_.in_flight().acquire(
                InFlightRegistry::token_key("reallocate", token.token_id));

            Slot original = slots_.get(token.slot_id);
            auto candidates = finder_.reallocation_candidates(
                original, token.source == TokenSource::Emergency, *config, excluded, today);

            OperationContext context;
            context.operation = "reallocate_batch";
            context.key = guard.key();
            context.deadline_ms = controller_.deadline_after(config->allocation.soft_deadline);
            context.details = {{"token_id", token.token_id}};

            auto replacement = controller_.execute_transaction(
                [&](int) -> std::optional<Token> {
                    Token current = tokens_.get(token.token_id);
                    if (!current.is_active() || current.status == TokenStatus::InConsultation) {
                        throw Error(ErrorCode::InvalidTokenStatus,
                                    "Token '" + token.token_id + "' is " +
                                        to_string(current.status),
                                    {{"token_id", token.token_id},
                                     {"status", to_string(current.status)}});
                    }
                    return relocate(token.token_id, candidates, AllocationMethod::Reallocation,
                                    reason, actor_id);
                },
                context, config->retry);

            if (replacement) {
                result.relocated.push_back({tokens_.get(token.token_id), std::move(*replacement)});
                continue;
            }

            mark_pending(token.token_id, *config);
            result.failed.push_back(
                {tokens_.load(token.token_id).value_or(token),
                 ErrorInfo::make(ErrorCode::SlotNotAvailable,
                                 "No slot with free capacity for token '" + token.token_id + "'",
                                 {{"token_id", token.token_id}, {"slot_id", token.slot_id}},
                                 {"Reallocate the token once capacity frees up"})});
        } catch (const Error& e) {
            if (e.code() != ErrorCode::InvalidTokenStatus)
                mark_pending(token.token_id, *config);
            result.failed.push_back({tokens_.load(token.token_id).value_or(token), e.info()});
        }
    }

    log_info("Batch reallocation done: ", result.relocated.size(), " moved, ",
             result.failed.size(), " pending");
    return result;
}

} // namespace allocation
} // namespace opd
