#pragma once

#include <opd/core/error.hpp>
#include <opd/core/records.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace opd {

/**
 * @brief A token displaced by a preemption and what became of it
 */
struct PreemptedToken {
    Token token;                                  ///< the cancelled token
    ReallocationStatus reallocation_status = ReallocationStatus::Pending;
    std::optional<Token> replacement;             ///< set when reallocated
};

struct Allocated {
    Token token;
    AllocationMethod allocation_method = AllocationMethod::Direct;
    std::vector<PreemptedToken> preempted_tokens;
};

/**
 * @brief A slot offered instead of the one that could not be used
 */
struct AlternativeSlot {
    Slot slot;
    int available = 0;
    std::string reason;  ///< same_department_today, same_doctor_future, future_booking
};

struct Alternatives {
    std::optional<Slot> requested_slot;
    std::vector<AlternativeSlot> alternatives;
    std::string recommended_action;
    std::vector<std::string> suggestions;
};

struct Rejected {
    ErrorInfo error;
};

/**
 * @brief Result of an allocation attempt
 */
using Outcome = std::variant<Allocated, Alternatives, Rejected>;

inline bool is_allocated(const Outcome& outcome) {
    return std::holds_alternative<Allocated>(outcome);
}

inline bool is_rejected(const Outcome& outcome, ErrorCode code) {
    const auto *rejected = std::get_if<Rejected>(&outcome);
    return rejected != nullptr && rejected->error.code == code;
}

/**
 * @brief Per-token result of a batch reallocation
 */
struct RelocatedToken {
    Token original;
    Token replacement;
};

struct FailedRelocation {
    Token token;
    ErrorInfo error;
};

struct BatchResult {
    std::vector<RelocatedToken> relocated;
    std::vector<FailedRelocation> failed;
};

} // namespace opd
