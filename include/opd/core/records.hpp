#pragma once

#include <opd/core/types.hpp>

#include <algorithm>
#include <cstdint>
#include <string>

namespace opd {

/**
 * @brief A doctor's timed consultation window on one UTC date
 */
struct Slot {
    std::string slot_id;
    std::string doctor_id;
    std::string date;        ///< YYYY-MM-DD
    std::string start_time;  ///< HH:MM
    std::string end_time;    ///< HH:MM
    std::string specialty;   ///< also serves as the department
    int max_capacity = 0;
    int current_allocation = 0;
    int emergency_reserved = 0;
    SlotStatus status = SlotStatus::Active;
    int64_t version = 0;
    int64_t last_token_number = 0;
    bool deleted = false;

    /**
     * @brief Seats usable by non-emergency arrivals
     */
    int regular_capacity() const {
        return std::max(0, max_capacity - emergency_reserved);
    }

    /**
     * @brief Remaining seats, optionally counting the emergency reserve
     */
    int available(bool use_emergency_reserve) const {
        int limit = use_emergency_reserve ? max_capacity : regular_capacity();
        return std::max(0, limit - current_allocation);
    }

    bool is_bookable() const {
        return status == SlotStatus::Active && !deleted;
    }
};

/**
 * @brief Bookkeeping carried by a token across preemption, moves and
 * batch reallocation
 */
struct TokenMetadata {
    std::string original_slot_id;   ///< slot the patient came from when moved
    std::string preempted_by;       ///< token that displaced this one
    UrgencyLevel urgency_level = UrgencyLevel::Normal;
    std::string reallocated_to;     ///< replacement token for a displaced or moved patient
    std::string reallocated_from;   ///< token this one replaces
    ReallocationStatus reallocation_status = ReallocationStatus::None;
    AllocationMethod allocation_method = AllocationMethod::Direct;
    int waiting_time = 0;           ///< minutes
    std::string cancellation_reason;
    std::string actor_id;
    std::string notes;
};

/**
 * @brief One patient's numbered claim on a slot
 */
struct Token {
    std::string token_id;
    std::string patient_id;
    std::string doctor_id;
    std::string slot_id;
    int64_t token_number = 0;
    TokenSource source = TokenSource::Online;
    int priority = 0;
    TokenStatus status = TokenStatus::Allocated;
    int64_t created_at = 0;  ///< epoch milliseconds
    int64_t updated_at = 0;
    int64_t version = 0;
    TokenMetadata metadata;

    bool is_active() const {
        return is_counted(status);
    }
};

} // namespace opd
