#pragma once

#include <opd/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace opd {

/**
 * @brief Patient attributes that feed the priority calculation
 */
struct PatientInfo {
    std::optional<int> age;
    bool critical = false;            ///< medical history flags a critical condition
    bool chronic = false;             ///< medical history flags a chronic condition
    UrgencyLevel urgency = UrgencyLevel::Normal;
    bool is_followup = false;
    std::string last_visited_doctor;
    bool pregnancy = false;
    bool disability = false;
};

struct AllocationPreferences {
    std::string preferred_date;  ///< YYYY-MM-DD, empty for "any"
    std::string preferred_time;  ///< HH:MM, empty for "any"
};

/**
 * @brief Input of TokenAllocator::allocate_token
 *
 * Either slot_id, doctor_id or department must be set. When slot_id is
 * empty the allocator resolves a target slot itself.
 */
struct AllocationRequest {
    std::string patient_id;
    std::string doctor_id;
    std::string slot_id;
    std::string department;
    TokenSource source = TokenSource::Online;
    PatientInfo patient;
    int waiting_time = 0;  ///< minutes already spent waiting
    AllocationPreferences preferences;
    std::optional<UrgencyLevel> urgency_level;
    bool allow_preemption = true;
    std::string actor_id;
};

/**
 * @brief Input of TokenAllocator::emergency_insertion
 */
struct EmergencyRequest {
    std::string patient_id;
    std::string doctor_id;
    std::string preferred_slot_id;
    PatientInfo patient;
    UrgencyLevel urgency_level = UrgencyLevel::Emergency;  ///< High or Emergency
    bool allow_preemption = true;
    std::string actor_id;
};

/**
 * @brief Selects the tokens moved by a batch reallocation
 *
 * Every set field narrows the selection. An empty status list selects
 * allocated and confirmed tokens.
 */
struct ReallocationCriteria {
    std::string doctor_id;
    std::string slot_id;
    std::string date_from;  ///< inclusive YYYY-MM-DD
    std::string date_to;    ///< inclusive YYYY-MM-DD
    std::vector<TokenStatus> statuses;
};

} // namespace opd
