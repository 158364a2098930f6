#include <opd/allocation/slot_finder.hpp>

#include "utils/time_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <tuple>

namespace opd {
namespace allocation {

namespace {

constexpr size_t kGroupLimit = 3;

int minutes_of(const std::string& time) {
    return dates::parse_time_of_day(time).value_or(0);
}

const char *alternative_message(const std::string& action) {
    if (action == "same_department_today")
        return "Other doctors in the same department have room today";
    if (action == "same_doctor_future")
        return "The requested doctor has room in the coming days";
    if (action == "future_booking")
        return "Slots are available in the next few days";
    if (action == "emergency_same_department")
        return "EMERGENCY: other doctors in the same department have room today";
    if (action == "emergency_same_doctor")
        return "EMERGENCY: the requested doctor has room in the coming days";
    if (action == "emergency_next_available")
        return "EMERGENCY: slots are available in the next few days";
    if (action == "emergency_no_alternatives")
        return "EMERGENCY: no slot is available, contact hospital administration";
    return "No alternative slot is available";
}

void append_unique(std::vector<AlternativeSlot>& out, const std::vector<Slot>& slots,
                   bool use_emergency_reserve, const char *reason, size_t limit) {
    size_t added = 0;
    for (const Slot& slot : slots) {
        if (added >= limit)
            break;
        bool seen = std::any_of(out.begin(), out.end(), [&](const AlternativeSlot& alt) {
            return alt.slot.slot_id == slot.slot_id;
        });
        if (seen)
            continue;
        out.push_back({slot, slot.available(use_emergency_reserve), reason});
        added++;
    }
}

} // namespace

std::vector<Slot> SlotFinder::open_slots(const store::SlotQuery& query,
                                         bool use_emergency_reserve) const {
    std::vector<Slot> slots = slots_.query(query);
    std::erase_if(slots, [&](const Slot& slot) {
        return !slot.is_bookable() || slot.available(use_emergency_reserve) <= 0;
    });
    return slots;
}

std::optional<Slot> SlotFinder::resolve_target(const AllocationRequest& request,
                                               const std::string& today) const {
    bool emergency = request.source == TokenSource::Emergency;

    store::SlotQuery query;
    query.doctor_id = request.doctor_id;
    if (query.doctor_id.empty())
        query.specialty = request.department;
    query.date_from = today;
    const std::string& preferred_date = request.preferences.preferred_date;
    if (!preferred_date.empty() && preferred_date >= today) {
        query.date_from = preferred_date;
        query.date_to = preferred_date;
    }

    std::vector<Slot> slots = open_slots(query, emergency);
    if (slots.empty())
        return std::nullopt;

    const std::string& last_doctor = request.patient.last_visited_doctor;
    bool followup = (request.source == TokenSource::Followup || request.patient.is_followup) &&
                    !last_doctor.empty();
    auto preferred_time = dates::parse_time_of_day(request.preferences.preferred_time);

    auto rank = [&](const Slot& slot) {
        int start = minutes_of(slot.start_time);
        return std::make_tuple(followup && slot.doctor_id == last_doctor ? 0 : 1, slot.date,
                               preferred_time && start < *preferred_time ? 1 : 0, start,
                               -slot.available(emergency), slot.slot_id);
    };
    return *std::min_element(slots.begin(), slots.end(), [&](const Slot& a, const Slot& b) {
        return rank(a) < rank(b);
    });
}

std::vector<AlternativeSlot> SlotFinder::future_slots(const AllocationRequest& request,
                                                      const std::string& today,
                                                      size_t limit) const {
    bool emergency = request.source == TokenSource::Emergency;

    store::SlotQuery query;
    query.doctor_id = request.doctor_id;
    if (query.doctor_id.empty())
        query.specialty = request.department;
    query.date_from = today;

    std::vector<AlternativeSlot> out;
    append_unique(out, open_slots(query, emergency), emergency, "future_booking", limit);
    return out;
}

Alternatives SlotFinder::find_alternatives(const Slot& requested, TokenSource source,
                                           const config::ConfigSnapshot& config,
                                           const std::string& today) const {
    bool emergency = source == TokenSource::Emergency;
    std::string from = std::max(requested.date, today);

    std::vector<Slot> same_department;
    if (!requested.specialty.empty()) {
        store::SlotQuery query;
        query.specialty = requested.specialty;
        query.date_from = from;
        query.date_to = requested.date;
        same_department = open_slots(query, emergency);
        std::erase_if(same_department,
                      [&](const Slot& slot) { return slot.doctor_id == requested.doctor_id; });
    }

    store::SlotQuery doctor_query;
    doctor_query.doctor_id = requested.doctor_id;
    doctor_query.date_from = std::max(dates::add_days(requested.date, 1), today);
    doctor_query.date_to =
        dates::add_days(requested.date, config.allocation.same_doctor_search_days);
    std::vector<Slot> same_doctor = open_slots(doctor_query, emergency);

    store::SlotQuery next_query;
    next_query.specialty = requested.specialty;
    next_query.date_from = from;
    next_query.date_to = dates::add_days(requested.date, config.allocation.any_slot_search_days);
    std::vector<Slot> next_available = open_slots(next_query, emergency);
    std::erase_if(next_available,
                  [&](const Slot& slot) { return slot.slot_id == requested.slot_id; });

    Alternatives result;
    result.requested_slot = requested;

    std::vector<AlternativeSlot>& out = result.alternatives;
    if (!same_department.empty()) {
        result.recommended_action =
            emergency ? "emergency_same_department" : "same_department_today";
    } else if (!same_doctor.empty()) {
        result.recommended_action = emergency ? "emergency_same_doctor" : "same_doctor_future";
    } else if (!next_available.empty()) {
        result.recommended_action = emergency ? "emergency_next_available" : "future_booking";
    } else {
        result.recommended_action = emergency ? "emergency_no_alternatives" : "no_alternatives";
    }

    append_unique(out, same_department, emergency, "same_department_today", kGroupLimit);
    append_unique(out, same_doctor, emergency, "same_doctor_future", kGroupLimit);
    append_unique(out, next_available, emergency, "future_booking", next_available.size());
    if (out.size() > config.allocation.max_alternatives)
        out.resize(config.allocation.max_alternatives);

    result.suggestions.push_back(alternative_message(result.recommended_action));
    if (out.empty()) {
        result.suggestions.push_back("Try booking for a later date");
        if (emergency)
            result.suggestions.push_back("Contact hospital administration");
    }
    return result;
}

std::vector<Slot> SlotFinder::reallocation_candidates(const Slot& original,
                                                      bool use_emergency_reserve,
                                                      const config::ConfigSnapshot& config,
                                                      const std::set<std::string>& excluded,
                                                      const std::string& today) const {
    const int window = config.timing.reallocation_window_hours * 60;
    const int original_start = minutes_of(original.start_time);
    auto within_window = [&](const Slot& slot) {
        return std::abs(minutes_of(slot.start_time) - original_start) <= window;
    };

    std::vector<Slot> candidates;
    auto take = [&](std::vector<Slot> slots) {
        for (Slot& slot : slots) {
            if (candidates.size() >= config.allocation.reallocation_candidates)
                return;
            if (slot.slot_id == original.slot_id || excluded.count(slot.slot_id) ||
                slot.date < today)
                continue;
            bool seen = std::any_of(candidates.begin(), candidates.end(),
                                    [&](const Slot& c) { return c.slot_id == slot.slot_id; });
            if (!seen)
                candidates.push_back(std::move(slot));
        }
    };

    for (config::ReallocationTier tier : config.allocation.reallocation_order) {
        store::SlotQuery query;
        std::vector<Slot> slots;
        switch (tier) {
        case config::ReallocationTier::SameDoctorSameDay:
            query.doctor_id = original.doctor_id;
            query.date_from = query.date_to = original.date;
            slots = open_slots(query, use_emergency_reserve);
            std::erase_if(slots, [&](const Slot& slot) { return !within_window(slot); });
            break;
        case config::ReallocationTier::SameSpecialtySameDay:
            if (original.specialty.empty())
                break;
            query.specialty = original.specialty;
            query.date_from = query.date_to = original.date;
            slots = open_slots(query, use_emergency_reserve);
            std::erase_if(slots, [&](const Slot& slot) {
                return slot.doctor_id == original.doctor_id || !within_window(slot);
            });
            break;
        case config::ReallocationTier::SameDoctorNextDay:
            query.doctor_id = original.doctor_id;
            query.date_from = query.date_to = dates::add_days(original.date, 1);
            slots = open_slots(query, use_emergency_reserve);
            break;
        }
        take(std::move(slots));
    }
    return candidates;
}

} // namespace allocation
} // namespace opd
