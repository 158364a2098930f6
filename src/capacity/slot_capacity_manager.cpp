#include <opd/capacity/slot_capacity_manager.hpp>

#include <opd/core/error.hpp>

#include "utils/logger.hpp"
#include "utils/random_utils.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>

namespace opd {
namespace capacity {

namespace {

std::map<std::string, std::string> slot_details(const Slot& slot) {
    return {{"slot_id", slot.slot_id},
            {"max_capacity", std::to_string(slot.max_capacity)},
            {"current_allocation", std::to_string(slot.current_allocation)},
            {"emergency_reserved", std::to_string(slot.emergency_reserved)}};
}

} // namespace

Slot SlotCapacityManager::load_for_update(const std::string& slot_id) {
    Slot slot = slots_.get(slot_id);
    if (!slot.is_bookable()) {
        throw Error(ErrorCode::SlotNotAvailable,
                    "Slot '" + slot_id + "' is " + to_string(slot.status) +
                        (slot.deleted ? " and deleted" : ""),
                    {{"slot_id", slot_id}, {"status", to_string(slot.status)}});
    }
    return slot;
}

Reservation SlotCapacityManager::reserve_capacity(const std::string& slot_id,
                                                  bool use_emergency_reserve) {
    return controller_.database().transaction([&]() {
        Slot slot = load_for_update(slot_id);

        int limit = use_emergency_reserve ? slot.max_capacity : slot.regular_capacity();
        if (slot.current_allocation >= limit) {
            auto details = slot_details(slot);
            details["limit"] = std::to_string(limit);
            throw Error(ErrorCode::SlotCapacityExceeded, "Slot '" + slot_id + "' is full",
                        details, {"Choose another slot"});
        }

        slot.current_allocation++;
        slot.last_token_number++;
        slots_.save(slot);

        log_debug("Reserved seat ", slot.current_allocation, "/", slot.max_capacity, " in ",
                  slot_id, " (token #", slot.last_token_number, ")");
        return Reservation{slot.current_allocation, slot.last_token_number, slot};
    });
}

int SlotCapacityManager::release_capacity(const std::string& slot_id) {
    return controller_.database().transaction([&]() {
        Slot slot = slots_.get(slot_id);
        if (slot.current_allocation <= 0) {
            log_warn("Release on slot ", slot_id, " with no allocation left; counter kept at 0");
            return 0;
        }

        slot.current_allocation--;
        slots_.save(slot);
        log_debug("Released seat in ", slot_id, ", now ", slot.current_allocation, "/",
                  slot.max_capacity);
        return slot.current_allocation;
    });
}

Reservation SlotCapacityManager::swap_within_slot(const std::string& slot_id,
                                                  int reserved_count) {
    return controller_.database().transaction([&]() {
        Slot slot = slots_.get(slot_id);
        if (slot.current_allocation != reserved_count) {
            throw Error(ErrorCode::ConcurrentModification,
                        "Allocation of slot '" + slot_id + "' changed during the swap",
                        {{"slot_id", slot_id},
                         {"expected", std::to_string(reserved_count)},
                         {"actual", std::to_string(slot.current_allocation)}});
        }

        slot.last_token_number++;
        slots_.save(slot);
        return Reservation{slot.current_allocation, slot.last_token_number, slot};
    });
}

Availability SlotCapacityManager::check_availability(const std::string& slot_id,
                                                     bool use_emergency_reserve) {
    Slot slot = slots_.get(slot_id);

    Availability availability;
    availability.slot_id = slot.slot_id;
    availability.max_capacity = slot.max_capacity;
    availability.current_allocation = slot.current_allocation;
    availability.emergency_reserved = slot.emergency_reserved;
    availability.regular_available = slot.available(false);
    availability.emergency_available = slot.available(true);
    availability.available = slot.available(use_emergency_reserve);
    availability.bookable = slot.is_bookable();
    return availability;
}

Slot SlotCapacityManager::change_slot_status(const std::string& slot_id, SlotStatus status) {
    auto config = config_.snapshot();

    concurrency::OperationContext context;
    context.operation = "change_slot_status";
    context.deadline_ms = controller_.deadline_after(config->allocation.soft_deadline);
    context.details = {{"slot_id", slot_id}, {"status", to_string(status)}};

    Slot slot = controller_.update_with_optimistic_lock(
        slots_, slot_id,
        [&](Slot& current) {
            if (is_terminal(current.status) && current.status != status) {
                throw Error(ErrorCode::SlotNotAvailable,
                            "Slot '" + slot_id + "' is " + to_string(current.status) +
                                " and cannot change status",
                            {{"slot_id", slot_id}, {"status", to_string(current.status)}});
            }
            current.status = status;
        },
        context, config->retry);

    log_info("Slot ", slot_id, " is now ", to_string(status));
    return slot;
}

Slot SlotCapacityManager::change_capacity(const std::string& slot_id, int max_capacity,
                                          int emergency_reserved) {
    if (max_capacity < 1 || emergency_reserved < 0 || emergency_reserved > max_capacity) {
        throw Error(ErrorCode::ValidationError, "Invalid capacity for slot '" + slot_id + "'",
                    {{"max_capacity", std::to_string(max_capacity)},
                     {"emergency_reserved", std::to_string(emergency_reserved)}},
                    {"max_capacity must be at least 1 and emergency_reserved within 0.."
                     "max_capacity"});
    }

    auto config = config_.snapshot();

    concurrency::OperationContext context;
    context.operation = "change_capacity";
    context.deadline_ms = controller_.deadline_after(config->allocation.soft_deadline);
    context.details = {{"slot_id", slot_id}};

    Slot slot = controller_.update_with_optimistic_lock(
        slots_, slot_id,
        [&](Slot& current) {
            if (is_terminal(current.status)) {
                throw Error(ErrorCode::SlotNotAvailable,
                            "Slot '" + slot_id + "' is " + to_string(current.status),
                            {{"slot_id", slot_id}});
            }
            if (max_capacity < current.current_allocation) {
                throw Error(ErrorCode::SchedulingConflict,
                            "Capacity cannot drop below the current allocation",
                            slot_details(current),
                            {"Cancel or move tokens before shrinking the slot"});
            }
            current.max_capacity = max_capacity;
            current.emergency_reserved = emergency_reserved;
        },
        context, config->retry);

    log_info("Slot ", slot_id, " capacity set to ", max_capacity, " (", emergency_reserved,
             " reserved)");
    return slot;
}

Slot SlotCapacityManager::create_slot(const SlotSpec& spec) {
    auto config = config_.snapshot();

    auto start = dates::parse_time_of_day(spec.start_time);
    auto end = dates::parse_time_of_day(spec.end_time);
    if (spec.doctor_id.empty() || !dates::parse_date(spec.date) || !start || !end ||
        *end <= *start) {
        throw Error(ErrorCode::ValidationError, "Invalid slot definition",
                    {{"doctor_id", spec.doctor_id},
                     {"date", spec.date},
                     {"start_time", spec.start_time},
                     {"end_time", spec.end_time}},
                    {"Provide a doctor, a YYYY-MM-DD date and HH:MM times with end after start"});
    }

    Slot slot;
    slot.slot_id = spec.slot_id.empty() ? generate_id("slot") : spec.slot_id;
    slot.doctor_id = spec.doctor_id;
    slot.date = spec.date;
    slot.start_time = spec.start_time;
    slot.end_time = spec.end_time;
    slot.specialty = spec.specialty;

    slot.max_capacity = spec.max_capacity;
    if (slot.max_capacity <= 0) {
        int per_patient =
            config->timing.default_consultation_minutes + config->timing.buffer_minutes;
        int fits = (*end - *start) / std::max(1, per_patient);
        slot.max_capacity = std::max(1, std::min(config->capacity.default_slot_capacity, fits));
    }
    slot.emergency_reserved = spec.emergency_reserved;
    if (slot.emergency_reserved < 0) {
        slot.emergency_reserved =
            slot.max_capacity * config->capacity.emergency_reserve_percentage / 100;
    }
    if (slot.emergency_reserved > slot.max_capacity) {
        throw Error(ErrorCode::ValidationError, "Emergency reserve exceeds capacity",
                    slot_details(slot));
    }

    controller_.database().transaction([&]() {
        if (slots_.load(slot.slot_id)) {
            throw Error(ErrorCode::SchedulingConflict,
                        "Slot '" + slot.slot_id + "' already exists", {{"slot_id", slot.slot_id}});
        }
        slots_.insert(slot);
    });

    log_info("Created slot ", slot.slot_id, " for ", slot.doctor_id, " on ", slot.date, " ",
             slot.start_time, "-", slot.end_time, " (capacity ", slot.max_capacity, ", ",
             slot.emergency_reserved, " reserved)");
    return slot;
}

} // namespace capacity
} // namespace opd
