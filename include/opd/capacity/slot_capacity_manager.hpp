#pragma once

#include <opd/concurrency/concurrency_controller.hpp>
#include <opd/config/config.hpp>
#include <opd/core/records.hpp>
#include <opd/store/slot_store.hpp>

#include <cstdint>
#include <string>

namespace opd {
namespace capacity {

/**
 * @brief Result of taking or re-using a seat in a slot
 */
struct Reservation {
    int new_count = 0;         ///< current_allocation after the change
    int64_t token_number = 0;  ///< freshly issued number
    Slot slot;                 ///< slot as written
};

struct Availability {
    std::string slot_id;
    int max_capacity = 0;
    int current_allocation = 0;
    int emergency_reserved = 0;
    int available = 0;            ///< for the requested reserve policy
    int regular_available = 0;    ///< seats open to every source
    int emergency_available = 0;  ///< seats open to emergencies, reserve included
    bool bookable = false;
};

/**
 * @brief Input of SlotCapacityManager::create_slot
 *
 * A zero max_capacity derives the capacity from the configured default and
 * the number of consultations that fit the window; a negative
 * emergency_reserved applies the configured reserve percentage.
 */
struct SlotSpec {
    std::string slot_id;  ///< generated when empty
    std::string doctor_id;
    std::string date;
    std::string start_time;
    std::string end_time;
    std::string specialty;
    int max_capacity = 0;
    int emergency_reserved = -1;
};

/**
 * @brief Owns every change to a slot's allocation counter and token
 * numbering
 *
 * reserve_capacity(), release_capacity() and swap_within_slot() open a
 * transaction of their own or join the caller's one, so a token insert and
 * the counter change it depends on commit together. Status and capacity
 * changes go through the optimistic update path of the controller.
 */
class SlotCapacityManager {
public:
    SlotCapacityManager(store::SlotStore& slots, concurrency::ConcurrencyController& controller,
                        config::ConfigView& config)
        : slots_(slots), controller_(controller), config_(config) {}

    /**
     * @brief Take one seat and issue the next token number
     *
     * @param use_emergency_reserve true for emergency arrivals, which may
     * fill the slot up to max_capacity
     * @throws Error SLOT_NOT_FOUND, SLOT_NOT_AVAILABLE, SLOT_CAPACITY_EXCEEDED
     */
    Reservation reserve_capacity(const std::string& slot_id, bool use_emergency_reserve);

    /**
     * @brief Give back one seat; a release at zero is logged and ignored
     * @return the new allocation count
     */
    int release_capacity(const std::string& slot_id);

    /**
     * @brief Issue a fresh token number without changing the counter
     *
     * Used when a cancelled token's seat passes straight to its
     * replacement.
     *
     * @throws Error CONCURRENT_MODIFICATION when the counter no longer
     * equals @p reserved_count
     */
    Reservation swap_within_slot(const std::string& slot_id, int reserved_count);

    Availability check_availability(const std::string& slot_id, bool use_emergency_reserve);

    /**
     * @throws Error SLOT_NOT_AVAILABLE when reopening a completed or
     * cancelled slot
     */
    Slot change_slot_status(const std::string& slot_id, SlotStatus status);

    /**
     * @throws Error VALIDATION_ERROR for impossible numbers,
     * SCHEDULING_CONFLICT when shrinking below the current allocation
     */
    Slot change_capacity(const std::string& slot_id, int max_capacity, int emergency_reserved);

    Slot create_slot(const SlotSpec& spec);

private:
    Slot load_for_update(const std::string& slot_id);

    store::SlotStore& slots_;
    concurrency::ConcurrencyController& controller_;
    config::ConfigView& config_;
};

} // namespace capacity
} // namespace opd
