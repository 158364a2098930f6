#pragma once

#include <opd/core/records.hpp>
#include <opd/store/database.hpp>

#include <optional>
#include <string>
#include <vector>

namespace opd {
namespace store {

/**
 * @brief Filter for SlotStore::query; empty fields match everything
 */
struct SlotQuery {
    std::string doctor_id;
    std::string specialty;
    std::string date_from;  ///< inclusive
    std::string date_to;    ///< inclusive
    bool bookable_only = true;
};

/**
 * @brief Persistent slots with version-checked updates
 */
class SlotStore {
public:
    using record_type = Slot;

    explicit SlotStore(Database& db) : db_(db) {}

    void insert(const Slot& slot);

    std::optional<Slot> load(const std::string& slot_id);

    /**
     * @brief Load a slot or throw SLOT_NOT_FOUND
     */
    Slot get(const std::string& slot_id);

    /**
     * @brief Write every mutable field if the stored version still equals
     * slot.version, then bump slot.version
     *
     * @throws VersionConflict when another writer got there first
     */
    void save(Slot& slot);

    /**
     * @brief Slots ordered by date then start time
     */
    std::vector<Slot> query(const SlotQuery& query);

    static const char *entity_name() {
        return "slot";
    }

private:
    Database& db_;
};

} // namespace store
} // namespace opd
