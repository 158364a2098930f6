#include <opd/store/slot_store.hpp>

#include <opd/core/error.hpp>

namespace opd {
namespace store {

namespace {

constexpr const char *kSlotColumns =
    "slot_id, doctor_id, date, start_time, end_time, specialty, max_capacity, "
    "current_allocation, emergency_reserved, status, version, last_token_number, deleted";

Slot read_slot(const Statement& stmt) {
    Slot slot;
    slot.slot_id = stmt.column_text(0);
    slot.doctor_id = stmt.column_text(1);
    slot.date = stmt.column_text(2);
    slot.start_time = stmt.column_text(3);
    slot.end_time = stmt.column_text(4);
    slot.specialty = stmt.column_text(5);
    slot.max_capacity = stmt.column_int(6);
    slot.current_allocation = stmt.column_int(7);
    slot.emergency_reserved = stmt.column_int(8);
    slot.status = parse_slot_status(stmt.column_text(9)).value_or(SlotStatus::Suspended);
    slot.version = stmt.column_int64(10);
    slot.last_token_number = stmt.column_int64(11);
    slot.deleted = stmt.column_int(12) != 0;
    return slot;
}

} // namespace

void SlotStore::insert(const Slot& slot) {
    db_.transaction([&]() {
        db_.run(std::string("INSERT INTO slots (") + kSlotColumns +
                    ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                {slot.slot_id, slot.doctor_id, slot.date, slot.start_time, slot.end_time,
                 slot.specialty, slot.max_capacity, slot.current_allocation,
                 slot.emergency_reserved, to_string(slot.status), slot.version,
                 slot.last_token_number, slot.deleted});
    });
}

std::optional<Slot> SlotStore::load(const std::string& slot_id) {
    Statement stmt = db_.prepare(
        std::string("SELECT ") + kSlotColumns + " FROM slots WHERE slot_id = ?", {slot_id});
    if (!stmt.step())
        return std::nullopt;
    return read_slot(stmt);
}

Slot SlotStore::get(const std::string& slot_id) {
    auto slot = load(slot_id);
    if (!slot) {
        throw Error(ErrorCode::SlotNotFound, "Slot '" + slot_id + "' not found",
                    {{"slot_id", slot_id}});
    }
    return *slot;
}

void SlotStore::save(Slot& slot) {
    int changed = db_.transaction([&]() {
        return db_.run(
            "UPDATE slots SET doctor_id = ?, date = ?, start_time = ?, end_time = ?, "
            "specialty = ?, max_capacity = ?, current_allocation = ?, emergency_reserved = ?, "
            "status = ?, last_token_number = ?, deleted = ?, version = version + 1 "
            "WHERE slot_id = ? AND version = ?",
            {slot.doctor_id, slot.date, slot.start_time, slot.end_time, slot.specialty,
             slot.max_capacity, slot.current_allocation, slot.emergency_reserved,
             to_string(slot.status), slot.last_token_number, slot.deleted, slot.slot_id,
             slot.version});
    });
    if (changed == 0)
        throw VersionConflict(entity_name(), slot.slot_id, slot.version);
    slot.version++;
}

std::vector<Slot> SlotStore::query(const SlotQuery& query) {
    Statement stmt = db_.prepare(
        std::string("SELECT ") + kSlotColumns +
            " FROM slots"
            " WHERE (?1 = '' OR doctor_id = ?1)"
            "   AND (?2 = '' OR specialty = ?2)"
            "   AND (?3 = '' OR date >= ?3)"
            "   AND (?4 = '' OR date <= ?4)"
            "   AND (?5 = 0 OR (status = 'active' AND deleted = 0))"
            " ORDER BY date, start_time, slot_id",
        {query.doctor_id, query.specialty, query.date_from, query.date_to,
         query.bookable_only});

    std::vector<Slot> slots;
    while (stmt.step())
        slots.push_back(read_slot(stmt));
    return slots;
}

} // namespace store
} // namespace opd
