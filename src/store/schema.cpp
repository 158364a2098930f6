#include <opd/store/schema.hpp>

#include "utils/logger.hpp"

namespace opd {
namespace store {

namespace {

const char *const kSchemaV1 = R"(
    CREATE TABLE IF NOT EXISTS slots (
        slot_id TEXT NOT NULL,
        doctor_id TEXT NOT NULL,
        date TEXT NOT NULL,
        start_time TEXT NOT NULL,
        end_time TEXT NOT NULL,
        specialty TEXT NOT NULL DEFAULT '',
        max_capacity INTEGER NOT NULL CHECK (max_capacity >= 1),
        current_allocation INTEGER NOT NULL DEFAULT 0
            CHECK (current_allocation >= 0 AND current_allocation <= max_capacity),
        emergency_reserved INTEGER NOT NULL DEFAULT 0
            CHECK (emergency_reserved >= 0 AND emergency_reserved <= max_capacity),
        status TEXT NOT NULL DEFAULT 'active',
        version INTEGER NOT NULL DEFAULT 0,
        last_token_number INTEGER NOT NULL DEFAULT 0 CHECK (last_token_number >= 0),
        deleted INTEGER NOT NULL DEFAULT 0
    );
    CREATE UNIQUE INDEX IF NOT EXISTS slots_id ON slots (slot_id);
    CREATE INDEX IF NOT EXISTS slots_doctor_date ON slots (doctor_id, date);
    CREATE INDEX IF NOT EXISTS slots_specialty_date ON slots (specialty, date);

    CREATE TABLE IF NOT EXISTS tokens (
        token_id TEXT NOT NULL,
        patient_id TEXT NOT NULL,
        doctor_id TEXT NOT NULL,
        slot_id TEXT NOT NULL REFERENCES slots (slot_id),
        token_number INTEGER NOT NULL CHECK (token_number >= 1),
        source TEXT NOT NULL,
        priority INTEGER NOT NULL CHECK (priority >= 0 AND priority <= 2000),
        status TEXT NOT NULL,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL,
        version INTEGER NOT NULL DEFAULT 0,
        original_slot_id TEXT NOT NULL DEFAULT '',
        preempted_by TEXT NOT NULL DEFAULT '',
        urgency_level TEXT NOT NULL DEFAULT 'normal',
        reallocated_to TEXT NOT NULL DEFAULT '',
        reallocated_from TEXT NOT NULL DEFAULT '',
        reallocation_status TEXT NOT NULL DEFAULT 'none',
        allocation_method TEXT NOT NULL DEFAULT 'direct',
        waiting_time INTEGER NOT NULL DEFAULT 0,
        cancellation_reason TEXT NOT NULL DEFAULT '',
        actor_id TEXT NOT NULL DEFAULT '',
        notes TEXT NOT NULL DEFAULT ''
    );
    CREATE UNIQUE INDEX IF NOT EXISTS tokens_id ON tokens (token_id);
    CREATE UNIQUE INDEX IF NOT EXISTS tokens_slot_number ON tokens (slot_id, token_number);
    CREATE INDEX IF NOT EXISTS tokens_patient ON tokens (patient_id);
    CREATE INDEX IF NOT EXISTS tokens_slot_status ON tokens (slot_id, status);
    CREATE INDEX IF NOT EXISTS tokens_status_created ON tokens (status, created_at);

    CREATE TABLE IF NOT EXISTS configurations (
        config_key TEXT NOT NULL,
        config_value TEXT NOT NULL,
        category TEXT NOT NULL DEFAULT 'general',
        description TEXT NOT NULL DEFAULT '',
        updated_by TEXT NOT NULL DEFAULT 'system',
        updated_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE UNIQUE INDEX IF NOT EXISTS configurations_key ON configurations (config_key);
)";

} // namespace

void ensure_schema(Database& db) {
    db.transaction([&]() {
        int version = db.get_user_version();
        if (version >= kSchemaVersion)
            return;

        log_info("Migrating database schema from version ", version, " to ", kSchemaVersion);
        db.exec_many(kSchemaV1);
        db.set_user_version(kSchemaVersion);
    });
}

} // namespace store
} // namespace opd
