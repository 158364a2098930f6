#pragma once

#include <opd/concurrency/retry.hpp>
#include <opd/core/types.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace opd {
namespace config {

/**
 * @brief Base score per source and the preemption margin
 */
struct PriorityConfig {
    int emergency = 1000;
    int priority_patient = 800;
    int followup = 600;
    int online_booking = 400;
    int walkin = 200;
    int preemption_threshold = 200;  ///< required strict margin over a displaced token

    int base_for(TokenSource source) const;
};

struct CapacityConfig {
    int default_slot_capacity = 10;
    int emergency_reserve_percentage = 20;
};

struct TimingConfig {
    int default_consultation_minutes = 15;
    int buffer_minutes = 5;
    int reallocation_window_hours = 4;
};

/**
 * @brief Search tiers used when re-homing a displaced token
 */
enum class ReallocationTier : uint8_t {
    SameDoctorSameDay = 0,
    SameSpecialtySameDay = 1,
    SameDoctorNextDay = 2
};

const char *to_string(ReallocationTier tier);
std::optional<ReallocationTier> parse_reallocation_tier(std::string_view text);

struct AllocationConfig {
    size_t max_alternatives = 5;
    size_t reallocation_candidates = 5;
    std::vector<ReallocationTier> reallocation_order = {
        ReallocationTier::SameDoctorSameDay, ReallocationTier::SameSpecialtySameDay,
        ReallocationTier::SameDoctorNextDay};
    int same_doctor_search_days = 7;
    int any_slot_search_days = 3;
    std::chrono::milliseconds soft_deadline = std::chrono::seconds(30);
    std::chrono::milliseconds stale_operation_age = std::chrono::minutes(5);
    std::chrono::milliseconds sweep_interval = std::chrono::minutes(1);
};

/**
 * @brief Deployment profile selecting a set of overrides on the defaults
 */
enum class Profile : uint8_t {
    Default = 0,
    Development = 1,
    Testing = 2,
    Production = 3
};

const char *to_string(Profile profile);
std::optional<Profile> parse_profile(std::string_view text);

/**
 * @brief Immutable set of tunables read once per request
 */
struct ConfigSnapshot {
    Profile profile = Profile::Default;
    PriorityConfig priority;
    CapacityConfig capacity;
    TimingConfig timing;
    AllocationConfig allocation;
    concurrency::RetryConfig retry;
};

/**
 * @brief Apply the overrides a profile carries
 */
void apply_profile(ConfigSnapshot& snapshot, Profile profile);

/**
 * @brief Validate and apply one "category.key" setting
 *
 * @return empty string on success, otherwise a description of the problem;
 * the snapshot is left untouched on failure
 */
std::string apply_setting(ConfigSnapshot& snapshot, const std::string& key,
                          const std::string& value);

/**
 * @brief Every key accepted by apply_setting()
 */
std::vector<std::string> known_keys();

/**
 * @brief Source of configuration snapshots
 */
class ConfigView {
public:
    virtual ~ConfigView() = default;
    virtual std::shared_ptr<const ConfigSnapshot> snapshot() = 0;
};

/**
 * @brief Serves one fixed snapshot
 */
class StaticConfigView : public ConfigView {
public:
    explicit StaticConfigView(ConfigSnapshot snapshot = {})
        : snapshot_(std::make_shared<const ConfigSnapshot>(std::move(snapshot))) {}

    std::shared_ptr<const ConfigSnapshot> snapshot() override {
        return snapshot_;
    }

private:
    std::shared_ptr<const ConfigSnapshot> snapshot_;
};

} // namespace config
} // namespace opd
