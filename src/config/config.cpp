#include <opd/config/config.hpp>

#include <stdexcept>
#include <cmath>
#include <functional>
#include <sstream>

namespace opd {
namespace config {

namespace {

/**
 * @brief Range rule for one numeric setting
 */
struct NumericRule {
    const char *key;
    double min;
    double max;
    bool integral;
    std::function<void(ConfigSnapshot&, double)> apply;
};

const std::vector<NumericRule>& numeric_rules() {
    using std::chrono::milliseconds;
    static const std::vector<NumericRule> rules = {
        {"priority.emergency", 0, 2000, true,
         [](ConfigSnapshot& s, double v) { s.priority.emergency = static_cast<int>(v); }},
        {"priority.priority_patient", 0, 2000, true,
         [](ConfigSnapshot& s, double v) { s.priority.priority_patient = static_cast<int>(v); }},
        {"priority.followup", 0, 2000, true,
         [](ConfigSnapshot& s, double v) { s.priority.followup = static_cast<int>(v); }},
        {"priority.online_booking", 0, 2000, true,
         [](ConfigSnapshot& s, double v) { s.priority.online_booking = static_cast<int>(v); }},
        {"priority.walkin", 0, 2000, true,
         [](ConfigSnapshot& s, double v) { s.priority.walkin = static_cast<int>(v); }},
        {"priority.preemption_threshold", 0, 2000, true,
         [](ConfigSnapshot& s, double v) {
             s.priority.preemption_threshold = static_cast<int>(v);
         }},
        {"capacity.default_slot_capacity", 1, 100, true,
         [](ConfigSnapshot& s, double v) {
             s.capacity.default_slot_capacity = static_cast<int>(v);
         }},
        {"capacity.emergency_reserve_percentage", 0, 50, true,
         [](ConfigSnapshot& s, double v) {
             s.capacity.emergency_reserve_percentage = static_cast<int>(v);
         }},
        {"timing.default_consultation_minutes", 5, 120, true,
         [](ConfigSnapshot& s, double v) {
             s.timing.default_consultation_minutes = static_cast<int>(v);
         }},
        {"timing.buffer_minutes", 0, 30, true,
         [](ConfigSnapshot& s, double v) { s.timing.buffer_minutes = static_cast<int>(v); }},
        {"timing.reallocation_window_hours", 1, 24, true,
         [](ConfigSnapshot& s, double v) {
             s.timing.reallocation_window_hours = static_cast<int>(v);
         }},
        {"allocation.max_alternatives", 1, 20, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.max_alternatives = static_cast<size_t>(v);
         }},
        {"allocation.reallocation_candidates", 1, 20, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.reallocation_candidates = static_cast<size_t>(v);
         }},
        {"allocation.same_doctor_search_days", 1, 30, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.same_doctor_search_days = static_cast<int>(v);
         }},
        {"allocation.any_slot_search_days", 1, 30, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.any_slot_search_days = static_cast<int>(v);
         }},
        {"allocation.soft_deadline_ms", 100, 600000, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.soft_deadline = milliseconds(static_cast<int64_t>(v));
         }},
        {"allocation.stale_operation_age_ms", 1000, 3600000, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.stale_operation_age = milliseconds(static_cast<int64_t>(v));
         }},
        {"allocation.sweep_interval_ms", 100, 3600000, true,
         [](ConfigSnapshot& s, double v) {
             s.allocation.sweep_interval = milliseconds(static_cast<int64_t>(v));
         }},
        {"retry.max_retries", 0, 10, true,
         [](ConfigSnapshot& s, double v) { s.retry.max_retries = static_cast<int>(v); }},
        {"retry.base_delay_ms", 0, 10000, true,
         [](ConfigSnapshot& s, double v) {
             s.retry.base_delay = milliseconds(static_cast<int64_t>(v));
         }},
        {"retry.max_delay_ms", 0, 60000, true,
         [](ConfigSnapshot& s, double v) {
             s.retry.max_delay = milliseconds(static_cast<int64_t>(v));
         }},
        {"retry.backoff_factor", 1.0, 10.0, false,
         [](ConfigSnapshot& s, double v) { s.retry.backoff_factor = v; }},
    };
    return rules;
}

constexpr const char *kReallocationOrderKey = "allocation.reallocation_order";

std::optional<double> parse_number(const std::string& text) {
    if (text.empty())
        return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value))
            return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

} // namespace

int PriorityConfig::base_for(TokenSource source) const {
    switch (source) {
    case TokenSource::Emergency:
        return emergency;
    case TokenSource::Priority:
        return priority_patient;
    case TokenSource::Followup:
        return followup;
    case TokenSource::Online:
        return online_booking;
    case TokenSource::Walkin:
        return walkin;
    }
    return online_booking;
}

const char *to_string(ReallocationTier tier) {
    switch (tier) {
    case ReallocationTier::SameDoctorSameDay:
        return "same_doctor_same_day";
    case ReallocationTier::SameSpecialtySameDay:
        return "same_specialty_same_day";
    case ReallocationTier::SameDoctorNextDay:
        return "same_doctor_next_day";
    }
    return "unknown";
}

std::optional<ReallocationTier> parse_reallocation_tier(std::string_view text) {
    if (text == "same_doctor_same_day")
        return ReallocationTier::SameDoctorSameDay;
    if (text == "same_specialty_same_day")
        return ReallocationTier::SameSpecialtySameDay;
    if (text == "same_doctor_next_day")
        return ReallocationTier::SameDoctorNextDay;
    return std::nullopt;
}

const char *to_string(Profile profile) {
    switch (profile) {
    case Profile::Default:
        return "default";
    case Profile::Development:
        return "development";
    case Profile::Testing:
        return "testing";
    case Profile::Production:
        return "production";
    }
    return "default";
}

std::optional<Profile> parse_profile(std::string_view text) {
    if (text == "default")
        return Profile::Default;
    if (text == "development")
        return Profile::Development;
    if (text == "testing" || text == "test")
        return Profile::Testing;
    if (text == "production")
        return Profile::Production;
    return std::nullopt;
}

void apply_profile(ConfigSnapshot& snapshot, Profile profile) {
    snapshot.profile = profile;
    switch (profile) {
    case Profile::Default:
        break;
    case Profile::Development:
        snapshot.capacity.default_slot_capacity = 5;
        snapshot.timing.default_consultation_minutes = 10;
        break;
    case Profile::Testing:
        snapshot.capacity.default_slot_capacity = 3;
        snapshot.timing.default_consultation_minutes = 5;
        snapshot.timing.buffer_minutes = 1;
        break;
    case Profile::Production:
        snapshot.capacity.default_slot_capacity = 15;
        snapshot.timing.default_consultation_minutes = 20;
        snapshot.timing.buffer_minutes = 10;
        break;
    }
}

std::string apply_setting(ConfigSnapshot& snapshot, const std::string& key,
                          const std::string& value) {
    if (key == kReallocationOrderKey) {
        std::vector<ReallocationTier> order;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto tier = parse_reallocation_tier(trim(item));
            if (!tier)
                return "Configuration '" + key + "' has unknown tier '" + trim(item) + "'";
            order.push_back(*tier);
        }
        if (order.empty())
            return "Configuration '" + key + "' must name at least one tier";
        snapshot.allocation.reallocation_order = std::move(order);
        return {};
    }

    for (const auto& rule : numeric_rules()) {
        if (key != rule.key)
            continue;
        auto number = parse_number(trim(value));
        if (!number)
            return "Configuration '" + key + "' must be a number, got '" + value + "'";
        if (rule.integral && std::floor(*number) != *number)
            return "Configuration '" + key + "' must be an integer, got " + value;
        if (*number < rule.min) {
            std::ostringstream oss;
            oss << "Configuration '" << key << "' must be >= " << rule.min << ", got " << value;
            return oss.str();
        }
        if (*number > rule.max) {
            std::ostringstream oss;
            oss << "Configuration '" << key << "' must be <= " << rule.max << ", got " << value;
            return oss.str();
        }
        rule.apply(snapshot, *number);
        return {};
    }
    return "Unknown configuration key '" + key + "'";
}

std::vector<std::string> known_keys() {
    std::vector<std::string> keys;
    for (const auto& rule : numeric_rules())
        keys.emplace_back(rule.key);
    keys.emplace_back(kReallocationOrderKey);
    return keys;
}

} // namespace config
} // namespace opd
