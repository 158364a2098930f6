#include <opd/config/config_store.hpp>

#include <opd/core/error.hpp>

#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace opd {
namespace config {

namespace {

std::string category_of_key(const std::string& key) {
    size_t dot = key.find('.');
    return dot == std::string::npos ? std::string("general") : key.substr(0, dot);
}

/**
 * @brief "priority.preemption_threshold" -> "OPD_PRIORITY_PREEMPTION_THRESHOLD"
 */
std::string environment_name(const std::string& key) {
    std::string name = "OPD_";
    for (char c : key)
        name += c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return name;
}

} // namespace

void ConfigurationStore::set_value(const std::string& key, const std::string& value,
                                   const std::string& description,
                                   const std::string& updated_by, int64_t updated_at) {
    ConfigSnapshot scratch;
    std::string problem = apply_setting(scratch, key, value);
    if (!problem.empty()) {
        throw Error(ErrorCode::ValidationError, problem, {{"config_key", key}, {"value", value}});
    }

    db_.transaction([&]() {
        db_.run("INSERT INTO configurations (config_key, config_value, category, description, "
                "updated_by, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
                "ON CONFLICT (config_key) DO UPDATE SET config_value = ?2, description = ?4, "
                "updated_by = ?5, updated_at = ?6",
                {key, value, category_of_key(key), description, updated_by, updated_at});
    });
    log_info("Configuration ", key, " set to ", value, " by ", updated_by);
}

std::optional<std::string> ConfigurationStore::get_value(const std::string& key) {
    store::Statement stmt =
        db_.prepare("SELECT config_value FROM configurations WHERE config_key = ?", {key});
    if (!stmt.step())
        return std::nullopt;
    return stmt.column_text(0);
}

std::map<std::string, std::string> ConfigurationStore::all(const std::string& category) {
    store::Statement stmt = db_.prepare("SELECT config_key, config_value FROM configurations "
                                        "WHERE ?1 = '' OR category = ?1 ORDER BY config_key",
                                        {category});
    std::map<std::string, std::string> values;
    while (stmt.step())
        values.emplace(stmt.column_text(0), stmt.column_text(1));
    return values;
}

bool ConfigurationStore::remove(const std::string& key) {
    return db_.transaction([&]() {
        return db_.run("DELETE FROM configurations WHERE config_key = ?", {key}) > 0;
    });
}

// CachedConfigView

CachedConfigView::CachedConfigView(ConfigurationStore& store, const Clock& clock)
    : CachedConfigView(store, clock, Options{}) {}

CachedConfigView::CachedConfigView(ConfigurationStore& store, const Clock& clock,
                                   Options options)
    : store_(store), clock_(clock), options_(std::move(options)) {}

std::shared_ptr<const ConfigSnapshot> CachedConfigView::snapshot() {
    int64_t now = clock_.now_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cached_ && now - loaded_at_ < options_.ttl.count())
            return cached_;
    }

    // Built without holding the mutex: build() reads the database.
    auto fresh = build();

    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = std::move(fresh);
    loaded_at_ = now;
    reloads_++;
    return cached_;
}

void CachedConfigView::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

std::shared_ptr<const ConfigSnapshot> CachedConfigView::build() {
    auto snapshot = std::make_shared<ConfigSnapshot>();

    Profile profile = Profile::Default;
    if (options_.profile) {
        profile = *options_.profile;
    } else if (const char *env = std::getenv("OPD_ENV")) {
        if (auto parsed = parse_profile(env)) {
            profile = *parsed;
        } else {
            log_warn("Ignoring unknown OPD_ENV profile '", env, "'");
        }
    }
    apply_profile(*snapshot, profile);

    for (const auto& [key, value] : store_.all()) {
        std::string problem = apply_setting(*snapshot, key, value);
        if (!problem.empty())
            log_warn("Ignoring stored configuration: ", problem);
    }

    if (options_.read_environment) {
        for (const auto& key : known_keys()) {
            const char *value = std::getenv(environment_name(key).c_str());
            if (!value)
                continue;
            std::string problem = apply_setting(*snapshot, key, value);
            if (!problem.empty())
                log_warn("Ignoring environment configuration: ", problem);
        }
    }

    log_debug("Configuration loaded (profile ", to_string(profile), ")");
    return snapshot;
}

} // namespace config
} // namespace opd
