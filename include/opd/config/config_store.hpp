#pragma once

#include <opd/config/config.hpp>
#include <opd/core/clock.hpp>
#include <opd/store/database.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace opd {
namespace config {

/**
 * @brief Persisted configuration overrides, one row per "category.key"
 */
class ConfigurationStore {
public:
    explicit ConfigurationStore(store::Database& db) : db_(db) {}

    /**
     * @brief Validate and upsert a value
     * @throws Error VALIDATION_ERROR when the key is unknown or the value
     * breaks its rule
     */
    void set_value(const std::string& key, const std::string& value,
                   const std::string& description = {}, const std::string& updated_by = "system",
                   int64_t updated_at = 0);

    std::optional<std::string> get_value(const std::string& key);

    /**
     * @brief Every stored row as key -> value, optionally limited to one
     * category
     */
    std::map<std::string, std::string> all(const std::string& category = {});

    bool remove(const std::string& key);

private:
    store::Database& db_;
};

/**
 * @brief ConfigView layering defaults, the deployment profile, stored
 * overrides and OPD_* environment variables, rebuilt at most once per TTL
 *
 * Environment variables take the form OPD_<CATEGORY>_<KEY>, for example
 * OPD_PRIORITY_PREEMPTION_THRESHOLD=250. OPD_ENV selects the profile when
 * none is given explicitly. Values failing validation are logged and
 * skipped.
 */
class CachedConfigView : public ConfigView {
public:
    struct Options {
        std::chrono::milliseconds ttl = std::chrono::minutes(5);
        std::optional<Profile> profile;  ///< unset: read OPD_ENV
        bool read_environment = true;
    };

    CachedConfigView(ConfigurationStore& store, const Clock& clock);
    CachedConfigView(ConfigurationStore& store, const Clock& clock, Options options);

    std::shared_ptr<const ConfigSnapshot> snapshot() override;

    /**
     * @brief Force the next snapshot() to rebuild
     */
    void invalidate();

    uint64_t reloads() const {
        return reloads_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<const ConfigSnapshot> build();

    ConfigurationStore& store_;
    const Clock& clock_;
    Options options_;

    std::mutex mutex_;
    std::shared_ptr<const ConfigSnapshot> cached_;
    int64_t loaded_at_ = 0;
    std::atomic<uint64_t> reloads_{0};
};

} // namespace config
} // namespace opd
