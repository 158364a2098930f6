#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>

namespace opd::concepts {

/**
 * @brief Record carrying an optimistic-lock version counter
 */
template <typename R>
concept Versioned = requires(R record) {
    { record.version } -> std::convertible_to<int64_t>;
};

/**
 * @brief Store offering a plain load and a version-checked save
 */
template <typename S>
concept VersionedStore =
    Versioned<typename S::record_type> &&
    requires(S store, const std::string& id, typename S::record_type& record) {
        { store.load(id) } -> std::same_as<std::optional<typename S::record_type>>;
        { store.save(record) } -> std::same_as<void>;
        { S::entity_name() } -> std::convertible_to<const char *>;
    };

/**
 * @brief Callable that edits a loaded record in place
 */
template <typename F, typename R>
concept RecordMutator = std::invocable<F&, R&>;

} // namespace opd::concepts
