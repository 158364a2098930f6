#pragma once

#include <opd/store/database.hpp>

namespace opd {
namespace store {

constexpr int kSchemaVersion = 1;

/**
 * @brief Create or upgrade the slots, tokens and configurations tables
 */
void ensure_schema(Database& db);

} // namespace store
} // namespace opd
