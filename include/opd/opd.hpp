#pragma once

/**
 * @file opd.hpp
 * @brief Main header of the OPD token allocation engine
 *
 * Pulls in the service facade and everything it exposes: priorities,
 * capacity management, allocation, the token lifecycle and configuration.
 */

#include "config/config.hpp"
#include "config/config_store.hpp"
#include "core/clock.hpp"
#include "core/error.hpp"
#include "core/outcome.hpp"
#include "core/records.hpp"
#include "core/request.hpp"
#include "core/types.hpp"
#include "priority/priority_calculator.hpp"
#include "service/token_service.hpp"

#include <string_view>

// Version information
#define OPD_VERSION_MAJOR 1
#define OPD_VERSION_MINOR 0
#define OPD_VERSION_PATCH 0
#define OPD_VERSION_STRING "1.0.0"

namespace opd {

inline const char *version() {
    return OPD_VERSION_STRING;
}

/**
 * @brief Set the process log level: 0 trace, 1 debug, 2 info (default),
 * 3 warn, 4 error, 5 off
 */
void set_log_level(int level);

/**
 * @brief Set the process log level by name ("trace" .. "off")
 * @return false when the name is unknown; the level is left unchanged
 */
bool set_log_level(std::string_view name);

} // namespace opd
