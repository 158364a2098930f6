#include <opd/opd.hpp>

#include "utils/logger.hpp"

#include <algorithm>
#include <utility>

namespace opd {

void set_log_level(int level) {
    getGlobalContext().global_log_level.store(std::clamp(level, 0, static_cast<int>(OFF)));
}

bool set_log_level(std::string_view name) {
    static constexpr std::pair<std::string_view, LogLevel> kLevels[] = {
        {"trace", TRACE}, {"debug", DEBUG}, {"info", INFO},
        {"warn", WARN},   {"error", ERROR}, {"off", OFF}};
    for (const auto& [level_name, level] : kLevels) {
        if (level_name == name) {
            set_log_level(static_cast<int>(level));
            return true;
        }
    }
    log_warn("Unknown log level '", name, "'");
    return false;
}

} // namespace opd
