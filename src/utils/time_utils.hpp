#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace opd {

/**
 * @brief Returns the epoch timestamp in milliseconds.
 */
inline uint64_t get_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Get formatted timestamp string for logging
 * @return std::string Formatted timestamp
 */
inline std::string GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace dates {

/**
 * @brief UTC calendar date (YYYY-MM-DD) of an epoch millisecond timestamp
 */
inline std::string format_date(int64_t epoch_ms) {
    using namespace std::chrono;
    sys_days day = floor<days>(sys_time<milliseconds>(milliseconds(epoch_ms)));
    year_month_day ymd(day);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buffer;
}

/**
 * @brief Parse a strict YYYY-MM-DD calendar date
 */
inline std::optional<std::chrono::sys_days> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return std::nullopt;
    }
    auto number = [&](size_t pos, size_t len) {
        unsigned value = 0;
        for (size_t i = pos; i < pos + len; ++i)
            value = value * 10 + static_cast<unsigned>(text[i] - '0');
        return value;
    };
    std::chrono::year_month_day ymd{std::chrono::year(static_cast<int>(number(0, 4))),
                                    std::chrono::month(number(5, 2)),
                                    std::chrono::day(number(8, 2))};
    if (!ymd.ok())
        return std::nullopt;
    return std::chrono::sys_days(ymd);
}

/**
 * @brief Shift a YYYY-MM-DD date by a number of days
 */
inline std::string add_days(std::string_view date, int days) {
    auto parsed = parse_date(date);
    if (!parsed)
        return std::string(date);
    auto shifted = *parsed + std::chrono::days(days);
    return format_date(
        std::chrono::duration_cast<std::chrono::milliseconds>(shifted.time_since_epoch())
            .count());
}

/**
 * @brief Minutes since midnight for an HH:MM string
 */
inline std::optional<int> parse_time_of_day(std::string_view text) {
    if (text.size() != 5 || text[2] != ':')
        return std::nullopt;
    auto digit = [](char c) { return c >= '0' && c <= '9'; };
    if (!digit(text[0]) || !digit(text[1]) || !digit(text[3]) || !digit(text[4]))
        return std::nullopt;
    int hours = (text[0] - '0') * 10 + (text[1] - '0');
    int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    if (hours > 23 || minutes > 59)
        return std::nullopt;
    return hours * 60 + minutes;
}

} // namespace dates

} // namespace opd
