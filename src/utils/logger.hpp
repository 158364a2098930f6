#pragma once

#include "time_utils.hpp"

#include <atomic>
#include <concepts>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace opd {

enum LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, OFF = 5 };

struct GlobalContext {
    static thread_local std::string thread_context;
    std::mutex stdout_mutex;
    std::atomic<int> global_log_level{LogLevel::INFO};
    std::atomic<bool> use_colors{true};
};

inline GlobalContext& getGlobalContext() {
    static GlobalContext instance;
    return instance;
}

inline thread_local std::string GlobalContext::thread_context{"main"};

/**
 * @brief Names the calling thread in subsequent log lines
 */
inline void set_thread_context(const std::string& name) {
    GlobalContext::thread_context = name;
}

template <typename T>
concept Streamable = requires(std::ostream& os, T const& t) {
    { os << t } -> std::convertible_to<std::ostream&>;
};
template <typename T>
concept HasToString = requires(T t) {
    { t.toString() } -> std::convertible_to<std::string>;
};
template <typename T>
concept EssentiallyStreamable = Streamable<T> || HasToString<T>;

template <typename T>
    requires EssentiallyStreamable<T>
inline void concat_one(std::stringstream& currentstream, const T& value) {
    if constexpr (Streamable<T>)
        currentstream << value;
    else
        currentstream << value.toString();
}

template <typename... Args>
inline void concat_multi_parameter_inputs(std::stringstream& currentstream,
                                          const Args &...args) {
    (concat_one(currentstream, args), ...);
}

namespace detail {

template <typename... Args>
inline void emit(LogLevel level, const char *tag, const char *color, const Args &...args) {
    auto& ctx = getGlobalContext();
    if (ctx.global_log_level.load(std::memory_order_relaxed) > level) {
        return;
    }
    bool colored = color != nullptr && ctx.use_colors.load(std::memory_order_relaxed);
    std::stringstream oss;
    if (colored)
        oss << color;
    oss << GetTimestamp() << " [" << tag << "] [" << GlobalContext::thread_context << "] ";
    concat_multi_parameter_inputs(oss, args...);
    if (colored)
        oss << "\033[0m";
    oss << "\n";
    std::lock_guard<std::mutex> lock(ctx.stdout_mutex);
    std::cout << oss.str();
    std::cout.flush();
}

} // namespace detail

template <typename T, typename... Args>
    requires EssentiallyStreamable<T>
inline void log_trace(const T& first, const Args &...args) {
    detail::emit(LogLevel::TRACE, "TRACE", "\033[0;37m", first, args...);
}

template <typename T, typename... Args>
    requires EssentiallyStreamable<T>
inline void log_debug(const T& first, const Args &...args) {
    detail::emit(LogLevel::DEBUG, "DEBUG", "\033[1;34m", first, args...);
}

template <typename T, typename... Args>
    requires EssentiallyStreamable<T>
inline void log_info(const T& first, const Args &...args) {
    detail::emit(LogLevel::INFO, "INFO ", nullptr, first, args...);
}

template <typename T, typename... Args>
    requires EssentiallyStreamable<T>
inline void log_warn(const T& first, const Args &...args) {
    detail::emit(LogLevel::WARN, "WARN ", "\033[1;33m", first, args...);
}

template <typename T, typename... Args>
    requires EssentiallyStreamable<T>
inline void log_error(const T& first, const Args &...args) {
    detail::emit(LogLevel::ERROR, "ERROR", "\033[1;31m", first, args...);
}

} // namespace opd
