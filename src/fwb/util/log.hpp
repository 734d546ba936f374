#pragma once

#include <fmt/core.h>

#include <string_view>

namespace fwb::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

inline bool level_enabled(level l) { return int(l) >= int(current_log_level); }

template <typename... Args>
void log(level l, fmt::format_string<const Args&...> s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        auto message = fmt::format(s, args...);
        log_print(l, message);
    }
}

#define fwb_log(Level, str, ...)                                                                   \
    do {                                                                                           \
        if (int(fwb::log::level::Level) >= int(fwb::log::current_log_level)) {                     \
            ::fwb::log::log(::fwb::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);             \
        }                                                                                          \
    } while (0)

}  // namespace fwb::log
