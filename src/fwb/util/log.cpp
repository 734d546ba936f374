#include "./log.hpp"

#include <spdlog/spdlog.h>

using namespace fwb;

void fwb::log::init_logger() noexcept { spdlog::set_pattern("[%^%-5l%$] %v"); }

void fwb::log::log_print(fwb::log::level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        logger->set_level(spdlog::level::trace);
        return logger;
    }();

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        return spdlog::level::critical;
    }();

    logger_inst->log(lvl, "{}", msg);
}
