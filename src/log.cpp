#include "rangefetch/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rangefetch {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
        instance = spdlog::get("rangefetch");
        if (!instance) {
            instance = spdlog::stderr_color_mt("rangefetch");
            instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace rangefetch
