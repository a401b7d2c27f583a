#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace rangefetch {

// Shared "rangefetch" logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace rangefetch
