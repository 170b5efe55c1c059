#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace lspc {

/// Library-wide logger, named "lspc". Until set_logger() is called it writes
/// to a null sink so the library stays quiet inside a terminal UI.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library-wide logger. Passing nullptr restores the silent one.
void set_logger(std::shared_ptr<spdlog::logger> new_logger);

} // namespace lspc
