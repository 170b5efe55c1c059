#include "lspc/logging.hpp"
#include <mutex>
#include <spdlog/sinks/null_sink.h>

namespace lspc {

namespace {

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> make_silent_logger() {
    return std::make_shared<spdlog::logger>("lspc", std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::shared_ptr<spdlog::logger>& current_logger() {
    static std::shared_ptr<spdlog::logger> instance = make_silent_logger();
    return instance;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return current_logger();
}

void set_logger(std::shared_ptr<spdlog::logger> new_logger) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger() = new_logger ? std::move(new_logger) : make_silent_logger();
}

} // namespace lspc
