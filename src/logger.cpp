#include <imginfo/log.hpp>
#include "logger.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <memory>

namespace imginfo {

namespace {

spdlog::level::level_enum convert_level(log_level level) noexcept {
    switch (level) {
        case log_level::off:   return spdlog::level::off;
        case log_level::error: return spdlog::level::err;
        case log_level::warn:  return spdlog::level::warn;
        case log_level::info:  return spdlog::level::info;
        case log_level::debug: return spdlog::level::debug;
        case log_level::trace: return spdlog::level::trace;
    }
    return spdlog::level::off;
}

log_level level_from_environment() noexcept {
    const char* env = std::getenv("IMGINFO_LOG_LEVEL");
    if (!env) {
        return log_level::off;
    }
    if (!std::strcmp(env, "error") || !std::strcmp(env, "ERROR")) return log_level::error;
    if (!std::strcmp(env, "warn") || !std::strcmp(env, "WARN")) return log_level::warn;
    if (!std::strcmp(env, "info") || !std::strcmp(env, "INFO")) return log_level::info;
    if (!std::strcmp(env, "debug") || !std::strcmp(env, "DEBUG")) return log_level::debug;
    if (!std::strcmp(env, "trace") || !std::strcmp(env, "TRACE")) return log_level::trace;
    return log_level::off;
}

std::shared_ptr<spdlog::logger> create_logger() {
    // Kept out of the spdlog registry
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("imginfo", std::move(sink));
    log->set_pattern("[%n] [%l] %v");
    log->set_level(convert_level(level_from_environment()));
    return log;
}

} // namespace

namespace detail {

spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return *instance;
}

} // namespace detail

void set_log_level(log_level level) {
    detail::logger().set_level(convert_level(level));
}

log_level get_log_level() {
    switch (detail::logger().level()) {
        case spdlog::level::trace:    return log_level::trace;
        case spdlog::level::debug:    return log_level::debug;
        case spdlog::level::info:     return log_level::info;
        case spdlog::level::warn:     return log_level::warn;
        case spdlog::level::err:      return log_level::error;
        case spdlog::level::critical: return log_level::error;
        default:                      return log_level::off;
    }
}

} // namespace imginfo
