#include "mqtt/core/log.hpp"

#include "core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <new>

namespace mqtt::core {
namespace {

constexpr const char *kLoggerName = "mqtt";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已经注册了同名 logger（例如换成文件 sink），优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex &) {
        // 并发注册了同名 logger：复用已注册的那个。
    } catch (const std::bad_alloc &) {
        // 创建 sink 失败：走下面的回退路径。
    }
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    // 无 sink 的 logger：丢弃日志，但库仍可工作。
    return std::make_shared<spdlog::logger>(kLoggerName);
}

} // namespace

namespace detail {

spdlog::logger &logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    // spdlog::set_level 只作用于已注册的 logger；先确保库 logger 已创建。
    detail::logger().set_level(to_spdlog_level(level));
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

} // namespace mqtt::core
