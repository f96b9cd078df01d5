#include "mqtt/codec/codec.hpp"
#include "mqtt/core/log.hpp"

#include "test_main.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <vector>

namespace {

using mqtt::core::LogLevel;
using mqtt::core::log_level;
using mqtt::core::set_log_level;

std::ostringstream &captured() {
    static std::ostringstream oss;
    return oss;
}

// 必须在库第一次写日志之前调用：库应复用业务侧已注册的 "mqtt" logger。
void test_registered_logger_is_reused() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured());
    auto app_logger = std::make_shared<spdlog::logger>("mqtt", sink);
    app_logger->set_level(spdlog::level::warn);
    spdlog::register_logger(app_logger);

    // 库读到的是业务侧设置的级别，而不是新建 logger 的默认级别。
    TEST_EXPECT_EQ(log_level(), LogLevel::warn);

    set_log_level(LogLevel::debug);
    TEST_EXPECT_EQ(app_logger->level(), spdlog::level::debug);

    mqtt::codec::Message msg;
    std::size_t consumed = 0;
    auto ec = mqtt::codec::decode_one(mqtt::tests::bytes({0x20, 0x02, 0x00, 0x06}), msg, consumed);
    TEST_EXPECT(ec == mqtt::codec::errc::bad_return_code);
    app_logger->flush();
    TEST_EXPECT(!captured().str().empty());

    set_log_level(LogLevel::off);
}

void test_log_level_roundtrip() {
    set_log_level(LogLevel::trace);
    TEST_EXPECT_EQ(log_level(), LogLevel::trace);

    set_log_level(LogLevel::debug);
    TEST_EXPECT_EQ(log_level(), LogLevel::debug);

    set_log_level(LogLevel::info);
    TEST_EXPECT_EQ(log_level(), LogLevel::info);

    set_log_level(LogLevel::warn);
    TEST_EXPECT_EQ(log_level(), LogLevel::warn);

    set_log_level(LogLevel::error);
    TEST_EXPECT_EQ(log_level(), LogLevel::error);

    set_log_level(LogLevel::critical);
    TEST_EXPECT_EQ(log_level(), LogLevel::critical);

    set_log_level(LogLevel::off);
    TEST_EXPECT_EQ(log_level(), LogLevel::off);
}

void test_decode_failure_logging_does_not_change_result() {
    // debug 级别下解码失败会写日志；结果与关闭日志时一致。
    const auto bad = mqtt::tests::bytes({0x20, 0x02, 0x00, 0x06});
    for (auto level : {LogLevel::debug, LogLevel::off}) {
        set_log_level(level);
        mqtt::codec::Message msg;
        std::size_t consumed = 0;
        auto ec = mqtt::codec::decode_one(bad, msg, consumed);
        TEST_EXPECT(ec == mqtt::codec::errc::bad_return_code);
        TEST_EXPECT_EQ(consumed, 0u);
    }
    set_log_level(LogLevel::off);
}

} // namespace

int main() {
    test_registered_logger_is_reused();
    test_log_level_roundtrip();
    test_decode_failure_logging_does_not_change_result();
    return ::mqtt::tests::run_and_report();
}
