/**
 * @file mqtt_hex_dump.cpp
 * @brief 把十六进制字符串解析为 MQTT 报文并逐个输出字段
 *
 * 运行：
 * - 无参数：输出一组内置报文（CONNECT / PUBLISH / SUBSCRIBE / PINGREQ）
 * - 指定输入（将十六进制字符串整体作为一个参数传入，可包含多个连续报文）：
 *   - ./build/mqtt_hex_dump "<hex>" [--no-hex] [--debug]
 */

#include <mqtt/codec/codec.hpp>
#include <mqtt/core/common.hpp>
#include <mqtt/core/log.hpp>
#include <mqtt/utils/hex.hpp>
#include <mqtt/utils/packet_dump.hpp>

#include <cstddef>
#include <iostream>
#include <string_view>
#include <vector>

using namespace mqtt;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

std::vector<core::byte> builtin_stream() {
    std::vector<core::byte> out;

    codec::Connect connect;
    connect.clean_session = true;
    connect.keep_alive = 10;
    connect.client_id = "xixihaha";
    connect.will_flag = true;
    connect.will_qos = codec::QosLevel::at_least_once;
    connect.will_topic = "topic";
    connect.will_message = "message";
    connect.username_flag = true;
    connect.username = "name";
    connect.password_flag = true;
    connect.password = "pwd";

    codec::Publish publish;
    publish.header.qos = codec::QosLevel::at_least_once;
    publish.topic = "sensors/temperature";
    publish.message_id = 1;
    publish.payload = {'2', '1', '.', '5'};

    codec::Subscribe subscribe;
    subscribe.message_id = 2;
    subscribe.subscriptions = {{"sensors/#", codec::QosLevel::at_least_once}};

    for (const codec::Message &m : {codec::Message{connect},
                                    codec::Message{publish},
                                    codec::Message{subscribe},
                                    codec::Message{codec::PingReq{}}}) {
        const auto ec = codec::encode(m, out);
        if (ec) {
            std::cerr << "encode failed: " << ec.message() << "\n";
        }
    }
    return out;
}

} // namespace

int main(int argc, char **argv) {
    core::set_log_level(has_flag(argc, argv, "--debug") ? core::LogLevel::debug
                                                        : core::LogLevel::warn);

    std::vector<core::byte> input;
    if (argc >= 2 && std::string_view(argv[1]).rfind("--", 0) != 0) {
        const auto ec = utils::parse_hex(argv[1], input);
        if (ec) {
            std::cerr << "invalid hex input: " << ec.message() << "\n";
            std::cerr << "usage: " << argv[0] << " \"<hex>\" [--no-hex] [--debug]\n";
            return 2;
        }
    } else {
        input = builtin_stream();
    }

    utils::PacketDumpOptions options;
    options.include_hex = !has_flag(argc, argv, "--no-hex");

    core::bytes_view rest{input.data(), input.size()};
    std::size_t index = 0;
    while (!rest.empty()) {
        codec::Message msg;
        std::size_t consumed = 0;
        const auto ec = codec::decode_one(rest, msg, consumed, options.limits);
        std::cout << "=== packet #" << index << " ===\n";
        if (ec) {
            // 输出失败位置的原始字节与错误信息后停止。
            std::cout << utils::dump_packet(rest, options);
            return 1;
        }
        std::cout << utils::dump_packet(rest.first(consumed), options) << "\n";
        rest = rest.subspan(consumed);
        ++index;
    }
    return 0;
}
