/**
 * @file mqtt_socket_pair.cpp
 * @brief 通过 asio 本地 socket 对演示同步收发：客户端线程与“broker”线程交换报文
 *
 * 流程：CONNECT -> CONNACK，SUBSCRIBE -> SUBACK，PUBLISH(qos1) -> PUBACK，
 * PINGREQ -> PINGRESP，最后 DISCONNECT 并关闭连接。
 */

#include <mqtt/codec/codec.hpp>
#include <mqtt/core/asio_stream.hpp>
#include <mqtt/core/error.hpp>
#include <mqtt/core/log.hpp>
#include <mqtt/utils/packet_dump.hpp>

#include <asio/io_context.hpp>
#include <asio/local/connect_pair.hpp>
#include <asio/local/stream_protocol.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

using namespace mqtt;
using Socket = asio::local::stream_protocol::socket;

namespace {

std::mutex g_print_mutex;

void print(const char *who, const codec::Message &msg) {
    utils::PacketDumpOptions options;
    std::lock_guard<std::mutex> lock(g_print_mutex);
    std::cout << "[" << who << "] " << utils::dump_message(msg, options);
}

// broker：对每个请求给出应答，直到收到 DISCONNECT 或连接关闭。
void run_broker(Socket &socket) {
    core::AsioReader<Socket> reader(socket);
    core::AsioWriter<Socket> writer(socket);

    for (;;) {
        codec::Message request;
        auto ec = codec::decode_read(reader, request);
        if (ec == core::errc::end_of_stream) {
            return;
        }
        if (ec) {
            std::cerr << "[broker] decode failed: " << ec.message() << "\n";
            return;
        }
        print("broker <-", request);

        std::optional<codec::Message> reply;
        if (std::holds_alternative<codec::Connect>(request)) {
            reply = codec::ConnAck{};
        } else if (const auto *sub = std::get_if<codec::Subscribe>(&request)) {
            codec::SubAck ack;
            ack.message_id = sub->message_id;
            for (const auto &s : sub->subscriptions) {
                ack.granted_qos.push_back(s.qos);
            }
            reply = ack;
        } else if (const auto *pub = std::get_if<codec::Publish>(&request)) {
            if (codec::has_id(pub->header.qos)) {
                codec::PubAck ack;
                ack.message_id = pub->message_id;
                reply = ack;
            }
        } else if (std::holds_alternative<codec::PingReq>(request)) {
            reply = codec::PingResp{};
        } else if (std::holds_alternative<codec::Disconnect>(request)) {
            return;
        }

        if (reply) {
            ec = codec::encode(*reply, writer);
            if (ec) {
                std::cerr << "[broker] encode failed: " << ec.message() << "\n";
                return;
            }
        }
    }
}

bool exchange(core::Writer &writer, core::Reader &reader, const codec::Message &request) {
    auto ec = codec::encode(request, writer);
    if (ec) {
        std::cerr << "[client] encode failed: " << ec.message() << "\n";
        return false;
    }
    codec::Message reply;
    ec = codec::decode_read(reader, reply);
    if (ec) {
        std::cerr << "[client] decode failed: " << ec.message() << "\n";
        return false;
    }
    print("client <-", reply);
    return true;
}

} // namespace

int main() {
    core::set_log_level(core::LogLevel::debug);

    asio::io_context io;
    Socket client(io);
    Socket broker(io);
    asio::local::connect_pair(client, broker);

    std::thread broker_thread([&broker] { run_broker(broker); });

    core::AsioReader<Socket> reader(client);
    core::AsioWriter<Socket> writer(client);

    codec::Connect connect;
    connect.clean_session = true;
    connect.keep_alive = 30;
    connect.client_id = "socket-pair-demo";

    codec::Subscribe subscribe;
    subscribe.message_id = 1;
    subscribe.subscriptions = {{"demo/#", codec::QosLevel::at_least_once}};

    codec::Publish publish;
    publish.header.qos = codec::QosLevel::at_least_once;
    publish.topic = "demo/hello";
    publish.message_id = 2;
    publish.payload = {'h', 'e', 'l', 'l', 'o'};

    bool ok = exchange(writer, reader, codec::Message{connect}) &&
              exchange(writer, reader, codec::Message{subscribe}) &&
              exchange(writer, reader, codec::Message{publish}) &&
              exchange(writer, reader, codec::Message{codec::PingReq{}});

    const auto ec = codec::encode(codec::Message{codec::Disconnect{}}, writer);
    if (ec) {
        std::cerr << "[client] encode failed: " << ec.message() << "\n";
        ok = false;
    }

    std::error_code close_ec;
    client.shutdown(asio::socket_base::shutdown_send, close_ec);
    broker_thread.join();
    return ok ? 0 : 1;
}
