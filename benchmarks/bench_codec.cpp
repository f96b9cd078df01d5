#include "bench_main.hpp"
#include "mqtt/codec/codec.hpp"
#include "mqtt/core/log.hpp"
#include "mqtt/core/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace mqtt;
using namespace mqtt::codec;
using mqtt::core::byte;
using mqtt::core::bytes_view;

static Publish make_publish(std::size_t payload_size) {
  Publish p;
  p.header.qos = QosLevel::at_least_once;
  p.topic = "factory/line-3/station-12/telemetry";
  p.message_id = 4096;
  p.payload.assign(payload_size, 0x5A);
  return p;
}

static void bench_publish(std::size_t payload_size, std::size_t count, const char *enc_name,
                          const char *dec_name) {
  const Message msg{make_publish(payload_size)};
  std::vector<byte> one;
  if (encode(msg, one)) {
    std::cerr << "Encode failed\n";
    return;
  }
  std::vector<byte> stream;
  stream.reserve(count * one.size());

  BENCH_RUN(enc_name, count * one.size(), count, 5, {
    stream.clear();
    for (std::size_t i = 0; i < count; ++i) {
      auto ec = encode(msg, stream);
      if (ec) {
        std::cerr << "Encode failed: " << ec.message() << "\n";
        break;
      }
    }
  });

  BENCH_RUN(dec_name, stream.size(), count, 5, {
    bytes_view rest(stream.data(), stream.size());
    Message decoded;
    while (!rest.empty()) {
      std::size_t consumed = 0;
      auto ec = decode_one(rest, decoded, consumed);
      if (ec) {
        std::cerr << "Decode failed: " << ec.message() << "\n";
        break;
      }
      rest = rest.subspan(consumed);
    }
  });
}

static void bench_small_control_packets() {
  constexpr std::size_t count = 100'000;
  std::vector<byte> stream;
  PubAck ack;
  for (std::size_t i = 0; i < count; ++i) {
    ack.message_id = static_cast<std::uint16_t>(i);
    if (encode(Message{ack}, stream)) {
      std::cerr << "Encode failed\n";
      return;
    }
    if (encode(Message{PingReq{}}, stream)) {
      std::cerr << "Encode failed\n";
      return;
    }
  }

  BENCH_RUN("PUBACK+PINGREQ: decode_read (200k packets)", stream.size(), count * 2, 5, {
    core::BytesReader reader(bytes_view{stream.data(), stream.size()});
    Message decoded;
    for (std::size_t i = 0; i < count * 2; ++i) {
      auto ec = decode_read(reader, decoded);
      if (ec) {
        std::cerr << "Decode failed: " << ec.message() << "\n";
        break;
      }
    }
  });
}

static void bench_connect() {
  Connect c;
  c.clean_session = true;
  c.keep_alive = 30;
  c.client_id = "bench-client-0001";
  c.username_flag = true;
  c.username = "operator";
  c.password_flag = true;
  c.password = "hunter2";
  const Message msg{c};

  constexpr std::size_t count = 50'000;
  std::vector<byte> one;
  if (encode(msg, one)) {
    std::cerr << "Encode failed\n";
    return;
  }
  std::vector<byte> stream;

  BENCH_RUN("CONNECT: encode (50k packets)", count * one.size(), count, 5, {
    stream.clear();
    for (std::size_t i = 0; i < count; ++i) {
      if (encode(msg, stream)) {
        break;
      }
    }
  });

  BENCH_RUN("CONNECT: decode_one (50k packets)", stream.size(), count, 5, {
    bytes_view rest(stream.data(), stream.size());
    Message decoded;
    std::size_t consumed = 0;
    while (!rest.empty() && !decode_one(rest, decoded, consumed)) {
      rest = rest.subspan(consumed);
    }
  });
}

int main() {
  core::set_log_level(core::LogLevel::off);

  bench_publish(16, 100'000, "PUBLISH 16B: encode (100k packets)",
                "PUBLISH 16B: decode_one (100k packets)");
  bench_publish(1024, 20'000, "PUBLISH 1KB: encode (20k packets)",
                "PUBLISH 1KB: decode_one (20k packets)");
  bench_publish(256 * 1024, 64, "PUBLISH 256KB: encode (64 packets)",
                "PUBLISH 256KB: decode_one (64 packets)");
  bench_small_control_packets();
  bench_connect();

  benchmarks::print_results();
  return 0;
}
