#include "mqtt/codec/codec.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/core/error.hpp"
#include "mqtt/core/log.hpp"
#include "mqtt/core/stream.hpp"

#include "test_main.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

using namespace mqtt::codec;
using mqtt::core::byte;
using mqtt::core::BytesReader;
using mqtt::core::VectorWriter;

void append_str(std::vector<byte>& out, std::string_view s) {
  out.push_back(static_cast<byte>(s.size() >> 8));
  out.push_back(static_cast<byte>(s.size() & 0xFF));
  out.insert(out.end(), s.begin(), s.end());
}

std::vector<byte> encode_ok(const Message& msg) {
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(msg, out));
  return out;
}

// 经由 decode_one 和 decode_read 两条路径解码，结果必须一致。
void expect_roundtrip(const Message& msg) {
  const auto wire = encode_ok(msg);

  Message via_buffer;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(wire, via_buffer, consumed));
  TEST_EXPECT_EQ(consumed, wire.size());
  TEST_EXPECT(via_buffer == msg);

  BytesReader reader(wire);
  Message via_reader;
  TEST_EXPECT_OK(decode_read(reader, via_reader));
  TEST_EXPECT_EQ(reader.remaining(), 0u);
  TEST_EXPECT(via_reader == msg);
  TEST_EXPECT_EQ(message_type(via_reader), message_type(msg));
}

Connect scenario_connect() {
  Connect c;
  c.protocol_name = "MQIsdp";
  c.protocol_version = 3;
  c.username_flag = true;
  c.password_flag = true;
  c.will_retain = false;
  c.will_qos = QosLevel::at_least_once;
  c.will_flag = true;
  c.clean_session = true;
  c.keep_alive = 10;
  c.client_id = "xixihaha";
  c.will_topic = "topic";
  c.will_message = "message";
  c.username = "name";
  c.password = "pwd";
  return c;
}

void test_connect_wire_bytes() {
  const auto wire = encode_ok(Message{scenario_connect()});

  std::vector<byte> expected{0x10, 0x31};
  append_str(expected, "MQIsdp");
  expected.push_back(0x03);
  expected.push_back(0xCE);
  expected.push_back(0x00);
  expected.push_back(0x0A);
  append_str(expected, "xixihaha");
  append_str(expected, "topic");
  append_str(expected, "message");
  append_str(expected, "name");
  append_str(expected, "pwd");

  TEST_EXPECT_EQ(expected.size(), 2u + 0x31u);
  TEST_EXPECT_EQ(wire, expected);
  expect_roundtrip(Message{scenario_connect()});
}

void test_connect_optional_fields() {
  Connect bare;
  bare.client_id = "c1";
  bare.keep_alive = 60;
  expect_roundtrip(Message{bare});

  // will 未置位：wire 上不出现 will 字段。
  const auto wire = encode_ok(Message{bare});
  TEST_EXPECT_EQ(wire.size(), 2u + 12u + 4u);
  TEST_EXPECT_EQ(wire[11], 0x00);

  Connect user_only = bare;
  user_only.username_flag = true;
  user_only.username = "u";
  user_only.will_retain = true;
  expect_roundtrip(Message{user_only});
}

void test_connect_bad_will_qos() {
  Connect c = scenario_connect();
  c.will_qos = static_cast<QosLevel>(3);
  std::vector<byte> out;
  TEST_EXPECT_ERR(encode(Message{c}, out), errc::bad_will_qos);
  TEST_EXPECT(out.empty());

  // connect flags 中 will qos 位为 11。
  auto wire = encode_ok(Message{scenario_connect()});
  wire[11] = static_cast<byte>(wire[11] | 0x18);
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(wire, msg, consumed), errc::bad_will_qos);
}

void test_connack() {
  for (int code = 0; code <= 5; ++code) {
    ConnAck ack;
    ack.return_code = static_cast<ReturnCode>(code);
    const auto wire = encode_ok(Message{ack});
    TEST_EXPECT_EQ(wire, mqtt::tests::bytes({0x20, 0x02, 0x00, code}));
    expect_roundtrip(Message{ack});
  }

  const auto bad = mqtt::tests::bytes({0x20, 0x02, 0x00, 0x06});
  BytesReader reader(bad);
  Message msg{PingReq{}};
  TEST_EXPECT_ERR(decode_read(reader, msg), errc::bad_return_code);
  TEST_EXPECT(std::holds_alternative<PingReq>(msg));
}

void test_publish_qos_dependent_id() {
  Publish p0;
  p0.topic = "a/b";
  p0.message_id = 0;
  p0.payload = mqtt::tests::bytes({'h', 'i'});
  TEST_EXPECT_EQ(encode_ok(Message{p0}),
                 mqtt::tests::bytes({0x30, 0x07, 0x00, 0x03, 'a', '/', 'b', 'h', 'i'}));
  expect_roundtrip(Message{p0});

  Publish p1 = p0;
  p1.header.qos = QosLevel::at_least_once;
  p1.message_id = 0x0102;
  TEST_EXPECT_EQ(encode_ok(Message{p1}),
                 mqtt::tests::bytes({0x32, 0x09, 0x00, 0x03, 'a', '/', 'b', 0x01, 0x02, 'h', 'i'}));
  expect_roundtrip(Message{p1});

  Publish p2 = p1;
  p2.header = Header{true, true, QosLevel::exactly_once};
  p2.payload.clear();
  expect_roundtrip(Message{p2});
}

void test_publish_qos3_encode_writes_nothing() {
  Publish p;
  p.header.qos = static_cast<QosLevel>(3);
  p.topic = "t";

  std::vector<byte> out{0xAA};
  VectorWriter writer(out);
  TEST_EXPECT_ERR(encode(Message{p}, writer), errc::bad_qos);
  TEST_EXPECT_EQ(writer.write_count(), 0u);
  TEST_EXPECT_EQ(out, mqtt::tests::bytes({0xAA}));
}

void test_publish_qos3_decode_rejected() {
  const auto wire = mqtt::tests::bytes({0x36, 0x03, 0x00, 0x01, 't'});
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(wire, msg, consumed), errc::bad_qos);
}

void test_publish_topic_too_long() {
  Publish p;
  p.topic.assign(0x10000, 't');
  std::vector<byte> out;
  TEST_EXPECT_ERR(encode(Message{p}, out), errc::field_too_long);
  TEST_EXPECT(out.empty());
}

void test_truncated_publish() {
  Publish p;
  p.header.qos = QosLevel::at_least_once;
  p.topic = "sensors/temperature";
  p.message_id = 7;
  p.payload = mqtt::tests::bytes({1, 2, 3, 4, 5, 6, 7, 8});
  const auto wire = encode_ok(Message{p});

  // 在每个位置截断：流式读取得到 truncated（首字节前为 end_of_stream）。
  for (std::size_t cut = 1; cut < wire.size(); ++cut) {
    const std::vector<byte> prefix(wire.begin(), wire.begin() + static_cast<std::ptrdiff_t>(cut));
    BytesReader reader(prefix);
    Message msg;
    TEST_EXPECT_ERR(decode_read(reader, msg), errc::truncated);

    std::size_t consumed = 99;
    TEST_EXPECT_ERR(decode_one(prefix, msg, consumed), errc::truncated);
    TEST_EXPECT_EQ(consumed, 0u);
  }
}

void test_subscribe_and_suback() {
  Subscribe sub;
  sub.message_id = 10;
  sub.subscriptions = {{"a/#", QosLevel::at_most_once}, {"b/+", QosLevel::exactly_once}};
  const auto wire = encode_ok(Message{sub});
  TEST_EXPECT_EQ(wire[0], 0x82);
  expect_roundtrip(Message{sub});

  Subscribe bad = sub;
  bad.subscriptions[1].qos = static_cast<QosLevel>(3);
  std::vector<byte> out;
  TEST_EXPECT_ERR(encode(Message{bad}, out), errc::bad_qos);
  TEST_EXPECT(out.empty());

  auto bad_wire = wire;
  bad_wire.back() = 0x03;
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(bad_wire, msg, consumed), errc::bad_qos);

  SubAck ack;
  ack.message_id = 10;
  ack.granted_qos = {QosLevel::at_most_once, QosLevel::exactly_once};
  expect_roundtrip(Message{ack});

  // granted 字节只取低 2 位。
  const auto raw = mqtt::tests::bytes({0x90, 0x04, 0x00, 0x0A, 0x80, 0x01});
  TEST_EXPECT_OK(decode_one(raw, msg, consumed));
  const auto* got = std::get_if<SubAck>(&msg);
  TEST_EXPECT(got != nullptr);
  if (got != nullptr) {
    TEST_EXPECT_EQ(got->granted_qos.size(), 2u);
    TEST_EXPECT_EQ(got->granted_qos[0], QosLevel::at_most_once);
    TEST_EXPECT_EQ(got->granted_qos[1], QosLevel::at_least_once);
  }
}

void test_unsubscribe() {
  Unsubscribe u;
  u.message_id = 0x1234;
  u.topics = {"a", "b/c"};
  TEST_EXPECT_EQ(encode_ok(Message{u}),
                 mqtt::tests::bytes({0xA2, 0x0A, 0x12, 0x34, 0x00, 0x01, 'a', 0x00, 0x03, 'b', '/', 'c'}));
  expect_roundtrip(Message{u});

  Unsubscribe qos0;
  qos0.header.qos = QosLevel::at_most_once;
  qos0.topics = {"x"};
  expect_roundtrip(Message{qos0});
}

void test_subscribe_header_qos() {
  // 固定头 QoS=0：不写 message id。
  Subscribe qos0;
  qos0.header.qos = QosLevel::at_most_once;
  qos0.subscriptions = {{"a", QosLevel::at_least_once}};
  TEST_EXPECT_EQ(encode_ok(Message{qos0}), mqtt::tests::bytes({0x80, 0x04, 0x00, 0x01, 'a', 0x01}));
  expect_roundtrip(Message{qos0});

  // 固定头 QoS=3：在读取任何字段之前拒绝。
  Message msg;
  std::size_t consumed = 0;
  const auto sub3 = mqtt::tests::bytes({0x86, 0x06, 0x00, 0x01, 0x00, 0x01, 'a', 0x00});
  TEST_EXPECT_ERR(decode_one(sub3, msg, consumed), errc::bad_qos);
  TEST_EXPECT_EQ(consumed, 0u);

  const auto unsub3 = mqtt::tests::bytes({0xA6, 0x05, 0x00, 0x01, 0x00, 0x01, 'a'});
  TEST_EXPECT_ERR(decode_one(unsub3, msg, consumed), errc::bad_qos);
  TEST_EXPECT_EQ(consumed, 0u);
}

void test_acks_and_header_only() {
  PubAck puback;
  puback.message_id = 1;
  PubRec pubrec;
  pubrec.message_id = 2;
  PubRel pubrel;
  pubrel.header.qos = QosLevel::at_least_once;
  pubrel.message_id = 3;
  PubComp pubcomp;
  pubcomp.message_id = 4;
  UnsubAck unsuback;
  unsuback.message_id = 0xFFFF;

  TEST_EXPECT_EQ(encode_ok(Message{puback}), mqtt::tests::bytes({0x40, 0x02, 0x00, 0x01}));
  TEST_EXPECT_EQ(encode_ok(Message{pubrel}), mqtt::tests::bytes({0x62, 0x02, 0x00, 0x03}));
  TEST_EXPECT_EQ(encode_ok(Message{unsuback}), mqtt::tests::bytes({0xB0, 0x02, 0xFF, 0xFF}));

  expect_roundtrip(Message{puback});
  expect_roundtrip(Message{pubrec});
  expect_roundtrip(Message{pubrel});
  expect_roundtrip(Message{pubcomp});
  expect_roundtrip(Message{unsuback});

  TEST_EXPECT_EQ(encode_ok(Message{PingReq{}}), mqtt::tests::bytes({0xC0, 0x00}));
  TEST_EXPECT_EQ(encode_ok(Message{PingResp{}}), mqtt::tests::bytes({0xD0, 0x00}));
  TEST_EXPECT_EQ(encode_ok(Message{Disconnect{}}), mqtt::tests::bytes({0xE0, 0x00}));
  expect_roundtrip(Message{PingReq{}});
  expect_roundtrip(Message{PingResp{}});
  expect_roundtrip(Message{Disconnect{}});
}

void test_trailing_bytes_rejected() {
  Message msg;
  std::size_t consumed = 0;

  const auto ack = mqtt::tests::bytes({0x40, 0x03, 0x00, 0x01, 0xFF});
  TEST_EXPECT_ERR(decode_one(ack, msg, consumed), errc::remaining_length_mismatch);

  const auto ping = mqtt::tests::bytes({0xC0, 0x01, 0x00});
  TEST_EXPECT_ERR(decode_one(ping, msg, consumed), errc::remaining_length_mismatch);

  const auto connack = mqtt::tests::bytes({0x20, 0x03, 0x00, 0x00, 0x00});
  TEST_EXPECT_ERR(decode_one(connack, msg, consumed), errc::remaining_length_mismatch);
}

void test_field_exceeds_remaining_length() {
  // PUBLISH 声明 remaining=4，topic 长度前缀却是 10。
  const auto wire = mqtt::tests::bytes({0x30, 0x04, 0x00, 0x0A, 'a', 'b', 'c', 'd', 'e', 'f'});
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(wire, msg, consumed), errc::remaining_length_exceeded);

  BytesReader reader(wire);
  TEST_EXPECT_ERR(decode_read(reader, msg), errc::remaining_length_exceeded);
}

void test_invalid_message_type() {
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(mqtt::tests::bytes({0x00, 0x00}), msg, consumed), errc::bad_msg_type);
  TEST_EXPECT_ERR(decode_one(mqtt::tests::bytes({0xF0, 0x00}), msg, consumed), errc::bad_msg_type);
}

void test_decode_limits() {
  Publish p;
  p.topic = "t";
  p.payload.assign(100, 0x55);
  const auto wire = encode_ok(Message{p});

  DecodeLimits limits;
  limits.max_remaining_length = 64;
  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_ERR(decode_one(wire, msg, consumed, limits), errc::packet_too_large);

  BytesReader reader(wire);
  TEST_EXPECT_ERR(decode_read(reader, msg, limits), errc::packet_too_large);
  // 负载尚未读取。
  TEST_EXPECT_EQ(reader.consumed(), 2u);

  limits.max_remaining_length = 103;
  TEST_EXPECT_OK(decode_one(wire, msg, consumed, limits));
}

void test_decode_one_stream_of_packets() {
  std::vector<byte> stream;
  TEST_EXPECT_OK(encode(Message{PingReq{}}, stream));
  PubAck ack;
  ack.message_id = 9;
  TEST_EXPECT_OK(encode(Message{ack}, stream));

  Message msg;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(stream, msg, consumed));
  TEST_EXPECT_EQ(consumed, 2u);
  TEST_EXPECT(std::holds_alternative<PingReq>(msg));

  const mqtt::core::bytes_view rest = mqtt::core::bytes_view{stream}.subspan(consumed);
  TEST_EXPECT_OK(decode_one(rest, msg, consumed));
  TEST_EXPECT_EQ(consumed, 4u);
  TEST_EXPECT(msg == Message{ack});
}

void test_decode_read_sequence_then_eof() {
  std::vector<byte> stream;
  TEST_EXPECT_OK(encode(Message{scenario_connect()}, stream));
  TEST_EXPECT_OK(encode(Message{Disconnect{}}, stream));

  BytesReader reader(stream);
  Message msg;
  TEST_EXPECT_OK(decode_read(reader, msg));
  TEST_EXPECT_EQ(message_type(msg), MessageType::connect);
  TEST_EXPECT_OK(decode_read(reader, msg));
  TEST_EXPECT_EQ(message_type(msg), MessageType::disconnect);
  TEST_EXPECT_ERR(decode_read(reader, msg), mqtt::core::errc::end_of_stream);
  TEST_EXPECT_EQ(message_type(msg), MessageType::disconnect);
}

void test_type_names() {
  TEST_EXPECT_EQ(std::string_view(to_string(MessageType::connect)), "CONNECT");
  TEST_EXPECT_EQ(std::string_view(to_string(MessageType::unsuback)), "UNSUBACK");
  TEST_EXPECT(is_valid(MessageType::disconnect));
  TEST_EXPECT(!is_valid(static_cast<MessageType>(0)));
  TEST_EXPECT(!is_valid(static_cast<MessageType>(15)));
  TEST_EXPECT(!has_id(QosLevel::at_most_once));
  TEST_EXPECT(has_id(QosLevel::exactly_once));
  TEST_EXPECT(is_valid(ReturnCode::not_authorized));
  TEST_EXPECT(!is_valid(static_cast<ReturnCode>(6)));
}

}  // namespace

int main() {
  mqtt::core::set_log_level(mqtt::core::LogLevel::off);

  test_connect_wire_bytes();
  test_connect_optional_fields();
  test_connect_bad_will_qos();
  test_connack();
  test_publish_qos_dependent_id();
  test_publish_qos3_encode_writes_nothing();
  test_publish_qos3_decode_rejected();
  test_publish_topic_too_long();
  test_truncated_publish();
  test_subscribe_and_suback();
  test_unsubscribe();
  test_subscribe_header_qos();
  test_acks_and_header_only();
  test_trailing_bytes_rejected();
  test_field_exceeds_remaining_length();
  test_invalid_message_type();
  test_decode_limits();
  test_decode_one_stream_of_packets();
  test_decode_read_sequence_then_eof();
  test_type_names();
  return ::mqtt::tests::run_and_report();
}
