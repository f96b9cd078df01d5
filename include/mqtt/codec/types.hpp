#pragma once

#include "mqtt/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace mqtt::codec {

using byte = mqtt::core::byte;
using bytes_view = mqtt::core::bytes_view;
using mutable_bytes_view = mqtt::core::mutable_bytes_view;

// Remaining Length 最多 4 字节，每字节 7 bit 有效：128^4 - 1。
inline constexpr std::uint32_t kMaxRemainingLength = 268'435'455u;
inline constexpr std::size_t kMaxRemainingLengthBytes = 4;
inline constexpr std::size_t kMaxFixedHeaderSize = 1 + kMaxRemainingLengthBytes;
// 字符串字段的长度前缀为 16 bit。
inline constexpr std::size_t kMaxStringLength = 0xFFFF;

/**
 * @brief QoS 等级（固定头 bit2-1）。值 3 为保留值，视为非法。
 */
enum class QosLevel : std::uint8_t {
  at_most_once = 0,
  at_least_once = 1,
  exactly_once = 2,
};

[[nodiscard]] constexpr bool is_valid(QosLevel qos) noexcept {
  return static_cast<std::uint8_t>(qos) <= 2;
}

// QoS 1/2 的 Publish/Subscribe/Unsubscribe 携带 16 bit Message ID。
[[nodiscard]] constexpr bool has_id(QosLevel qos) noexcept {
  return qos == QosLevel::at_least_once || qos == QosLevel::exactly_once;
}

/**
 * @brief 固定头高 4 位的报文类型（1..14），其余取值非法。
 */
enum class MessageType : std::uint8_t {
  connect = 1,
  connack = 2,
  publish = 3,
  puback = 4,
  pubrec = 5,
  pubrel = 6,
  pubcomp = 7,
  subscribe = 8,
  suback = 9,
  unsubscribe = 10,
  unsuback = 11,
  pingreq = 12,
  pingresp = 13,
  disconnect = 14,
};

[[nodiscard]] constexpr bool is_valid(MessageType type) noexcept {
  const auto v = static_cast<std::uint8_t>(type);
  return v >= static_cast<std::uint8_t>(MessageType::connect) &&
         v <= static_cast<std::uint8_t>(MessageType::disconnect);
}

/**
 * @brief CONNACK 返回码（0..5），其余取值在解码时拒绝。
 */
enum class ReturnCode : std::uint8_t {
  accepted = 0,
  unacceptable_protocol_version = 1,
  identifier_rejected = 2,
  server_unavailable = 3,
  bad_username_or_password = 4,
  not_authorized = 5,
};

[[nodiscard]] constexpr bool is_valid(ReturnCode code) noexcept {
  return static_cast<std::uint8_t>(code) <= static_cast<std::uint8_t>(ReturnCode::not_authorized);
}

/**
 * @brief 每个报文都携带的固定头标志位。
 *
 * 编码布局（固定头第 1 字节）：
 * - bit7..4: MessageType
 * - bit3   : dup
 * - bit2..1: qos
 * - bit0   : retain
 *
 * 对不使用这些标志的报文类型，解码时照样提取，由上层自行忽略。
 */
struct Header final {
  bool dup{false};
  bool retain{false};
  QosLevel qos{QosLevel::at_most_once};

  bool operator==(const Header&) const = default;
};

[[nodiscard]] const char* to_string(MessageType type) noexcept;
[[nodiscard]] const char* to_string(QosLevel qos) noexcept;
[[nodiscard]] const char* to_string(ReturnCode code) noexcept;

}  // namespace mqtt::codec
