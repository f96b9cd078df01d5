#pragma once

#include "mqtt/codec/error.hpp"
#include "mqtt/codec/messages.hpp"
#include "mqtt/codec/types.hpp"
#include "mqtt/core/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace mqtt::codec {

/**
 * @brief 解码资源限制（用于限制不可信输入的资源消耗）。
 *
 * max_remaining_length：允许的最大 Remaining Length；超过时在读取负载之前返回
 * errc::packet_too_large（避免按恶意长度分配内存）。
 */
struct DecodeLimits final {
  std::uint32_t max_remaining_length{kMaxRemainingLength};
};

[[nodiscard]] MessageType message_type(const Message& msg) noexcept;

/**
 * @brief 编码任意报文并一次性写入 sink。
 *
 * 校验失败（qos/will qos/字段长度等）时 sink 不会收到任何字节。
 */
std::error_code encode(const Message& msg, core::Writer& sink) noexcept;

/**
 * @brief 编码报文并追加到 out（失败时 out 保持不变）。
 */
std::error_code encode(const Message& msg, std::vector<byte>& out) noexcept;

/**
 * @brief 从字节源读取并解码一个完整报文（固定头 -> 分发 -> 负载）。
 *
 * 成功时 out 被替换为解出的报文；失败时 out 保持不变，返回：
 * - core::errc::end_of_stream：在报文边界处输入结束（对端正常关闭）
 * - errc::bad_msg_type / errc::packet_too_large / 各负载解码错误
 * - Reader 返回的底层 I/O 错误（原样）
 */
std::error_code decode_read(core::Reader& source, Message& out, const DecodeLimits& limits = {}) noexcept;

/**
 * @brief 从输入缓冲区解码一个报文（流式 API）。
 *
 * 成功时 consumed 为该报文的总字节数（固定头 + Remaining Length）。
 * 缓冲区中报文不完整时返回 errc::truncated 且 consumed 为 0，调用方可在收到更多数据后重试。
 */
std::error_code decode_one(bytes_view in,
                           Message& out,
                           std::size_t& consumed,
                           const DecodeLimits& limits = {}) noexcept;

}  // namespace mqtt::codec
