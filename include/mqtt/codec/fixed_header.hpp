#pragma once

#include "mqtt/codec/types.hpp"
#include "mqtt/core/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace mqtt::codec {

/**
 * @brief 解码出的固定头：类型 + 标志位 + Remaining Length。
 *
 * type 保留原始高 4 位，可能是非法值（由分发层校验）。
 */
struct FixedHeader final {
    MessageType type{MessageType::connect};
    Header header{};
    std::uint32_t remaining_length{0};
};

[[nodiscard]] constexpr byte pack_header_byte(MessageType type, const Header &header) noexcept {
    return static_cast<byte>((static_cast<std::uint8_t>(type) << 4U) |
                             (header.dup ? 0x08U : 0x00U) |
                             ((static_cast<std::uint8_t>(header.qos) & 0x03U) << 1U) |
                             (header.retain ? 0x01U : 0x00U));
}

/**
 * @brief 追加固定头（类型/标志字节 + Remaining Length）到 out。
 *
 * 校验顺序：qos（errc::bad_qos）-> type（errc::bad_msg_type）->
 * remaining_length（errc::payload_too_large）；任一失败时 out 保持不变。
 */
std::error_code encode_fixed_header(MessageType type,
                                    const Header &header,
                                    std::uint32_t remaining_length,
                                    std::vector<byte> &out);

/**
 * @brief 从 Reader 解码固定头。
 *
 * 首字节处输入结束返回 core::errc::end_of_stream（报文边界上的正常关闭），
 * 长度字段中途结束返回 errc::truncated。
 */
std::error_code decode_fixed_header(core::Reader &source, FixedHeader &out);

/**
 * @brief 从内存缓冲区解码固定头；成功时 consumed 为固定头字节数（2..5）。
 */
std::error_code decode_fixed_header(bytes_view in,
                                    FixedHeader &out,
                                    std::size_t &consumed) noexcept;

/**
 * @brief 组帧并一次性写出：固定头 + payload 合并为一个缓冲区后调用一次 write_all。
 *
 * 固定头校验失败时不会向 sink 写入任何字节。
 */
std::error_code write_packet(core::Writer &sink,
                             MessageType type,
                             const Header &header,
                             bytes_view payload);

} // namespace mqtt::codec
