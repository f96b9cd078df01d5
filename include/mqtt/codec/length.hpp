#pragma once

#include "mqtt/codec/types.hpp"
#include "mqtt/core/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace mqtt::codec {

/**
 * @brief Remaining Length 变长整数（base-128）。
 *
 * - 每字节低 7 位为数据，低位组在前；除最后一字节外 bit7 = 1（continuation）
 * - 1..4 字节，最大值 268,435,455（kMaxRemainingLength）
 * - 编码总是输出最短形式（0 -> 0x00）；解码接受任何以 4 字节内终止的形式（含非最短）
 */

// value 需要的编码字节数（1..4）；超出 kMaxRemainingLength 时返回 0。
[[nodiscard]] std::size_t length_size(std::uint32_t value) noexcept;

/**
 * @brief 追加 value 的编码到 out。
 *
 * value > kMaxRemainingLength 返回 errc::payload_too_large，不写入任何字节。
 */
std::error_code encode_length(std::uint32_t value, std::vector<byte> &out);

/**
 * @brief 从 Reader 逐字节解码。
 *
 * - 第 4 个字节仍带 continuation：errc::malformed_length（不再继续读取）
 * - 输入提前结束：errc::truncated
 */
std::error_code decode_length(core::Reader &source, std::uint32_t &out);

/**
 * @brief 从内存缓冲区解码（流式 API）。
 *
 * 成功时 consumed 为长度字段占用的字节数；缓冲区在字段结束前耗尽返回
 * errc::truncated（调用方可等待更多数据后重试）。
 */
std::error_code decode_length(bytes_view in,
                              std::uint32_t &out,
                              std::size_t &consumed) noexcept;

} // namespace mqtt::codec
