#pragma once

#include "mqtt/codec/types.hpp"
#include "mqtt/core/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mqtt::codec {

/**
 * @brief 负载编码缓冲：按字段顺序追加 u8 / u16(big-endian) / 长度前缀字符串 / 原始字节。
 *
 * 编码器先把完整负载写入内存，再连同固定头一次性交给 Writer，
 * 因此所有校验失败都发生在任何字节到达 Writer 之前。
 */
class PayloadWriter final {
public:
    PayloadWriter() = default;

    void put_u8(std::uint8_t v);
    void put_u16(std::uint16_t v);
    // 长度超过 kMaxStringLength 返回 errc::field_too_long，且不写入任何字节。
    std::error_code put_string(std::string_view s);
    void put_bytes(bytes_view data);

    [[nodiscard]] bytes_view bytes() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::vector<byte> buf_{};
};

/**
 * @brief 受 Remaining Length 预算约束的字段读取器。
 *
 * 每次读取都先检查剩余预算：
 * - 字段超出预算：errc::remaining_length_exceeded（不从 Reader 读取）
 * - Reader 提前结束（core::errc::end_of_stream）：errc::truncated
 * - Reader 的其它错误原样返回
 */
class BudgetReader final {
public:
    BudgetReader(core::Reader &source, std::uint32_t budget) noexcept;

    [[nodiscard]] std::uint32_t remaining() const noexcept;
    [[nodiscard]] bool exhausted() const noexcept;

    std::error_code read_u8(std::uint8_t &out);
    std::error_code read_u16(std::uint16_t &out);
    std::error_code read_string(std::string &out);
    // 读取预算内剩余的全部字节（PUBLISH 的应用负载）；按 4 KiB 分块读取。
    std::error_code read_rest(std::vector<byte> &out);

    // 定长报文解码完成后调用：预算未用尽返回 errc::remaining_length_mismatch。
    [[nodiscard]] std::error_code expect_exhausted() const noexcept;

private:
    std::error_code take(mutable_bytes_view dst);

    core::Reader &source_;
    std::uint32_t remaining_{0};
};

} // namespace mqtt::codec
