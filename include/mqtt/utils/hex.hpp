#pragma once

#include "mqtt/core/common.hpp"
#include "mqtt/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mqtt::utils {

/**
 * @brief 16 进制解析/格式化工具（抓包比对、日志排查）。
 */
struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（不可打印字符显示为 '.'）。
    bool show_ascii{false};
};

[[nodiscard]] std::string hex_dump(mqtt::core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes（覆盖写入 out）。
 *
 * 支持大小写、常见分隔符（空白、逗号、冒号、连字符、方括号等）以及 0x/0X 前缀。
 * 出现非法字符或 nibble 个数为奇数时返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text, std::vector<mqtt::core::byte> &out) noexcept;

} // namespace mqtt::utils
