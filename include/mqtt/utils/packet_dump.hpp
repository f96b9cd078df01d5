#pragma once

#include "mqtt/codec/codec.hpp"
#include "mqtt/core/common.hpp"
#include "mqtt/utils/hex.hpp"

#include <cstddef>
#include <string>

namespace mqtt::utils {

/**
 * @brief 报文可视化输出选项（调试/抓包分析用途）。
 */
struct PacketDumpOptions final {
    // 是否附带原始报文 hexdump。
    bool include_hex{true};

    // hexdump 选项（include_hex=true 时生效）。
    HexDumpOptions hex{};

    // Publish 负载最多展示的字节数（0 表示不展示负载内容，只输出长度）。
    std::size_t max_payload_bytes{64};

    // 解码资源限制。
    codec::DecodeLimits limits{};
};

/**
 * @brief 输出报文各字段的多行摘要。
 */
[[nodiscard]] std::string dump_message(const codec::Message &msg,
                                       const PacketDumpOptions &options = {});

/**
 * @brief 从缓冲区解码一个报文并输出；解码失败时输出错误信息而不是抛出异常。
 */
[[nodiscard]] std::string dump_packet(mqtt::core::bytes_view packet,
                                      PacketDumpOptions options = {});

} // namespace mqtt::utils
