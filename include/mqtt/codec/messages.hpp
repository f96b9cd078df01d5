#pragma once

#include "mqtt/codec/types.hpp"
#include "mqtt/core/stream.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace mqtt::codec {

/*
 * 报文值类型（14 种）。
 *
 * 每个类型提供相同的编解码契约：
 * - encode(sink)：校验 -> 在内存中组好“固定头 + 负载” -> 一次 write_all
 * - decode(source, header, remaining_length)：从 source 恰好读取 remaining_length 字节的负载；
 *   header 为固定头解出的标志位，会被原样保存到报文中
 *
 * 两个方法都是 noexcept：内部按 error_code 逐层返回，并由 fault_boundary 兜底异常。
 * 解码失败时 *this 保持调用前的值（不会出现“解了一半”的报文）。
 */

struct Connect final {
    static constexpr MessageType kType = MessageType::connect;

    Header header{};
    std::string protocol_name{"MQIsdp"};
    std::uint8_t protocol_version{3};
    bool username_flag{false};
    bool password_flag{false};
    bool will_retain{false};
    QosLevel will_qos{QosLevel::at_most_once};
    bool will_flag{false};
    bool clean_session{false};
    std::uint16_t keep_alive{0};
    std::string client_id{};
    // 仅 will_flag 置位时编码。
    std::string will_topic{};
    std::string will_message{};
    // 仅对应 flag 置位时编码。
    std::string username{};
    std::string password{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const Connect &) const = default;
};

struct ConnAck final {
    static constexpr MessageType kType = MessageType::connack;

    Header header{};
    ReturnCode return_code{ReturnCode::accepted};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const ConnAck &) const = default;
};

/**
 * @brief PUBLISH：topic + [message_id] + 应用负载。
 *
 * 应用负载没有长度前缀，长度 = Remaining Length - 已读取的字段长度。
 */
struct Publish final {
    static constexpr MessageType kType = MessageType::publish;

    Header header{};
    std::string topic{};
    // 仅 has_id(header.qos) 时出现在报文中。
    std::uint16_t message_id{0};
    std::vector<byte> payload{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const Publish &) const = default;
};

struct Subscription final {
    std::string topic{};
    QosLevel qos{QosLevel::at_most_once};

    bool operator==(const Subscription &) const = default;
};

struct Subscribe final {
    static constexpr MessageType kType = MessageType::subscribe;

    // 协议约定 SUBSCRIBE 以 QoS 1 发送（携带 message_id）。
    Header header{false, false, QosLevel::at_least_once};
    std::uint16_t message_id{0};
    std::vector<Subscription> subscriptions{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const Subscribe &) const = default;
};

struct SubAck final {
    static constexpr MessageType kType = MessageType::suback;

    Header header{};
    std::uint16_t message_id{0};
    // 解码时每个字节只取低 2 位。
    std::vector<QosLevel> granted_qos{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const SubAck &) const = default;
};

struct Unsubscribe final {
    static constexpr MessageType kType = MessageType::unsubscribe;

    Header header{false, false, QosLevel::at_least_once};
    std::uint16_t message_id{0};
    std::vector<std::string> topics{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const Unsubscribe &) const = default;
};

/**
 * @brief 只携带 message_id 的确认类报文（PUBACK/PUBREC/PUBREL/PUBCOMP/UNSUBACK）。
 *
 * 同一结构按报文类型实例化；成员函数在 ack.cpp 中显式实例化。
 */
template <MessageType Type>
struct Ack final {
    static constexpr MessageType kType = Type;

    Header header{};
    std::uint16_t message_id{0};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const Ack &) const = default;
};

using PubAck = Ack<MessageType::puback>;
using PubRec = Ack<MessageType::pubrec>;
using PubRel = Ack<MessageType::pubrel>;
using PubComp = Ack<MessageType::pubcomp>;
using UnsubAck = Ack<MessageType::unsuback>;

extern template struct Ack<MessageType::puback>;
extern template struct Ack<MessageType::pubrec>;
extern template struct Ack<MessageType::pubrel>;
extern template struct Ack<MessageType::pubcomp>;
extern template struct Ack<MessageType::unsuback>;

/**
 * @brief 无负载报文（PINGREQ/PINGRESP/DISCONNECT），Remaining Length 恒为 0。
 */
template <MessageType Type>
struct HeaderOnly final {
    static constexpr MessageType kType = Type;

    Header header{};

    std::error_code encode(core::Writer &sink) const noexcept;
    std::error_code decode(core::Reader &source,
                           const Header &hdr,
                           std::uint32_t remaining_length) noexcept;

    bool operator==(const HeaderOnly &) const = default;
};

using PingReq = HeaderOnly<MessageType::pingreq>;
using PingResp = HeaderOnly<MessageType::pingresp>;
using Disconnect = HeaderOnly<MessageType::disconnect>;

extern template struct HeaderOnly<MessageType::pingreq>;
extern template struct HeaderOnly<MessageType::pingresp>;
extern template struct HeaderOnly<MessageType::disconnect>;

/**
 * @brief 报文值的封闭集合。
 *
 * 备选类型顺序与 MessageType 数值一致：index() + 1 == 报文类型（codec.cpp 中静态校验）。
 */
using Message = std::variant<Connect,
                             ConnAck,
                             Publish,
                             PubAck,
                             PubRec,
                             PubRel,
                             PubComp,
                             Subscribe,
                             SubAck,
                             Unsubscribe,
                             UnsubAck,
                             PingReq,
                             PingResp,
                             Disconnect>;

} // namespace mqtt::codec
