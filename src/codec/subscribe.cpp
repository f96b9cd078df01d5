#include "mqtt/codec/messages.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/codec/primitives.hpp"

#include <utility>

namespace mqtt::codec {

/*
 * 订阅相关报文（SUBSCRIBE / SUBACK / UNSUBSCRIBE）。
 *
 * 三者的负载都是“可选/固定的 message_id + 重复项”，重复项没有计数字段，
 * 解码时循环读取直到 Remaining Length 预算耗尽。
 */

std::error_code Subscribe::encode(core::Writer &sink) const noexcept {
    return fault_boundary("subscribe.encode", [&]() -> std::error_code {
        PayloadWriter w;
        if (has_id(header.qos)) {
            w.put_u16(message_id);
        }
        for (const auto &sub : subscriptions) {
            if (!is_valid(sub.qos)) {
                return make_error_code(errc::bad_qos);
            }
            auto ec = w.put_string(sub.topic);
            if (ec) {
                return ec;
            }
            w.put_u8(static_cast<std::uint8_t>(sub.qos));
        }
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code Subscribe::decode(core::Reader &source,
                                  const Header &hdr,
                                  std::uint32_t remaining_length) noexcept {
    return fault_boundary("subscribe.decode", [&]() -> std::error_code {
        if (!is_valid(hdr.qos)) {
            return make_error_code(errc::bad_qos);
        }

        BudgetReader r(source, remaining_length);
        Subscribe m;
        m.header = hdr;

        if (has_id(hdr.qos)) {
            auto ec = r.read_u16(m.message_id);
            if (ec) {
                return ec;
            }
        }
        while (!r.exhausted()) {
            Subscription sub;
            auto ec = r.read_string(sub.topic);
            if (ec) {
                return ec;
            }
            std::uint8_t qos = 0;
            ec = r.read_u8(qos);
            if (ec) {
                return ec;
            }
            sub.qos = static_cast<QosLevel>(qos);
            if (!is_valid(sub.qos)) {
                return make_error_code(errc::bad_qos);
            }
            m.subscriptions.push_back(std::move(sub));
        }

        *this = std::move(m);
        return {};
    });
}

std::error_code SubAck::encode(core::Writer &sink) const noexcept {
    return fault_boundary("suback.encode", [&]() -> std::error_code {
        PayloadWriter w;
        w.put_u16(message_id);
        for (const auto qos : granted_qos) {
            w.put_u8(static_cast<std::uint8_t>(qos));
        }
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code SubAck::decode(core::Reader &source,
                               const Header &hdr,
                               std::uint32_t remaining_length) noexcept {
    return fault_boundary("suback.decode", [&]() -> std::error_code {
        BudgetReader r(source, remaining_length);
        SubAck m;
        m.header = hdr;

        auto ec = r.read_u16(m.message_id);
        if (ec) {
            return ec;
        }
        while (!r.exhausted()) {
            std::uint8_t granted = 0;
            ec = r.read_u8(granted);
            if (ec) {
                return ec;
            }
            m.granted_qos.push_back(static_cast<QosLevel>(granted & 0x03U));
        }

        *this = std::move(m);
        return {};
    });
}

std::error_code Unsubscribe::encode(core::Writer &sink) const noexcept {
    return fault_boundary("unsubscribe.encode", [&]() -> std::error_code {
        PayloadWriter w;
        if (has_id(header.qos)) {
            w.put_u16(message_id);
        }
        for (const auto &topic : topics) {
            auto ec = w.put_string(topic);
            if (ec) {
                return ec;
            }
        }
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code Unsubscribe::decode(core::Reader &source,
                                    const Header &hdr,
                                    std::uint32_t remaining_length) noexcept {
    return fault_boundary("unsubscribe.decode", [&]() -> std::error_code {
        if (!is_valid(hdr.qos)) {
            return make_error_code(errc::bad_qos);
        }

        BudgetReader r(source, remaining_length);
        Unsubscribe m;
        m.header = hdr;

        if (has_id(hdr.qos)) {
            auto ec = r.read_u16(m.message_id);
            if (ec) {
                return ec;
            }
        }
        while (!r.exhausted()) {
            std::string topic;
            auto ec = r.read_string(topic);
            if (ec) {
                return ec;
            }
            m.topics.push_back(std::move(topic));
        }

        *this = std::move(m);
        return {};
    });
}

} // namespace mqtt::codec
