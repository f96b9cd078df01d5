#include "mqtt/codec/codec.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/core/error.hpp"

#include "core/logger.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace mqtt::codec {
namespace {

// Message 的备选类型顺序必须与 MessageType 数值一一对应（index + 1）。
template <std::size_t I = 0>
constexpr bool alternatives_follow_type_order() noexcept {
    if constexpr (I == std::variant_size_v<Message>) {
        return true;
    } else {
        using T = std::variant_alternative_t<I, Message>;
        return static_cast<std::size_t>(T::kType) == I + 1 &&
               alternatives_follow_type_order<I + 1>();
    }
}

static_assert(std::variant_size_v<Message> ==
              static_cast<std::size_t>(MessageType::disconnect));
static_assert(alternatives_follow_type_order());

// 按报文类型构造空报文；调用前 type 必须已通过 is_valid 校验。
Message make_empty(MessageType type) {
    switch (type) {
    case MessageType::connect:
        return Connect{};
    case MessageType::connack:
        return ConnAck{};
    case MessageType::publish:
        return Publish{};
    case MessageType::puback:
        return PubAck{};
    case MessageType::pubrec:
        return PubRec{};
    case MessageType::pubrel:
        return PubRel{};
    case MessageType::pubcomp:
        return PubComp{};
    case MessageType::subscribe:
        return Subscribe{};
    case MessageType::suback:
        return SubAck{};
    case MessageType::unsubscribe:
        return Unsubscribe{};
    case MessageType::unsuback:
        return UnsubAck{};
    case MessageType::pingreq:
        return PingReq{};
    case MessageType::pingresp:
        return PingResp{};
    case MessageType::disconnect:
        return Disconnect{};
    }
    return Message{};
}

std::error_code check_fixed_header(const FixedHeader &fh,
                                   const DecodeLimits &limits) noexcept {
    if (!is_valid(fh.type)) {
        return make_error_code(errc::bad_msg_type);
    }
    if (fh.remaining_length > limits.max_remaining_length) {
        return make_error_code(errc::packet_too_large);
    }
    return {};
}

std::error_code decode_payload(Message &msg,
                               core::Reader &source,
                               const FixedHeader &fh) noexcept {
    return std::visit(
        [&](auto &m) -> std::error_code {
            return m.decode(source, fh.header, fh.remaining_length);
        },
        msg);
}

void log_decode_failure(const char *where,
                        const FixedHeader &fh,
                        const std::error_code &ec) noexcept {
    core::detail::logger().debug("{}: type={} remaining_length={} failed: [{}] {}",
                                 where,
                                 static_cast<int>(fh.type),
                                 fh.remaining_length,
                                 ec.category().name(),
                                 ec.message());
}

} // namespace

MessageType message_type(const Message &msg) noexcept {
    return std::visit(
        [](const auto &m) -> MessageType { return std::decay_t<decltype(m)>::kType; },
        msg);
}

std::error_code encode(const Message &msg, core::Writer &sink) noexcept {
    const auto ec = std::visit(
        [&](const auto &m) -> std::error_code { return m.encode(sink); }, msg);
    if (ec) {
        core::detail::logger().debug("encode {} failed: [{}] {}",
                                     to_string(message_type(msg)),
                                     ec.category().name(),
                                     ec.message());
    }
    return ec;
}

std::error_code encode(const Message &msg, std::vector<byte> &out) noexcept {
    // VectorWriter 只会收到一次 write_all，失败路径不会修改 out。
    core::VectorWriter writer(out);
    return encode(msg, writer);
}

std::error_code decode_read(core::Reader &source,
                            Message &out,
                            const DecodeLimits &limits) noexcept {
    return fault_boundary("decode_read", [&]() -> std::error_code {
        FixedHeader fh;
        auto ec = decode_fixed_header(source, fh);
        if (ec) {
            // 报文边界处的 end_of_stream 是正常关闭，不记录。
            if (ec != core::errc::end_of_stream) {
                log_decode_failure("decode_read", fh, ec);
            }
            return ec;
        }
        ec = check_fixed_header(fh, limits);
        if (ec) {
            log_decode_failure("decode_read", fh, ec);
            return ec;
        }

        Message msg = make_empty(fh.type);
        ec = decode_payload(msg, source, fh);
        if (ec) {
            log_decode_failure("decode_read", fh, ec);
            return ec;
        }
        out = std::move(msg);
        return {};
    });
}

std::error_code decode_one(bytes_view in,
                           Message &out,
                           std::size_t &consumed,
                           const DecodeLimits &limits) noexcept {
    consumed = 0;
    return fault_boundary("decode_one", [&]() -> std::error_code {
        FixedHeader fh;
        std::size_t header_size = 0;
        auto ec = decode_fixed_header(in, fh, header_size);
        if (ec) {
            return ec;
        }
        ec = check_fixed_header(fh, limits);
        if (ec) {
            log_decode_failure("decode_one", fh, ec);
            return ec;
        }
        if (in.size() - header_size < fh.remaining_length) {
            return make_error_code(errc::truncated);
        }

        core::BytesReader reader(in.subspan(header_size, fh.remaining_length));
        Message msg = make_empty(fh.type);
        ec = decode_payload(msg, reader, fh);
        if (ec) {
            log_decode_failure("decode_one", fh, ec);
            return ec;
        }
        out = std::move(msg);
        consumed = header_size + fh.remaining_length;
        return {};
    });
}

} // namespace mqtt::codec
