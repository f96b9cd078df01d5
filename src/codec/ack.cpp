#include "mqtt/codec/messages.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/codec/primitives.hpp"

namespace mqtt::codec {

template <MessageType Type>
std::error_code Ack<Type>::encode(core::Writer &sink) const noexcept {
    return fault_boundary(to_string(kType), [&]() -> std::error_code {
        PayloadWriter w;
        w.put_u16(message_id);
        return write_packet(sink, kType, header, w.bytes());
    });
}

template <MessageType Type>
std::error_code Ack<Type>::decode(core::Reader &source,
                                  const Header &hdr,
                                  std::uint32_t remaining_length) noexcept {
    return fault_boundary(to_string(kType), [&]() -> std::error_code {
        BudgetReader r(source, remaining_length);
        std::uint16_t id = 0;
        auto ec = r.read_u16(id);
        if (ec) {
            return ec;
        }
        ec = r.expect_exhausted();
        if (ec) {
            return ec;
        }
        header = hdr;
        message_id = id;
        return {};
    });
}

template <MessageType Type>
std::error_code HeaderOnly<Type>::encode(core::Writer &sink) const noexcept {
    return fault_boundary(to_string(kType), [&]() -> std::error_code {
        return write_packet(sink, kType, header, bytes_view{});
    });
}

template <MessageType Type>
std::error_code HeaderOnly<Type>::decode(core::Reader &source,
                                         const Header &hdr,
                                         std::uint32_t remaining_length) noexcept {
    (void)source;
    if (remaining_length != 0) {
        return make_error_code(errc::remaining_length_mismatch);
    }
    header = hdr;
    return {};
}

template struct Ack<MessageType::puback>;
template struct Ack<MessageType::pubrec>;
template struct Ack<MessageType::pubrel>;
template struct Ack<MessageType::pubcomp>;
template struct Ack<MessageType::unsuback>;

template struct HeaderOnly<MessageType::pingreq>;
template struct HeaderOnly<MessageType::pingresp>;
template struct HeaderOnly<MessageType::disconnect>;

} // namespace mqtt::codec
