#include "mqtt/codec/messages.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/codec/primitives.hpp"

namespace mqtt::codec {

// CONNACK：[保留字节 0x00] [return code]
std::error_code ConnAck::encode(core::Writer &sink) const noexcept {
    return fault_boundary("connack.encode", [&]() -> std::error_code {
        PayloadWriter w;
        w.put_u8(0);
        w.put_u8(static_cast<std::uint8_t>(return_code));
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code ConnAck::decode(core::Reader &source,
                                const Header &hdr,
                                std::uint32_t remaining_length) noexcept {
    return fault_boundary("connack.decode", [&]() -> std::error_code {
        BudgetReader r(source, remaining_length);

        std::uint8_t reserved = 0;
        auto ec = r.read_u8(reserved);
        if (ec) {
            return ec;
        }
        std::uint8_t code = 0;
        ec = r.read_u8(code);
        if (ec) {
            return ec;
        }
        if (!is_valid(static_cast<ReturnCode>(code))) {
            return make_error_code(errc::bad_return_code);
        }
        ec = r.expect_exhausted();
        if (ec) {
            return ec;
        }

        header = hdr;
        return_code = static_cast<ReturnCode>(code);
        return {};
    });
}

} // namespace mqtt::codec
