#include "mqtt/codec/messages.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/codec/primitives.hpp"

#include <utility>

namespace mqtt::codec {

std::error_code Publish::encode(core::Writer &sink) const noexcept {
    return fault_boundary("publish.encode", [&]() -> std::error_code {
        PayloadWriter w;
        auto ec = w.put_string(topic);
        if (ec) {
            return ec;
        }
        if (has_id(header.qos)) {
            w.put_u16(message_id);
        }
        w.put_bytes(bytes_view{payload.data(), payload.size()});
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code Publish::decode(core::Reader &source,
                                const Header &hdr,
                                std::uint32_t remaining_length) noexcept {
    return fault_boundary("publish.decode", [&]() -> std::error_code {
        // qos=3 时无法判断 message_id 是否存在。
        if (!is_valid(hdr.qos)) {
            return make_error_code(errc::bad_qos);
        }

        BudgetReader r(source, remaining_length);
        Publish m;
        m.header = hdr;

        auto ec = r.read_string(m.topic);
        if (ec) {
            return ec;
        }
        if (has_id(hdr.qos)) {
            ec = r.read_u16(m.message_id);
            if (ec) {
                return ec;
            }
        }
        // 应用负载：预算内剩余的全部字节。
        ec = r.read_rest(m.payload);
        if (ec) {
            return ec;
        }

        *this = std::move(m);
        return {};
    });
}

} // namespace mqtt::codec
