#include "mqtt/codec/fixed_header.hpp"

#include "mqtt/codec/error.hpp"
#include "mqtt/codec/length.hpp"
#include "mqtt/core/error.hpp"

#include <array>

namespace mqtt::codec {
namespace {

Header unpack_flags(byte b) noexcept {
    Header h;
    h.dup = (b & 0x08U) != 0;
    h.qos = static_cast<QosLevel>((b & 0x06U) >> 1U);
    h.retain = (b & 0x01U) != 0;
    return h;
}

std::error_code validate(MessageType type, const Header &header) noexcept {
    if (!is_valid(header.qos)) {
        return make_error_code(errc::bad_qos);
    }
    if (!is_valid(type)) {
        return make_error_code(errc::bad_msg_type);
    }
    return {};
}

} // namespace

std::error_code encode_fixed_header(MessageType type,
                                    const Header &header,
                                    std::uint32_t remaining_length,
                                    std::vector<byte> &out) {
    auto ec = validate(type, header);
    if (ec) {
        return ec;
    }
    if (remaining_length > kMaxRemainingLength) {
        return make_error_code(errc::payload_too_large);
    }
    out.push_back(pack_header_byte(type, header));
    return encode_length(remaining_length, out);
}

std::error_code decode_fixed_header(core::Reader &source, FixedHeader &out) {
    std::array<byte, 1> first{};
    auto ec = source.read_exact(mutable_bytes_view{first.data(), first.size()});
    if (ec) {
        return ec;
    }

    std::uint32_t remaining = 0;
    ec = decode_length(source, remaining);
    if (ec) {
        return ec;
    }

    out.type = static_cast<MessageType>(first[0] >> 4U);
    out.header = unpack_flags(first[0]);
    out.remaining_length = remaining;
    return {};
}

std::error_code decode_fixed_header(bytes_view in,
                                    FixedHeader &out,
                                    std::size_t &consumed) noexcept {
    consumed = 0;
    if (in.empty()) {
        return make_error_code(errc::truncated);
    }

    std::uint32_t remaining = 0;
    std::size_t length_bytes = 0;
    auto ec = decode_length(in.subspan(1), remaining, length_bytes);
    if (ec) {
        return ec;
    }

    out.type = static_cast<MessageType>(in[0] >> 4U);
    out.header = unpack_flags(in[0]);
    out.remaining_length = remaining;
    consumed = 1 + length_bytes;
    return {};
}

std::error_code write_packet(core::Writer &sink,
                             MessageType type,
                             const Header &header,
                             bytes_view payload) {
    auto ec = validate(type, header);
    if (ec) {
        return ec;
    }
    if (payload.size() > kMaxRemainingLength) {
        return make_error_code(errc::payload_too_large);
    }

    std::vector<byte> frame;
    frame.reserve(kMaxFixedHeaderSize + payload.size());
    ec = encode_fixed_header(type, header, static_cast<std::uint32_t>(payload.size()), frame);
    if (ec) {
        return ec;
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    return sink.write_all(bytes_view{frame.data(), frame.size()});
}

} // namespace mqtt::codec
