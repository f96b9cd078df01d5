#include "mqtt/codec/messages.hpp"

#include "mqtt/codec/boundary.hpp"
#include "mqtt/codec/error.hpp"
#include "mqtt/codec/fixed_header.hpp"
#include "mqtt/codec/primitives.hpp"

#include <utility>

namespace mqtt::codec {
namespace {

/*
 * CONNECT 可变头与负载：
 *
 *   [protocol name: string] [protocol version: u8] [connect flags: u8] [keep alive: u16]
 *   [client id: string] [will topic: string] [will message: string]
 *   [username: string] [password: string]
 *
 * connect flags 位布局：
 *   bit7 username | bit6 password | bit5 will retain | bit4..3 will qos |
 *   bit2 will flag | bit1 clean session | bit0 保留（0）
 *
 * will topic/message 仅在 will flag 置位时出现；username/password 各自由对应 flag 控制。
 */
constexpr std::uint8_t kUsernameFlag = 0x80;
constexpr std::uint8_t kPasswordFlag = 0x40;
constexpr std::uint8_t kWillRetainFlag = 0x20;
constexpr std::uint8_t kWillQosMask = 0x18;
constexpr std::uint8_t kWillFlag = 0x04;
constexpr std::uint8_t kCleanSessionFlag = 0x02;

std::uint8_t pack_connect_flags(const Connect &m) noexcept {
    std::uint8_t flags = 0;
    if (m.username_flag) {
        flags |= kUsernameFlag;
    }
    if (m.password_flag) {
        flags |= kPasswordFlag;
    }
    if (m.will_retain) {
        flags |= kWillRetainFlag;
    }
    flags |= static_cast<std::uint8_t>((static_cast<std::uint8_t>(m.will_qos) << 3U) & kWillQosMask);
    if (m.will_flag) {
        flags |= kWillFlag;
    }
    if (m.clean_session) {
        flags |= kCleanSessionFlag;
    }
    return flags;
}

void unpack_connect_flags(std::uint8_t flags, Connect &m) noexcept {
    m.username_flag = (flags & kUsernameFlag) != 0;
    m.password_flag = (flags & kPasswordFlag) != 0;
    m.will_retain = (flags & kWillRetainFlag) != 0;
    m.will_qos = static_cast<QosLevel>((flags & kWillQosMask) >> 3U);
    m.will_flag = (flags & kWillFlag) != 0;
    m.clean_session = (flags & kCleanSessionFlag) != 0;
}

} // namespace

std::error_code Connect::encode(core::Writer &sink) const noexcept {
    return fault_boundary("connect.encode", [&]() -> std::error_code {
        if (!is_valid(will_qos)) {
            return make_error_code(errc::bad_will_qos);
        }

        PayloadWriter w;
        auto ec = w.put_string(protocol_name);
        if (ec) {
            return ec;
        }
        w.put_u8(protocol_version);
        w.put_u8(pack_connect_flags(*this));
        w.put_u16(keep_alive);
        ec = w.put_string(client_id);
        if (ec) {
            return ec;
        }
        if (will_flag) {
            ec = w.put_string(will_topic);
            if (ec) {
                return ec;
            }
            ec = w.put_string(will_message);
            if (ec) {
                return ec;
            }
        }
        if (username_flag) {
            ec = w.put_string(username);
            if (ec) {
                return ec;
            }
        }
        if (password_flag) {
            ec = w.put_string(password);
            if (ec) {
                return ec;
            }
        }
        return write_packet(sink, kType, header, w.bytes());
    });
}

std::error_code Connect::decode(core::Reader &source,
                                const Header &hdr,
                                std::uint32_t remaining_length) noexcept {
    return fault_boundary("connect.decode", [&]() -> std::error_code {
        BudgetReader r(source, remaining_length);
        Connect m;
        m.header = hdr;

        auto ec = r.read_string(m.protocol_name);
        if (ec) {
            return ec;
        }
        ec = r.read_u8(m.protocol_version);
        if (ec) {
            return ec;
        }
        std::uint8_t flags = 0;
        ec = r.read_u8(flags);
        if (ec) {
            return ec;
        }
        unpack_connect_flags(flags, m);
        if (!is_valid(m.will_qos)) {
            return make_error_code(errc::bad_will_qos);
        }
        ec = r.read_u16(m.keep_alive);
        if (ec) {
            return ec;
        }
        ec = r.read_string(m.client_id);
        if (ec) {
            return ec;
        }
        if (m.will_flag) {
            ec = r.read_string(m.will_topic);
            if (ec) {
                return ec;
            }
            ec = r.read_string(m.will_message);
            if (ec) {
                return ec;
            }
        }
        if (m.username_flag) {
            ec = r.read_string(m.username);
            if (ec) {
                return ec;
            }
        }
        if (m.password_flag) {
            ec = r.read_string(m.password);
            if (ec) {
                return ec;
            }
        }
        ec = r.expect_exhausted();
        if (ec) {
            return ec;
        }

        *this = std::move(m);
        return {};
    });
}

} // namespace mqtt::codec
