#include "mqtt/utils/packet_dump.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace mqtt::utils {
namespace {

using namespace mqtt::codec;

[[nodiscard]] const char *bool_(bool v) noexcept {
    return v ? "true" : "false";
}

[[nodiscard]] std::string fmt_id_(std::uint16_t id) {
    std::ostringstream oss;
    oss << id << " (0x" << std::hex << std::setw(4) << std::setfill('0') << id << ")";
    return oss.str();
}

void append_header_(std::ostringstream &oss, MessageType type, const Header &h) {
    oss << to_string(type) << ":\n";
    oss << "  dup=" << bool_(h.dup) << " qos=" << to_string(h.qos)
        << " retain=" << bool_(h.retain) << '\n';
}

void append_fields_(std::ostringstream &oss, const Connect &m, const PacketDumpOptions &) {
    oss << "  protocol=" << m.protocol_name << " version=" << static_cast<int>(m.protocol_version)
        << '\n';
    oss << "  clean_session=" << bool_(m.clean_session) << " keep_alive=" << m.keep_alive << '\n';
    oss << "  client_id=\"" << m.client_id << "\"\n";
    if (m.will_flag) {
        oss << "  will_topic=\"" << m.will_topic << "\" will_qos=" << to_string(m.will_qos)
            << " will_retain=" << bool_(m.will_retain) << '\n';
        oss << "  will_message=\"" << m.will_message << "\"\n";
    }
    if (m.username_flag) {
        oss << "  username=\"" << m.username << "\"\n";
    }
    if (m.password_flag) {
        // 口令不回显明文。
        oss << "  password=<" << m.password.size() << " bytes>\n";
    }
}

void append_fields_(std::ostringstream &oss, const ConnAck &m, const PacketDumpOptions &) {
    oss << "  return_code=" << static_cast<int>(m.return_code) << " ("
        << to_string(m.return_code) << ")\n";
}

void append_fields_(std::ostringstream &oss, const Publish &m, const PacketDumpOptions &options) {
    oss << "  topic=\"" << m.topic << "\"\n";
    if (has_id(m.header.qos)) {
        oss << "  message_id=" << fmt_id_(m.message_id) << '\n';
    }
    oss << "  payload_len=" << m.payload.size() << '\n';
    if (options.max_payload_bytes != 0 && !m.payload.empty()) {
        HexDumpOptions hex = options.hex;
        hex.max_bytes = options.max_payload_bytes;
        std::istringstream lines(hex_dump(mqtt::core::bytes_view{m.payload.data(), m.payload.size()}, hex));
        std::string line;
        while (std::getline(lines, line)) {
            oss << "    " << line << '\n';
        }
    }
}

void append_fields_(std::ostringstream &oss, const Subscribe &m, const PacketDumpOptions &) {
    if (has_id(m.header.qos)) {
        oss << "  message_id=" << fmt_id_(m.message_id) << '\n';
    }
    for (const auto &sub : m.subscriptions) {
        oss << "  - \"" << sub.topic << "\" qos=" << static_cast<int>(sub.qos) << '\n';
    }
}

void append_fields_(std::ostringstream &oss, const SubAck &m, const PacketDumpOptions &) {
    oss << "  message_id=" << fmt_id_(m.message_id) << '\n';
    oss << "  granted=[";
    for (std::size_t i = 0; i < m.granted_qos.size(); ++i) {
        oss << (i == 0 ? "" : ", ") << static_cast<int>(m.granted_qos[i]);
    }
    oss << "]\n";
}

void append_fields_(std::ostringstream &oss, const Unsubscribe &m, const PacketDumpOptions &) {
    if (has_id(m.header.qos)) {
        oss << "  message_id=" << fmt_id_(m.message_id) << '\n';
    }
    for (const auto &topic : m.topics) {
        oss << "  - \"" << topic << "\"\n";
    }
}

template <MessageType Type>
void append_fields_(std::ostringstream &oss, const Ack<Type> &m, const PacketDumpOptions &) {
    oss << "  message_id=" << fmt_id_(m.message_id) << '\n';
}

template <MessageType Type>
void append_fields_(std::ostringstream &, const HeaderOnly<Type> &, const PacketDumpOptions &) {}

} // namespace

std::string dump_message(const codec::Message &msg, const PacketDumpOptions &options) {
    std::ostringstream oss;
    std::visit(
        [&](const auto &m) {
            append_header_(oss, std::decay_t<decltype(m)>::kType, m.header);
            append_fields_(oss, m, options);
        },
        msg);
    return oss.str();
}

std::string dump_packet(mqtt::core::bytes_view packet, PacketDumpOptions options) {
    std::ostringstream oss;
    if (options.include_hex) {
        oss << hex_dump(packet, options.hex);
    }

    codec::Message msg;
    std::size_t consumed = 0;
    const auto ec = codec::decode_one(packet, msg, consumed, options.limits);
    if (ec) {
        oss << "decode error: [" << ec.category().name() << "] " << ec.message() << '\n';
        return oss.str();
    }

    oss << dump_message(msg, options);
    if (consumed < packet.size()) {
        oss << "(" << (packet.size() - consumed) << " trailing bytes not decoded)\n";
    }
    return oss.str();
}

} // namespace mqtt::utils
