#include "mqtt/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <new>
#include <sstream>
#include <utility>

namespace mqtt::utils {
namespace {

[[nodiscard]] int nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '{':
    case '}':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char printable_(mqtt::core::byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

} // namespace

std::string hex_dump(mqtt::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;

    const std::size_t total = bytes.size();
    const std::size_t shown =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const std::size_t line_n = std::min(per_line, shown - offset);

        if (options.show_offset) {
            oss << std::setw(4) << std::setfill('0') << std::hex << offset << ": ";
        }
        for (std::size_t i = 0; i < line_n; ++i) {
            if (i != 0) {
                oss << ' ';
            }
            oss << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[offset + i]);
        }
        if (options.show_ascii) {
            // 末行补齐到整行宽度，保证 ASCII 列对齐。
            oss << std::string((per_line - line_n) * 3, ' ') << "   ";
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << printable_(bytes[offset + i]);
            }
        }
        oss << '\n';
    }

    if (shown < total) {
        oss << "... (truncated, total=" << std::dec << total << " bytes)\n";
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text, std::vector<mqtt::core::byte> &out) noexcept {
    std::vector<mqtt::core::byte> bytes;
    int hi = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }
        // 0x/0X 前缀：仅在一个字节的起始位置识别。
        if (hi < 0 && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = nibble_(c);
        if (v < 0) {
            return mqtt::core::make_error_code(mqtt::core::errc::invalid_argument);
        }
        if (hi < 0) {
            hi = v;
            continue;
        }
        try {
            bytes.push_back(static_cast<mqtt::core::byte>((hi << 4) | v));
        } catch (const std::bad_alloc &) {
            return mqtt::core::make_error_code(mqtt::core::errc::out_of_memory);
        }
        hi = -1;
    }

    if (hi >= 0) {
        return mqtt::core::make_error_code(mqtt::core::errc::invalid_argument);
    }
    out = std::move(bytes);
    return {};
}

} // namespace mqtt::utils
