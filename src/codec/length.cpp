#include "mqtt/codec/length.hpp"

#include "mqtt/codec/error.hpp"
#include "mqtt/core/error.hpp"

#include <array>

namespace mqtt::codec {
namespace {

constexpr byte kContinuation = 0x80;
constexpr byte kChunkMask = 0x7F;

/*
 * 逐字节累加：value += (chunk & 0x7F) * 128^i。
 * 返回 true 表示该字节结束了长度字段。
 */
constexpr bool accumulate(byte chunk, std::size_t index, std::uint32_t &value) noexcept {
    value |= static_cast<std::uint32_t>(chunk & kChunkMask) << (7U * index);
    return (chunk & kContinuation) == 0;
}

} // namespace

std::size_t length_size(std::uint32_t value) noexcept {
    if (value < 128U) {
        return 1;
    }
    if (value < 16'384U) {
        return 2;
    }
    if (value < 2'097'152U) {
        return 3;
    }
    if (value <= kMaxRemainingLength) {
        return 4;
    }
    return 0;
}

std::error_code encode_length(std::uint32_t value, std::vector<byte> &out) {
    if (value > kMaxRemainingLength) {
        return make_error_code(errc::payload_too_large);
    }
    do {
        auto chunk = static_cast<byte>(value & kChunkMask);
        value >>= 7U;
        if (value > 0) {
            chunk = static_cast<byte>(chunk | kContinuation);
        }
        out.push_back(chunk);
    } while (value > 0);
    return {};
}

std::error_code decode_length(core::Reader &source, std::uint32_t &out) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < kMaxRemainingLengthBytes; ++i) {
        std::array<byte, 1> chunk{};
        auto ec = source.read_exact(mutable_bytes_view{chunk.data(), chunk.size()});
        if (ec == core::errc::end_of_stream) {
            return make_error_code(errc::truncated);
        }
        if (ec) {
            return ec;
        }
        if (accumulate(chunk[0], i, value)) {
            out = value;
            return {};
        }
    }
    return make_error_code(errc::malformed_length);
}

std::error_code decode_length(bytes_view in,
                              std::uint32_t &out,
                              std::size_t &consumed) noexcept {
    consumed = 0;
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < kMaxRemainingLengthBytes; ++i) {
        if (i >= in.size()) {
            return make_error_code(errc::truncated);
        }
        if (accumulate(in[i], i, value)) {
            out = value;
            consumed = i + 1;
            return {};
        }
    }
    return make_error_code(errc::malformed_length);
}

} // namespace mqtt::codec
