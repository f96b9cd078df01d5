#include "mqtt/codec/primitives.hpp"

#include "mqtt/codec/error.hpp"
#include "mqtt/core/error.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace mqtt::codec {
namespace {

constexpr std::uint32_t kReadChunkSize = 4096;

} // namespace

void PayloadWriter::put_u8(std::uint8_t v) { buf_.push_back(v); }

void PayloadWriter::put_u16(std::uint16_t v) {
    buf_.push_back(static_cast<byte>((v >> 8U) & 0xFFU));
    buf_.push_back(static_cast<byte>(v & 0xFFU));
}

std::error_code PayloadWriter::put_string(std::string_view s) {
    if (s.size() > kMaxStringLength) {
        return make_error_code(errc::field_too_long);
    }
    put_u16(static_cast<std::uint16_t>(s.size()));
    const auto *p = reinterpret_cast<const byte *>(s.data());
    buf_.insert(buf_.end(), p, p + s.size());
    return {};
}

void PayloadWriter::put_bytes(bytes_view data) {
    buf_.insert(buf_.end(), data.begin(), data.end());
}

bytes_view PayloadWriter::bytes() const noexcept {
    return bytes_view{buf_.data(), buf_.size()};
}

std::size_t PayloadWriter::size() const noexcept { return buf_.size(); }

BudgetReader::BudgetReader(core::Reader &source, std::uint32_t budget) noexcept
    : source_(source), remaining_(budget) {}

std::uint32_t BudgetReader::remaining() const noexcept { return remaining_; }

bool BudgetReader::exhausted() const noexcept { return remaining_ == 0; }

std::error_code BudgetReader::take(mutable_bytes_view dst) {
    if (dst.size() > remaining_) {
        return make_error_code(errc::remaining_length_exceeded);
    }
    auto ec = source_.read_exact(dst);
    if (ec == core::errc::end_of_stream) {
        return make_error_code(errc::truncated);
    }
    if (ec) {
        return ec;
    }
    remaining_ -= static_cast<std::uint32_t>(dst.size());
    return {};
}

std::error_code BudgetReader::read_u8(std::uint8_t &out) {
    std::array<byte, 1> buf{};
    auto ec = take(mutable_bytes_view{buf.data(), buf.size()});
    if (ec) {
        return ec;
    }
    out = buf[0];
    return {};
}

std::error_code BudgetReader::read_u16(std::uint16_t &out) {
    std::array<byte, 2> buf{};
    auto ec = take(mutable_bytes_view{buf.data(), buf.size()});
    if (ec) {
        return ec;
    }
    out = static_cast<std::uint16_t>((static_cast<std::uint16_t>(buf[0]) << 8U) |
                                     static_cast<std::uint16_t>(buf[1]));
    return {};
}

std::error_code BudgetReader::read_string(std::string &out) {
    std::uint16_t length = 0;
    auto ec = read_u16(length);
    if (ec) {
        return ec;
    }
    // 先按预算校验声明长度，避免按不可信长度分配内存。
    if (length > remaining_) {
        return make_error_code(errc::remaining_length_exceeded);
    }
    std::string s(length, '\0');
    ec = take(mutable_bytes_view{reinterpret_cast<byte *>(s.data()), s.size()});
    if (ec) {
        return ec;
    }
    out = std::move(s);
    return {};
}

std::error_code BudgetReader::read_rest(std::vector<byte> &out) {
    // 按块读取：缓冲区只随实际到达的字节增长，不按对端声明的长度一次性分配。
    std::vector<byte> data;
    while (remaining_ > 0) {
        const auto n = std::min<std::uint32_t>(remaining_, kReadChunkSize);
        const auto old_size = data.size();
        data.resize(old_size + n);
        auto ec = take(mutable_bytes_view{data.data() + old_size, n});
        if (ec) {
            return ec;
        }
    }
    out = std::move(data);
    return {};
}

std::error_code BudgetReader::expect_exhausted() const noexcept {
    if (remaining_ != 0) {
        return make_error_code(errc::remaining_length_mismatch);
    }
    return {};
}

} // namespace mqtt::codec
