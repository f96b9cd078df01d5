#include "mqtt/core/stream.hpp"

#include <algorithm>
#include <new>
#include <stdexcept>

namespace mqtt::core {

BytesReader::BytesReader(bytes_view in) noexcept : in_(in) {}

std::error_code BytesReader::read_exact(mutable_bytes_view dst) {
    if (dst.empty()) {
        return {};
    }
    if (remaining() < dst.size()) {
        return make_error_code(errc::end_of_stream);
    }
    std::copy_n(in_.begin() + static_cast<std::ptrdiff_t>(pos_), dst.size(),
                dst.begin());
    pos_ += dst.size();
    return {};
}

std::size_t BytesReader::consumed() const noexcept { return pos_; }

std::size_t BytesReader::remaining() const noexcept {
    return in_.size() - pos_;
}

VectorWriter::VectorWriter(std::vector<byte> &out) noexcept : out_(&out) {}

std::error_code VectorWriter::write_all(bytes_view src) {
    try {
        out_->insert(out_->end(), src.begin(), src.end());
    } catch (const std::bad_alloc &) {
        return make_error_code(errc::out_of_memory);
    } catch (const std::length_error &) {
        return make_error_code(errc::buffer_overflow);
    }
    ++write_count_;
    return {};
}

std::size_t VectorWriter::write_count() const noexcept { return write_count_; }

} // namespace mqtt::core
