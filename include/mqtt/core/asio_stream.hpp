#pragma once

#include "mqtt/core/common.hpp"
#include "mqtt/core/error.hpp"
#include "mqtt/core/stream.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <system_error>

namespace mqtt::core {

/**
 * @brief 把任意 asio 同步读流（SyncReadStream）适配为 Reader。
 *
 * 典型用法：asio::ip::tcp::socket / asio::local::stream_protocol::socket /
 * asio::posix::stream_descriptor。连接的建立与关闭由调用者负责。
 *
 * 说明：asio::error::eof 映射为 errc::end_of_stream，其余错误原样返回。
 */
template <class SyncReadStream>
class AsioReader final : public Reader {
public:
    explicit AsioReader(SyncReadStream &stream) noexcept : stream_(stream) {}

    std::error_code read_exact(mutable_bytes_view dst) override {
        if (dst.empty()) {
            return {};
        }
        std::error_code ec;
        asio::read(stream_, asio::buffer(dst.data(), dst.size()), ec);
        if (ec == asio::error::eof) {
            return make_error_code(errc::end_of_stream);
        }
        return ec;
    }

private:
    SyncReadStream &stream_;
};

/**
 * @brief 把任意 asio 同步写流（SyncWriteStream）适配为 Writer。
 */
template <class SyncWriteStream>
class AsioWriter final : public Writer {
public:
    explicit AsioWriter(SyncWriteStream &stream) noexcept : stream_(stream) {}

    std::error_code write_all(bytes_view src) override {
        // asio::write 只有在出错时才会提前返回，此时 ec 已置位。
        std::error_code ec;
        asio::write(stream_, asio::buffer(src.data(), src.size()), ec);
        return ec;
    }

private:
    SyncWriteStream &stream_;
};

} // namespace mqtt::core
