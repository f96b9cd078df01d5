#pragma once

#include "mqtt/core/common.hpp"
#include "mqtt/core/error.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace mqtt::core {

/**
 * @brief 同步字节源抽象（解码侧）。
 *
 * 说明：
 * - 编解码层只依赖 read_exact 的语义，不关心底层是 socket、文件还是内存；
 * - 输入在读满 dst 之前结束时返回 errc::end_of_stream；
 * - 同一个 Reader 不保证线程安全，由调用者串行化。
 */
class Reader {
public:
    virtual ~Reader() = default;

    virtual std::error_code read_exact(mutable_bytes_view dst) = 0;
};

/**
 * @brief 同步字节汇抽象（编码侧）。
 *
 * 编码器对每个报文只调用一次 write_all（固定头 + 负载一次性写出）。
 */
class Writer {
public:
    virtual ~Writer() = default;

    virtual std::error_code write_all(bytes_view src) = 0;
};

/**
 * @brief 以只读 span 作为输入的 Reader（单元测试 / 已缓冲数据场景）。
 *
 * 注意：不拷贝数据，调用者需保证 span 在 reader 生命周期内有效。
 * 剩余字节不足时不消耗任何输入，直接返回 end_of_stream。
 */
class BytesReader final : public Reader {
public:
    explicit BytesReader(bytes_view in) noexcept;

    std::error_code read_exact(mutable_bytes_view dst) override;

    [[nodiscard]] std::size_t consumed() const noexcept;
    [[nodiscard]] std::size_t remaining() const noexcept;

private:
    bytes_view in_{};
    std::size_t pos_{0};
};

/**
 * @brief 追加写入 std::vector 的 Writer。
 */
class VectorWriter final : public Writer {
public:
    explicit VectorWriter(std::vector<byte> &out) noexcept;

    std::error_code write_all(bytes_view src) override;

    [[nodiscard]] std::size_t write_count() const noexcept;

private:
    std::vector<byte> *out_;
    std::size_t write_count_{0};
};

} // namespace mqtt::core
