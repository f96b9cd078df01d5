#pragma once

#include <system_error>

namespace mqtt::core {

/**
 * @brief 本库通用错误码（跨模块复用，与协议无关）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，异常不会越过公开 API；
 * - end_of_stream 表示底层输入在请求的字节数之前结束（对端关闭/缓冲区读尽）；
 * - stream_fault 表示底层流以异常形式报告了无法归类的故障。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
  out_of_memory = 3,
  end_of_stream = 4,
  stream_fault = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace mqtt::core

namespace std {
template <>
struct is_error_code_enum<mqtt::core::errc> : true_type {};
}  // namespace std
