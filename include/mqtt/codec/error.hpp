#pragma once

#include <system_error>

namespace mqtt::codec {

/**
 * @brief 报文编解码错误码。
 *
 * - 校验类（bad_*、field_too_long、payload_too_large）在编码时于写出任何字节之前返回；
 * - 解码类（truncated、remaining_length_*、malformed_length、packet_too_large）
 *   在单个报文的解码边界内返回，调用方的输出对象保持不变。
 */
enum class errc : int {
  ok = 0,
  bad_qos = 1,
  bad_msg_type = 2,
  bad_will_qos = 3,
  bad_return_code = 4,
  malformed_length = 5,
  truncated = 6,
  remaining_length_exceeded = 7,
  remaining_length_mismatch = 8,
  field_too_long = 9,
  payload_too_large = 10,
  packet_too_large = 11,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace mqtt::codec

namespace std {
template <>
struct is_error_code_enum<mqtt::codec::errc> : true_type {};
}  // namespace std
