#pragma once

#include "mqtt/core/error.hpp"

#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

namespace mqtt::codec {

namespace detail {

// 记录在边界处被转换的异常（warn 级别，spdlog 实现位于 boundary.cpp）。
void report_fault(std::string_view operation,
                  const std::error_code &ec,
                  const char *what) noexcept;

} // namespace detail

/**
 * @brief 单次编解码调用的故障边界：把调用期间抛出的异常转换为 error_code。
 *
 * 解码逻辑本身按“每次读取返回 error_code、逐层上抛”编写；本边界兜底处理
 * Reader/Writer 实现或内存分配抛出的异常，保证异常不会越过公开 API：
 * - std::system_error：原样返回其 code()（已经是错误码的故障不做改写）
 * - std::bad_alloc：core::errc::out_of_memory
 * - std::length_error：core::errc::buffer_overflow
 * - 其它 std::exception：core::errc::stream_fault
 *
 * fn 必须返回 std::error_code。
 */
template <class Fn>
std::error_code fault_boundary(std::string_view operation, Fn &&fn) noexcept {
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::system_error &e) {
        detail::report_fault(operation, e.code(), e.what());
        return e.code();
    } catch (const std::bad_alloc &e) {
        const auto ec = core::make_error_code(core::errc::out_of_memory);
        detail::report_fault(operation, ec, e.what());
        return ec;
    } catch (const std::length_error &e) {
        const auto ec = core::make_error_code(core::errc::buffer_overflow);
        detail::report_fault(operation, ec, e.what());
        return ec;
    } catch (const std::exception &e) {
        const auto ec = core::make_error_code(core::errc::stream_fault);
        detail::report_fault(operation, ec, e.what());
        return ec;
    }
}

} // namespace mqtt::codec
