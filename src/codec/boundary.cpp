#include "mqtt/codec/boundary.hpp"

#include "core/logger.hpp"

namespace mqtt::codec::detail {

void report_fault(std::string_view operation,
                  const std::error_code &ec,
                  const char *what) noexcept {
    core::detail::logger().warn("{}: exception converted to [{}] {} ({})",
                                operation,
                                ec.category().name(),
                                ec.message(),
                                what != nullptr ? what : "");
}

} // namespace mqtt::codec::detail
