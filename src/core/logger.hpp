#pragma once

// 库内部使用的 spdlog logger（不安装、不出现在 public headers 中）。

#include <spdlog/spdlog.h>

namespace mqtt::core::detail {

[[nodiscard]] spdlog::logger &logger() noexcept;

} // namespace mqtt::core::detail
