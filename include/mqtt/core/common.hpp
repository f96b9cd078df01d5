#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace mqtt::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

}  // 命名空间 mqtt::core
