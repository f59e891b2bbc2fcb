#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/error.hpp"

namespace ax {

using Bytes = std::vector<std::byte>;

namespace text {

/// Copy the UTF-8 bytes of `value`.
auto to_binary(std::string_view value) -> Bytes;

/// Decode UTF-8 bytes into a string. Malformed sequences are rejected.
auto to_str(std::span<const std::byte> bytes) -> Expected<std::string>;

/// Lower-case hex rendering, two digits per byte.
auto to_hex(std::span<const std::byte> bytes) -> std::string;

}  // namespace text
}  // namespace ax
