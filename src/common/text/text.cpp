#include "common/text/text.hpp"

#include <cstdint>
#include <cstring>
#include <format>

namespace ax::text {
namespace {

// Length of the sequence introduced by `lead`, 0 when `lead` cannot start one.
auto sequence_length(std::uint8_t lead) -> std::size_t {
  if (lead < 0x80) return 1;
  if (lead >= 0xc2 && lead <= 0xdf) return 2;
  if (lead >= 0xe0 && lead <= 0xef) return 3;
  if (lead >= 0xf0 && lead <= 0xf4) return 4;
  return 0;
}

auto is_continuation(std::uint8_t byte) -> bool { return (byte & 0xc0) == 0x80; }

auto find_invalid_utf8(std::span<const std::byte> bytes) -> std::size_t {
  std::size_t i = 0;
  while (i < bytes.size()) {
    auto lead = static_cast<std::uint8_t>(bytes[i]);
    auto len = sequence_length(lead);
    if (len == 0 || i + len > bytes.size()) {
      return i;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if (!is_continuation(static_cast<std::uint8_t>(bytes[i + k]))) {
        return i;
      }
    }
    if (len >= 3) {
      auto second = static_cast<std::uint8_t>(bytes[i + 1]);
      // overlong forms, UTF-16 surrogates and code points past U+10FFFF
      if ((lead == 0xe0 && second < 0xa0) || (lead == 0xed && second > 0x9f) ||
          (lead == 0xf0 && second < 0x90) || (lead == 0xf4 && second > 0x8f)) {
        return i;
      }
    }
    i += len;
  }
  return bytes.size();
}

}  // namespace

auto to_binary(std::string_view value) -> Bytes {
  Bytes out(value.size());
  if (!value.empty()) {
    std::memcpy(out.data(), value.data(), value.size());
  }
  return out;
}

auto to_str(std::span<const std::byte> bytes) -> Expected<std::string> {
  auto bad = find_invalid_utf8(bytes);
  if (bad != bytes.size()) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        std::format("invalid utf-8 sequence at offset {}", bad)));
  }
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

auto to_hex(std::span<const std::byte> bytes) -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    auto value = static_cast<std::uint8_t>(b);
    out.push_back(kDigits[value >> 4]);
    out.push_back(kDigits[value & 0x0f]);
  }
  return out;
}

}  // namespace ax::text
