#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace ax {

enum class ErrorCode : std::uint8_t {
  DispatchNotFound,
  ImportError,
  AttributeError,
  EntropyUnavailable,
  InvalidArgument,
};

struct Error {
  ErrorCode code = ErrorCode::InvalidArgument;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
  return Error{code, std::move(message)};
}

auto to_string(ErrorCode code) -> std::string_view;

}  // namespace ax
