#include "common/error.hpp"

namespace ax {

auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::DispatchNotFound:
      return "DispatchNotFound";
    case ErrorCode::ImportError:
      return "ImportError";
    case ErrorCode::AttributeError:
      return "AttributeError";
    case ErrorCode::EntropyUnavailable:
      return "EntropyUnavailable";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

}  // namespace ax
