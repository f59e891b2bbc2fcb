#include "module/module.hpp"

#include <algorithm>
#include <format>

namespace ax::module {

auto Module::get_attribute(std::string_view symbol) const -> Expected<entt::meta_type> {
  auto it = exports_.find(std::string(symbol));
  if (it == exports_.end()) {
    return tl::unexpected(make_error(
        ErrorCode::AttributeError,
        std::format("module '{}' has no attribute '{}'", name_, symbol)));
  }
  return it->second;
}

auto Module::symbols() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(exports_.size());
  for (const auto &[symbol, type] : exports_) {
    names.push_back(symbol);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace ax::module
