#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/core/hashed_string.hpp>
#include <entt/meta/factory.hpp>
#include <entt/meta/meta.hpp>
#include <entt/meta/resolve.hpp>

#include "common/error.hpp"

namespace ax::module {

/// A named unit of runtime types. Types become visible to lookups by
/// qualified name ("<module>.<symbol>") once the module exports them.
class Module {
 public:
  explicit Module(std::string name) : name_(std::move(name)) {}

  auto name() const -> const std::string & { return name_; }

  auto qualify(std::string_view symbol) const -> std::string {
    std::string qualified;
    qualified.reserve(name_.size() + 1 + symbol.size());
    qualified.append(name_).append(".").append(symbol);
    return qualified;
  }

  /// Register `T` with the meta context under its qualified id and export it
  /// as `symbol`. The returned factory declares bases, e.g.
  /// `module.export_type<Derived>("Derived").base<Base>()`.
  template <typename T>
  auto export_type(std::string_view symbol) {
    auto qualified = qualify(symbol);
    auto factory = entt::meta<T>().type(entt::hashed_string{qualified.c_str(), qualified.size()});
    exports_.insert_or_assign(std::string(symbol), entt::resolve<T>());
    return factory;
  }

  auto get_attribute(std::string_view symbol) const -> Expected<entt::meta_type>;

  auto symbols() const -> std::vector<std::string>;

 private:
  std::string name_;
  std::unordered_map<std::string, entt::meta_type> exports_;
};

using Initializer = std::function<Expected<void>(Module &)>;

}  // namespace ax::module
