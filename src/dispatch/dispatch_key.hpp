#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

#include <entt/meta/meta.hpp>
#include <entt/meta/resolve.hpp>

namespace ax::dispatch {

/// A runtime type used under a logical role.
struct NamedType {
  std::string name;
  entt::meta_type type;

  auto operator==(const NamedType &other) const -> bool {
    return name == other.name && type == other.type;
  }
};

/// Fully-qualified name ("module.path.TypeName") of a type whose module has
/// not been imported yet.
struct LazyKey {
  std::string qualified_name;
};

/// Keys accepted by lookups.
using HandlerKey = std::variant<entt::meta_type, NamedType>;

/// Keys accepted by registration.
using DispatchKey = std::variant<entt::meta_type, NamedType, LazyKey>;

template <typename T>
auto type_key() -> entt::meta_type {
  return entt::resolve<T>();
}

template <typename T>
auto named_key(std::string name) -> NamedType {
  return NamedType{std::move(name), entt::resolve<T>()};
}

auto describe(const entt::meta_type &type) -> std::string;
auto describe(const HandlerKey &key) -> std::string;
auto describe(const DispatchKey &key) -> std::string;

/// False for a default-constructed meta type, also inside a NamedType.
auto is_valid(const HandlerKey &key) -> bool;

struct HandlerKeyHash {
  auto operator()(const entt::meta_type &type) const -> std::size_t;
  auto operator()(const HandlerKey &key) const -> std::size_t;
};

}  // namespace ax::dispatch
