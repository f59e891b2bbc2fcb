#pragma once

#include <vector>

#include <entt/meta/meta.hpp>

#include "dispatch/dispatch_key.hpp"

namespace ax::dispatch {

/// Ancestors of `type`, most-derived first, starting with `type` itself.
///
/// Bases are the ones declared through `entt::meta<T>().base<B>()`, in
/// declaration order. The order is the C3 linearization of that graph; a
/// graph without one (inconsistent diamonds, cycles) falls back to a
/// depth-first walk that keeps the last occurrence of every repeated base.
auto type_lineage(const entt::meta_type &type) -> std::vector<entt::meta_type>;

/// Candidate keys probed when resolving `key` through its hierarchy. A
/// NamedType(n, T) yields NamedType(n, A) then A for every ancestor A of T.
auto handler_lineage(const HandlerKey &key) -> std::vector<HandlerKey>;

}  // namespace ax::dispatch
