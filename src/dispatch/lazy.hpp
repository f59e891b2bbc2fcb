#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include <entt/meta/meta.hpp>

#include "common/error.hpp"

namespace ax::dispatch {

/// Non-template base of every dispatcher. Instances are members of the
/// process-wide live set from construction to destruction.
class LazyHandlerHost {
 public:
  virtual ~LazyHandlerHost();

  /// Resolve every pending lazy registration of this host.
  virtual auto reload_lazy_handlers() -> Expected<void> = 0;

 protected:
  LazyHandlerHost();
  LazyHandlerHost(const LazyHandlerHost &other);
  // membership follows the object, not its contents
  auto operator=(const LazyHandlerHost &) -> LazyHandlerHost & { return *this; }
};

/// Resolve the pending lazy handlers of every live dispatcher, in
/// construction order. Stops at the first failure.
auto reload_all_lazy_handlers() -> Expected<void>;

auto live_dispatcher_count() -> std::size_t;

/// Split "module.path.Symbol" at its last dot.
auto split_qualified_name(std::string_view qualified_name)
    -> Expected<std::pair<std::string_view, std::string_view>>;

/// Import the module named by `qualified_name` and look up its symbol.
auto resolve_lazy_key(std::string_view qualified_name) -> Expected<entt::meta_type>;

}  // namespace ax::dispatch
