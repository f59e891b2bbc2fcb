#pragma once

#include <string>
#include <utility>

#include <entt/meta/factory.hpp>
#include <entt/meta/meta.hpp>

#include "common/error.hpp"
#include "dispatch/type_dispatcher.hpp"
#include "module/module_system.hpp"

namespace ax::testing {

struct IntLike {};
struct BoolLike : IntLike {};
struct OtherInt : IntLike {};

// diamond with a consistent C3 order
struct Top {};
struct Left : Top {};
struct Right : Top {};
struct Bottom : Left, Right {};

// bases listed in opposite orders: no C3 order exists for Zed
struct Ay {};
struct Bee {};
struct Ex : Ay, Bee {};
struct Why : Bee, Ay {};
struct Zed : Ex, Why {};

/// Declare the bases of the shared test hierarchies. Idempotent.
inline auto register_test_types() -> void {
  entt::meta<BoolLike>().base<IntLike>();
  entt::meta<OtherInt>().base<IntLike>();

  entt::meta<Left>().base<Top>();
  entt::meta<Right>().base<Top>();
  entt::meta<Bottom>().base<Left>().base<Right>();

  entt::meta<Ex>().base<Ay>().base<Bee>();
  entt::meta<Why>().base<Bee>().base<Ay>();
  entt::meta<Zed>().base<Ex>().base<Why>();
}

using LabelDispatcher = ax::dispatch::TypeDispatcher<std::string()>;

/// Handler that answers with a fixed label.
inline auto label(std::string text) -> LabelDispatcher::Handler {
  return [text = std::move(text)](const entt::meta_any &) { return text; };
}

/// Label returned by the handler resolved for `key`, or the error code name.
inline auto resolve_label(LabelDispatcher &dispatcher, const ax::dispatch::HandlerKey &key)
    -> std::string {
  auto handler = dispatcher.get_handler(key);
  if (!handler) {
    return std::string(ax::to_string(handler.error().code));
  }
  return (*handler)(entt::meta_any{});
}

/// Declares a module for the lifetime of the object.
class ScopedModule {
 public:
  ScopedModule(std::string name, ax::module::Initializer initializer) : name_(std::move(name)) {
    ax::module::ModuleSystem::instance().declare(name_, std::move(initializer));
  }
  ~ScopedModule() { ax::module::ModuleSystem::instance().forget(name_); }

  ScopedModule(const ScopedModule &) = delete;
  auto operator=(const ScopedModule &) -> ScopedModule & = delete;

 private:
  std::string name_;
};

}  // namespace ax::testing
