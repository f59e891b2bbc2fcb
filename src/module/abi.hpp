#pragma once

#include <entt/locator/locator.hpp>
#include <entt/meta/context.hpp>

#include "module/module.hpp"

/// Arguments handed to a shared-library module's entry point.
struct ax_module_context {
  ax::module::Module *module;
  /// Meta context of the host process. A library registers its types into
  /// this context, not its own copy.
  const entt::locator<entt::meta_ctx>::node_type *meta_context;
};

/// Entry point exported by every shared-library module:
///   extern "C" int ax_module_init(const ax_module_context *context);
/// Returns 0 on success.
using ax_module_init_fn = int (*)(const ax_module_context *);

inline constexpr const char *kAxModuleInitSymbol = "ax_module_init";

namespace ax::module {

/// Called first inside `ax_module_init`.
inline auto adopt_host_context(const ax_module_context &context) -> void {
  entt::locator<entt::meta_ctx>::reset(*context.meta_context);
}

}  // namespace ax::module
