// Shared-library module "example.plugins". Build it as
// lib<module_prefix>example_plugins.so and point --module_path at its
// directory.

#include "module/abi.hpp"

namespace {

struct PluginCounter {
  int value = 0;
};

struct PluginGauge : PluginCounter {};

}  // namespace

extern "C" int ax_module_init(const ax_module_context *context) {
  if (!context || !context->module || !context->meta_context) {
    return 1;
  }
  ax::module::adopt_host_context(*context);
  context->module->export_type<PluginCounter>("PluginCounter");
  context->module->export_type<PluginGauge>("PluginGauge").base<PluginCounter>();
  return 0;
}
