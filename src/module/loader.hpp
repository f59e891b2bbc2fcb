#pragma once

#include <string_view>

#include "common/error.hpp"
#include "module/module.hpp"

namespace ax::module {

/// Fallback source for modules that were never declared in-process.
class ModuleLoader {
 public:
  virtual ~ModuleLoader() = default;

  /// Populate `module` for `name`. Returns ImportError when the loader has
  /// no such module.
  virtual auto load(std::string_view name, Module &module) -> Expected<void> = 0;
};

}  // namespace ax::module
