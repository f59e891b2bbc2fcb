#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "common/error.hpp"
#include "module/loader.hpp"
#include "module/module.hpp"

namespace ax::module {

/// Process-wide module table. Declared modules are populated by their
/// initializer on first import and cached afterwards.
class ModuleSystem {
 public:
  static auto instance() -> ModuleSystem &;

  /// Make `name` importable. Ignored once `name` has been imported.
  auto declare(std::string name, Initializer initializer) -> void;

  auto import_module(std::string_view name) -> Expected<std::shared_ptr<const Module>>;

  auto is_imported(std::string_view name) const -> bool;

  auto is_declared(std::string_view name) const -> bool;

  /// Drop the declaration and the cached module for `name`. Types the module
  /// already registered stay in the meta context.
  auto forget(std::string_view name) -> void;

  /// Replace the loader consulted for undeclared names. Passing nullptr
  /// restores the flag-configured shared-library loader.
  auto set_fallback_loader(std::unique_ptr<ModuleLoader> loader) -> void;

 private:
  ModuleSystem() = default;

  auto fallback_loader_locked() -> ModuleLoader *;

  mutable std::recursive_mutex mutex_;
  std::unordered_map<std::string, Initializer> declared_;
  std::unordered_map<std::string, std::shared_ptr<const Module>> imported_;
  std::unordered_set<std::string> importing_;
  std::unique_ptr<ModuleLoader> fallback_;
  bool fallback_resolved_ = false;
};

/// Declares a module from a static initializer.
struct StaticModule {
  StaticModule(std::string name, Initializer initializer) {
    ModuleSystem::instance().declare(std::move(name), std::move(initializer));
  }
};

}  // namespace ax::module
