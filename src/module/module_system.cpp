#include "module/module_system.hpp"

#include <format>
#include <utility>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#ifdef AX_WITH_DYNAMIC_MODULES
#include "module/shared_library_loader.hpp"
#endif

DECLARE_string(module_path);
DECLARE_string(module_prefix);

namespace ax::module {
namespace {

// Marks a module as in-flight for the duration of its initializer.
class ImportGuard {
 public:
  ImportGuard(std::unordered_set<std::string> &importing, std::string name)
      : importing_(importing), name_(std::move(name)) {
    importing_.insert(name_);
  }
  ~ImportGuard() { importing_.erase(name_); }

  ImportGuard(const ImportGuard &) = delete;
  auto operator=(const ImportGuard &) -> ImportGuard & = delete;

 private:
  std::unordered_set<std::string> &importing_;
  std::string name_;
};

}  // namespace

auto ModuleSystem::instance() -> ModuleSystem & {
  static ModuleSystem system;
  return system;
}

auto ModuleSystem::declare(std::string name, Initializer initializer) -> void {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (imported_.contains(name)) {
    ax::log::warn("module '{}' already imported; declaration ignored", name);
    return;
  }
  declared_.insert_or_assign(std::move(name), std::move(initializer));
}

auto ModuleSystem::import_module(std::string_view name)
    -> Expected<std::shared_ptr<const Module>> {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto key = std::string(name);
  if (key.empty()) {
    return tl::unexpected(make_error(ErrorCode::ImportError, "empty module name"));
  }
  if (auto it = imported_.find(key); it != imported_.end()) {
    return it->second;
  }
  if (importing_.contains(key)) {
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("circular import of module '{}'", key)));
  }

  auto module = std::make_shared<Module>(key);
  Expected<void> loaded;
  {
    ImportGuard guard(importing_, key);
    if (auto it = declared_.find(key); it != declared_.end()) {
      // the initializer may declare further modules
      auto initializer = it->second;
      loaded = initializer(*module);
    } else if (auto *loader = fallback_loader_locked()) {
      loaded = loader->load(key, *module);
    } else {
      loaded = tl::unexpected(make_error(
          ErrorCode::ImportError, std::format("no module named '{}'", key)));
    }
  }

  if (!loaded) {
    ax::log::debug("import of '{}' failed: {}", key, loaded.error().message);
    return tl::unexpected(loaded.error());
  }

  imported_.emplace(key, module);
  ax::log::debug("imported module '{}' ({} symbols)", key, module->symbols().size());
  return std::shared_ptr<const Module>(std::move(module));
}

auto ModuleSystem::is_imported(std::string_view name) const -> bool {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return imported_.contains(std::string(name));
}

auto ModuleSystem::is_declared(std::string_view name) const -> bool {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return declared_.contains(std::string(name));
}

auto ModuleSystem::forget(std::string_view name) -> void {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto key = std::string(name);
  declared_.erase(key);
  imported_.erase(key);
}

auto ModuleSystem::set_fallback_loader(std::unique_ptr<ModuleLoader> loader) -> void {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  fallback_ = std::move(loader);
  fallback_resolved_ = static_cast<bool>(fallback_);
}

auto ModuleSystem::fallback_loader_locked() -> ModuleLoader * {
  if (!fallback_resolved_) {
    fallback_resolved_ = true;
#ifdef AX_WITH_DYNAMIC_MODULES
    if (!FLAGS_module_path.empty()) {
      ax::log::info("loading shared-library modules from '{}'", FLAGS_module_path);
      fallback_ = std::make_unique<SharedLibraryLoader>(FLAGS_module_path, FLAGS_module_prefix);
    }
#endif
  }
  return fallback_.get();
}

}  // namespace ax::module
