#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "module/loader.hpp"

namespace ax::module {

/// Loads module `a.b.c` from `<root>/lib<prefix>a_b_c.so` and runs its
/// `ax_module_init` entry point.
class SharedLibraryLoader : public ModuleLoader {
 public:
  SharedLibraryLoader(std::filesystem::path root, std::string prefix);
  ~SharedLibraryLoader() override;

  SharedLibraryLoader(const SharedLibraryLoader &) = delete;
  auto operator=(const SharedLibraryLoader &) -> SharedLibraryLoader & = delete;

  auto load(std::string_view name, Module &module) -> Expected<void> override;

  auto library_path(std::string_view name) const -> std::filesystem::path;

 private:
  std::filesystem::path root_;
  std::string prefix_;
  std::vector<void *> handles_;
};

}  // namespace ax::module
