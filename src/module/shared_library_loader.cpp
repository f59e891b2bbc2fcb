#include "module/shared_library_loader.hpp"

#include <dlfcn.h>

#include <format>
#include <utility>

#include "common/logging/log.hpp"
#include "module/abi.hpp"

namespace ax::module {
namespace {

auto last_dl_error() -> std::string {
  const char *message = dlerror();
  return message ? std::string(message) : std::string("unknown error");
}

}  // namespace

SharedLibraryLoader::SharedLibraryLoader(std::filesystem::path root, std::string prefix)
    : root_(std::move(root)), prefix_(std::move(prefix)) {}

// Libraries stay mapped: meta nodes they registered live in their static storage.
SharedLibraryLoader::~SharedLibraryLoader() = default;

auto SharedLibraryLoader::library_path(std::string_view name) const -> std::filesystem::path {
  std::string file = "lib" + prefix_;
  file.reserve(file.size() + name.size() + 3);
  for (char c : name) {
    file.push_back(c == '.' ? '_' : c);
  }
  file += ".so";
  return root_ / file;
}

auto SharedLibraryLoader::load(std::string_view name, Module &module) -> Expected<void> {
  auto path = library_path(name);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("no module named '{}' (looked for {})", name, path.string())));
  }

  void *handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("failed to load module '{}': {}", name, last_dl_error())));
  }

  auto *init = reinterpret_cast<ax_module_init_fn>(dlsym(handle, kAxModuleInitSymbol));
  if (!init) {
    auto message = last_dl_error();
    dlclose(handle);
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("module '{}' is missing {}: {}", name, kAxModuleInitSymbol, message)));
  }

  // make sure the host context exists before handing it out
  static_cast<void>(entt::locator<entt::meta_ctx>::value_or());
  auto meta_context = entt::locator<entt::meta_ctx>::handle();
  ax_module_context context{&module, &meta_context};
  if (int rc = init(&context); rc != 0) {
    // types registered before the failure still point into the library
    handles_.push_back(handle);
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("module '{}' initialization failed with code {}", name, rc)));
  }

  handles_.push_back(handle);
  ax::log::info("loaded module '{}' from {}", name, path.string());
  return {};
}

}  // namespace ax::module
