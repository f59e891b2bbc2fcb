#include <cstdint>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

#include <entt/meta/factory.hpp>
#include <entt/meta/meta.hpp>
#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "dispatch/type_dispatcher.hpp"
#include "module/module_system.hpp"

DEFINE_bool(with_device_arrays, true, "Make the optional device array module importable");

namespace {

struct Payload {
  virtual ~Payload() = default;
};

struct TextPayload : Payload {
  std::string text;
};

struct BlobPayload : Payload {
  std::size_t size = 0;
};

// Types of an optional, heavy dependency. Codecs refer to them by name only.
struct DeviceArray : Payload {
  int device = 0;
};

struct PinnedDeviceArray : DeviceArray {};

using Codec = ax::dispatch::TypeDispatcher<std::string(std::string_view)>;

auto register_codecs(Codec &codec) -> ax::Expected<void> {
  entt::meta<TextPayload>().base<Payload>();
  entt::meta<BlobPayload>().base<Payload>();

  auto registered = codec.register_handler(
      ax::dispatch::type_key<Payload>(),
      [](const entt::meta_any &, std::string_view route) {
        return std::format("{}: opaque payload", route);
      });
  if (!registered) {
    return registered;
  }
  registered = codec.register_handler(
      ax::dispatch::type_key<TextPayload>(),
      [](const entt::meta_any &value, std::string_view route) {
        return std::format("{}: text '{}'", route, value.cast<const TextPayload &>().text);
      });
  if (!registered) {
    return registered;
  }
  return codec.register_handler(
      ax::dispatch::LazyKey{"example.device.DeviceArray"},
      [](const entt::meta_any &value, std::string_view route) {
        const auto *array = value.try_cast<const DeviceArray>();
        return std::format("{}: device array on gpu{}", route, array ? array->device : -1);
      });
}

auto declare_device_module() -> void {
  ax::module::ModuleSystem::instance().declare(
      "example.device", [](ax::module::Module &module) -> ax::Expected<void> {
        module.export_type<DeviceArray>("DeviceArray").base<Payload>();
        module.export_type<PinnedDeviceArray>("PinnedDeviceArray").base<DeviceArray>();
        return {};
      });
}

auto encode(Codec &codec, const entt::meta_any &value, std::string_view route) -> bool {
  auto encoded = codec(value, route);
  if (!encoded) {
    std::cerr << std::format("{}: {} ({})\n", route, encoded.error().message,
                             ax::to_string(encoded.error().code));
    return false;
  }
  std::cout << *encoded << "\n";
  return true;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  ax::log::init();

  Codec codec;
  if (auto registered = register_codecs(codec); !registered) {
    std::cerr << "codec registration failed: " << registered.error().message << "\n";
    return 1;
  }
  if (FLAGS_with_device_arrays) {
    declare_device_module();
  }

  bool ok = true;
  TextPayload text;
  text.text = "hello";
  ok &= encode(codec, entt::forward_as_meta(text), "text");
  ok &= encode(codec, entt::meta_any{BlobPayload{}}, "blob");

  PinnedDeviceArray pinned;
  pinned.device = 1;
  ok &= encode(codec, entt::forward_as_meta(pinned), "pinned");

  if (auto reloaded = ax::dispatch::reload_all_lazy_handlers(); !reloaded) {
    ax::log::warn("lazy handlers still pending: {}", reloaded.error().message);
  }

  ax::log::shutdown();
  return ok ? 0 : 1;
}
