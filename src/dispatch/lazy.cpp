#include "dispatch/lazy.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <vector>

#include "common/logging/log.hpp"
#include "module/module_system.hpp"

namespace ax::dispatch {
namespace {

// Recursive: a module initializer run by a reload may construct or destroy
// dispatchers on the same thread.
struct LiveSet {
  std::recursive_mutex mutex;
  std::vector<LazyHandlerHost *> hosts;
};

auto live_set() -> LiveSet & {
  static LiveSet set;
  return set;
}

auto is_live(const LiveSet &set, const LazyHandlerHost *host) -> bool {
  return std::find(set.hosts.begin(), set.hosts.end(), host) != set.hosts.end();
}

}  // namespace

LazyHandlerHost::LazyHandlerHost() {
  auto &set = live_set();
  std::lock_guard<std::recursive_mutex> lock(set.mutex);
  set.hosts.push_back(this);
}

LazyHandlerHost::LazyHandlerHost(const LazyHandlerHost &) : LazyHandlerHost() {}

LazyHandlerHost::~LazyHandlerHost() {
  auto &set = live_set();
  std::lock_guard<std::recursive_mutex> lock(set.mutex);
  std::erase(set.hosts, this);
}

auto reload_all_lazy_handlers() -> Expected<void> {
  auto &set = live_set();
  std::lock_guard<std::recursive_mutex> lock(set.mutex);
  auto snapshot = set.hosts;
  ax::log::debug("reloading lazy handlers of {} dispatchers", snapshot.size());
  for (auto *host : snapshot) {
    if (!is_live(set, host)) {
      continue;
    }
    auto reloaded = host->reload_lazy_handlers();
    if (!reloaded) {
      return reloaded;
    }
  }
  return {};
}

auto live_dispatcher_count() -> std::size_t {
  auto &set = live_set();
  std::lock_guard<std::recursive_mutex> lock(set.mutex);
  return set.hosts.size();
}

auto split_qualified_name(std::string_view qualified_name)
    -> Expected<std::pair<std::string_view, std::string_view>> {
  auto dot = qualified_name.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == qualified_name.size()) {
    return tl::unexpected(make_error(
        ErrorCode::ImportError,
        std::format("malformed qualified type name '{}'", qualified_name)));
  }
  return std::pair{qualified_name.substr(0, dot), qualified_name.substr(dot + 1)};
}

auto resolve_lazy_key(std::string_view qualified_name) -> Expected<entt::meta_type> {
  auto parts = split_qualified_name(qualified_name);
  if (!parts) {
    return tl::unexpected(parts.error());
  }
  auto module = ax::module::ModuleSystem::instance().import_module(parts->first);
  if (!module) {
    return tl::unexpected(module.error());
  }
  return (*module)->get_attribute(parts->second);
}

}  // namespace ax::dispatch
