#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <span>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <entt/meta/meta.hpp>

#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "dispatch/dispatch_key.hpp"
#include "dispatch/lazy.hpp"
#include "dispatch/lineage.hpp"

namespace ax::dispatch {

template <typename Signature>
class TypeDispatcher;

/// Maps runtime types to handlers, resolving unregistered types through
/// their declared bases.
///
/// `handlers_` holds direct registrations. `inherited_cache_` memoizes
/// hierarchy-walk results and is derived from `handlers_`, so it is
/// dropped whenever `handlers_` changes. Lazy registrations are keyed by a
/// qualified type name and resolved on the first lookup miss, or through
/// `reload_all_lazy_handlers()`.
///
/// Not synchronized: registration is expected at configuration time.
template <typename R, typename... Args>
class TypeDispatcher<R(Args...)> : public LazyHandlerHost {
 public:
  using Handler = std::function<R(const entt::meta_any &, Args...)>;

  TypeDispatcher() = default;
  TypeDispatcher(const TypeDispatcher &) = default;
  auto operator=(const TypeDispatcher &) -> TypeDispatcher & = default;
  ~TypeDispatcher() override = default;

  auto register_handler(const DispatchKey &key, Handler handler) -> Expected<void> {
    if (const auto *lazy = std::get_if<LazyKey>(&key)) {
      auto it = find_lazy(lazy->qualified_name);
      if (it != lazy_handlers_.end()) {
        it->second = std::move(handler);
      } else {
        lazy_handlers_.emplace_back(lazy->qualified_name, std::move(handler));
      }
      return {};
    }

    auto handler_key = to_handler_key(key);
    if (!is_valid(handler_key)) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidArgument,
          std::format("cannot register handler for {}", describe(key))));
    }
    handlers_.insert_or_assign(std::move(handler_key), std::move(handler));
    inherited_cache_.clear();
    return {};
  }

  /// Register `handler` under every key. Stops at the first rejected key.
  auto register_handler(std::span<const DispatchKey> keys, Handler handler) -> Expected<void> {
    for (const auto &key : keys) {
      auto registered = register_handler(key, handler);
      if (!registered) {
        return registered;
      }
    }
    return {};
  }

  auto register_handler(std::initializer_list<DispatchKey> keys, Handler handler)
      -> Expected<void> {
    return register_handler(std::span<const DispatchKey>(keys.begin(), keys.size()),
                            std::move(handler));
  }

  auto unregister_handler(const DispatchKey &key) -> void {
    if (const auto *lazy = std::get_if<LazyKey>(&key)) {
      auto it = find_lazy(lazy->qualified_name);
      if (it != lazy_handlers_.end()) {
        lazy_handlers_.erase(it);
      }
    } else {
      handlers_.erase(to_handler_key(key));
    }
    // a removed entry may back any number of cached descendants
    inherited_cache_.clear();
  }

  auto unregister_handler(std::span<const DispatchKey> keys) -> void {
    for (const auto &key : keys) {
      unregister_handler(key);
    }
  }

  auto unregister_handler(std::initializer_list<DispatchKey> keys) -> void {
    unregister_handler(std::span<const DispatchKey>(keys.begin(), keys.size()));
  }

  auto get_handler(const HandlerKey &key) -> Expected<Handler> {
    if (!is_valid(key)) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidArgument,
          std::format("cannot dispatch {}", describe(key))));
    }
    if (auto it = handlers_.find(key); it != handlers_.end()) {
      return it->second;
    }
    if (auto it = inherited_cache_.find(key); it != inherited_cache_.end()) {
      return it->second;
    }

    auto reloaded = reload_lazy_handlers();
    if (!reloaded) {
      return tl::unexpected(reloaded.error());
    }

    for (const auto &candidate : handler_lineage(key)) {
      // only authoritative entries: the cache may not feed itself
      if (auto it = handlers_.find(candidate); it != handlers_.end()) {
        inherited_cache_.insert_or_assign(key, it->second);
        return it->second;
      }
    }
    return tl::unexpected(make_error(
        ErrorCode::DispatchNotFound,
        std::format("cannot dispatch type {}", describe(key))));
  }

  template <typename T>
  auto get_handler() -> Expected<Handler> {
    return get_handler(HandlerKey{type_key<T>()});
  }

  /// Dispatch on the runtime type of `value` and invoke the handler.
  auto operator()(const entt::meta_any &value, Args... args) -> Expected<R> {
    if (!value) {
      return tl::unexpected(make_error(ErrorCode::InvalidArgument, "cannot dispatch an empty value"));
    }
    auto handler = get_handler(HandlerKey{value.type()});
    if (!handler) {
      return tl::unexpected(handler.error());
    }
    if constexpr (std::is_void_v<R>) {
      (*handler)(value, std::forward<Args>(args)...);
      return {};
    } else {
      return (*handler)(value, std::forward<Args>(args)...);
    }
  }

  /// Import the module of every pending lazy key and register its handler
  /// under the resolved type. All keys resolve or none is committed.
  ///
  /// Module initializers run during resolution and may register or remove
  /// lazy keys on this dispatcher. Resolution walks a copy of the pending
  /// names; the commit walks the entries present afterwards. Keys added by
  /// an initializer are resolved in a further pass.
  auto reload_lazy_handlers() -> Expected<void> override {
    if (lazy_handlers_.empty()) {
      return {};
    }

    std::vector<std::string> names;
    names.reserve(lazy_handlers_.size());
    for (const auto &entry : lazy_handlers_) {
      names.push_back(entry.first);
    }

    std::unordered_map<std::string, entt::meta_type> resolved;
    for (const auto &name : names) {
      auto type = resolve_lazy_key(name);
      if (!type) {
        return tl::unexpected(type.error());
      }
      resolved.insert_or_assign(name, *type);
    }

    auto pending = std::exchange(lazy_handlers_, {});
    for (std::size_t i = 0; i < pending.size(); ++i) {
      auto it = resolved.find(pending[i].first);
      if (it == resolved.end()) {
        lazy_handlers_.push_back(std::move(pending[i]));
        continue;
      }
      ax::log::debug("resolved lazy handler '{}' to {}", pending[i].first, describe(it->second));
      auto registered = register_handler(DispatchKey{it->second}, std::move(pending[i].second));
      if (!registered) {
        std::move(pending.begin() + static_cast<std::ptrdiff_t>(i) + 1, pending.end(),
                  std::back_inserter(lazy_handlers_));
        return registered;
      }
    }
    return reload_lazy_handlers();
  }

  auto has_lazy_handlers() const -> bool { return !lazy_handlers_.empty(); }

  auto size() const -> std::size_t { return handlers_.size(); }

  auto cached_size() const -> std::size_t { return inherited_cache_.size(); }

 private:
  using LazyEntry = std::pair<std::string, Handler>;
  using HandlerMap = std::unordered_map<HandlerKey, Handler, HandlerKeyHash>;

  static auto to_handler_key(const DispatchKey &key) -> HandlerKey {
    if (const auto *named = std::get_if<NamedType>(&key)) {
      return *named;
    }
    return std::get<entt::meta_type>(key);
  }

  auto find_lazy(const std::string &name) -> typename std::vector<LazyEntry>::iterator {
    return std::find_if(lazy_handlers_.begin(), lazy_handlers_.end(),
                        [&](const LazyEntry &entry) { return entry.first == name; });
  }

  HandlerMap handlers_;
  HandlerMap inherited_cache_;
  std::vector<LazyEntry> lazy_handlers_;
};

}  // namespace ax::dispatch
