#include "dispatch/dispatch_key.hpp"

#include <format>
#include <functional>

namespace ax::dispatch {
namespace {

template <typename... Fs>
struct Overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

}  // namespace

auto describe(const entt::meta_type &type) -> std::string {
  if (!type) {
    return "<invalid type>";
  }
  return std::string(type.info().name());
}

auto describe(const HandlerKey &key) -> std::string {
  return std::visit(Overloaded{
                        [](const entt::meta_type &type) { return describe(type); },
                        [](const NamedType &named) {
                          return std::format("NamedType({}, {})", named.name, describe(named.type));
                        },
                    },
                    key);
}

auto describe(const DispatchKey &key) -> std::string {
  return std::visit(Overloaded{
                        [](const entt::meta_type &type) { return describe(type); },
                        [](const NamedType &named) { return describe(HandlerKey{named}); },
                        [](const LazyKey &lazy) { return std::format("lazy '{}'", lazy.qualified_name); },
                    },
                    key);
}

auto is_valid(const HandlerKey &key) -> bool {
  if (const auto *named = std::get_if<NamedType>(&key)) {
    return static_cast<bool>(named->type);
  }
  return static_cast<bool>(std::get<entt::meta_type>(key));
}

auto HandlerKeyHash::operator()(const entt::meta_type &type) const -> std::size_t {
  return type ? static_cast<std::size_t>(type.info().hash()) : 0;
}

auto HandlerKeyHash::operator()(const HandlerKey &key) const -> std::size_t {
  if (const auto *named = std::get_if<NamedType>(&key)) {
    auto h = std::hash<std::string>{}(named->name);
    return h ^ ((*this)(named->type) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
  return (*this)(std::get<entt::meta_type>(key));
}

}  // namespace ax::dispatch
