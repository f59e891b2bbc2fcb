#include "dispatch/lineage.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace ax::dispatch {
namespace {

using TypeList = std::vector<entt::meta_type>;

auto contains(const TypeList &list, const entt::meta_type &type) -> bool {
  return std::find(list.begin(), list.end(), type) != list.end();
}

auto direct_bases(const entt::meta_type &type) -> TypeList {
  TypeList bases;
  for (auto &&[id, base] : type.base()) {
    bases.push_back(base);
  }
  return bases;
}

auto c3_merge(std::vector<TypeList> sequences) -> std::optional<TypeList> {
  TypeList result;
  for (;;) {
    std::erase_if(sequences, [](const TypeList &seq) { return seq.empty(); });
    if (sequences.empty()) {
      return result;
    }

    std::optional<entt::meta_type> candidate;
    for (const auto &seq : sequences) {
      const auto &head = seq.front();
      bool in_tail = std::any_of(sequences.begin(), sequences.end(), [&](const TypeList &other) {
        return std::find(other.begin() + 1, other.end(), head) != other.end();
      });
      if (!in_tail) {
        candidate = head;
        break;
      }
    }
    if (!candidate) {
      return std::nullopt;
    }

    result.push_back(*candidate);
    for (auto &seq : sequences) {
      if (seq.front() == *candidate) {
        seq.erase(seq.begin());
      }
    }
  }
}

auto c3_linearize(const entt::meta_type &type, TypeList &stack) -> std::optional<TypeList> {
  if (contains(stack, type)) {
    return std::nullopt;
  }
  stack.push_back(type);

  auto bases = direct_bases(type);
  std::vector<TypeList> sequences;
  sequences.reserve(bases.size() + 1);
  for (const auto &base : bases) {
    auto linearized = c3_linearize(base, stack);
    if (!linearized) {
      stack.pop_back();
      return std::nullopt;
    }
    sequences.push_back(std::move(*linearized));
  }
  sequences.push_back(bases);
  stack.pop_back();

  auto merged = c3_merge(std::move(sequences));
  if (!merged) {
    return std::nullopt;
  }
  TypeList out{type};
  out.insert(out.end(), merged->begin(), merged->end());
  return out;
}

auto depth_first(const entt::meta_type &type, TypeList &stack, TypeList &out) -> void {
  if (contains(stack, type)) {
    return;
  }
  stack.push_back(type);
  out.push_back(type);
  for (const auto &base : direct_bases(type)) {
    depth_first(base, stack, out);
  }
  stack.pop_back();
}

auto depth_first_keep_last(const entt::meta_type &type) -> TypeList {
  TypeList stack;
  TypeList visited;
  depth_first(type, stack, visited);

  TypeList out;
  for (auto it = visited.rbegin(); it != visited.rend(); ++it) {
    if (!contains(out, *it)) {
      out.push_back(*it);
    }
  }
  std::reverse(out.begin(), out.end());
  return out;
}

}  // namespace

auto type_lineage(const entt::meta_type &type) -> std::vector<entt::meta_type> {
  if (!type) {
    return {};
  }
  TypeList stack;
  if (auto linearized = c3_linearize(type, stack)) {
    return std::move(*linearized);
  }
  return depth_first_keep_last(type);
}

auto handler_lineage(const HandlerKey &key) -> std::vector<HandlerKey> {
  std::vector<HandlerKey> out;
  if (const auto *named = std::get_if<NamedType>(&key)) {
    auto ancestors = type_lineage(named->type);
    out.reserve(ancestors.size() * 2);
    for (const auto &ancestor : ancestors) {
      out.emplace_back(NamedType{named->name, ancestor});
      out.emplace_back(ancestor);
    }
    return out;
  }
  auto ancestors = type_lineage(std::get<entt::meta_type>(key));
  out.reserve(ancestors.size());
  for (const auto &ancestor : ancestors) {
    out.emplace_back(ancestor);
  }
  return out;
}

}  // namespace ax::dispatch
