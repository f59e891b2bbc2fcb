#include <benchmark/benchmark.h>

#include <stdexcept>
#include <string>

#include <entt/meta/factory.hpp>
#include <entt/meta/meta.hpp>

#include "dispatch/type_dispatcher.hpp"
#include "identity/id_generator.hpp"

namespace {

struct Root {};
struct Mid : Root {};
struct Leaf : Mid {};

using Dispatcher = ax::dispatch::TypeDispatcher<int()>;

auto make_dispatcher() -> Dispatcher {
  entt::meta<Mid>().base<Root>();
  entt::meta<Leaf>().base<Mid>();
  Dispatcher dispatcher;
  auto registered = dispatcher.register_handler(ax::dispatch::type_key<Root>(),
                                                [](const entt::meta_any &) { return 1; });
  if (!registered) {
    throw std::runtime_error(registered.error().message);
  }
  return dispatcher;
}

void BM_DirectLookup(benchmark::State &state) {
  auto dispatcher = make_dispatcher();
  const ax::dispatch::HandlerKey key = ax::dispatch::type_key<Root>();
  for (auto _ : state) {
    auto handler = dispatcher.get_handler(key);
    benchmark::DoNotOptimize(handler);
  }
}
BENCHMARK(BM_DirectLookup);

void BM_InheritedLookupCached(benchmark::State &state) {
  auto dispatcher = make_dispatcher();
  const ax::dispatch::HandlerKey key = ax::dispatch::type_key<Leaf>();
  if (!dispatcher.get_handler(key)) {
    state.SkipWithError("leaf did not resolve");
    return;
  }
  for (auto _ : state) {
    auto handler = dispatcher.get_handler(key);
    benchmark::DoNotOptimize(handler);
  }
}
BENCHMARK(BM_InheritedLookupCached);

void BM_InheritedLookupCold(benchmark::State &state) {
  auto dispatcher = make_dispatcher();
  const ax::dispatch::HandlerKey key = ax::dispatch::type_key<Leaf>();
  for (auto _ : state) {
    dispatcher.unregister_handler(ax::dispatch::type_key<double>());
    auto handler = dispatcher.get_handler(key);
    benchmark::DoNotOptimize(handler);
  }
}
BENCHMARK(BM_InheritedLookupCold);

void BM_NewRandomId(benchmark::State &state) {
  const auto length = static_cast<std::size_t>(state.range(0));
  for (auto _ : state) {
    auto id = ax::identity::new_random_id(length);
    benchmark::DoNotOptimize(id);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_NewRandomId)->Arg(8)->Arg(32)->Arg(33)->Arg(256);

}  // namespace

BENCHMARK_MAIN();
