#include "dispatch/lineage.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

using ax::dispatch::HandlerKey;
using ax::dispatch::NamedType;
using ax::dispatch::type_key;
using ax::dispatch::type_lineage;
using namespace ax::testing;

TEST(Lineage, UnrelatedTypeIsItsOwnLineage) {
  auto lineage = type_lineage(type_key<double>());
  ASSERT_EQ(lineage.size(), 1u);
  ASSERT_EQ(lineage[0], type_key<double>());
}

TEST(Lineage, InvalidTypeHasNoLineage) {
  ASSERT_TRUE(type_lineage(entt::meta_type{}).empty());
}

TEST(Lineage, SingleInheritanceIsMostDerivedFirst) {
  register_test_types();
  auto lineage = type_lineage(type_key<BoolLike>());
  std::vector<entt::meta_type> expected{type_key<BoolLike>(), type_key<IntLike>()};
  ASSERT_EQ(lineage, expected);
}

TEST(Lineage, DiamondUsesC3) {
  register_test_types();
  auto lineage = type_lineage(type_key<Bottom>());
  std::vector<entt::meta_type> expected{type_key<Bottom>(), type_key<Left>(), type_key<Right>(),
                                        type_key<Top>()};
  ASSERT_EQ(lineage, expected);
}

TEST(Lineage, InconsistentOrderFallsBackDeterministically) {
  register_test_types();
  auto lineage = type_lineage(type_key<Zed>());
  std::vector<entt::meta_type> expected{type_key<Zed>(), type_key<Ex>(), type_key<Why>(),
                                        type_key<Bee>(), type_key<Ay>()};
  ASSERT_EQ(lineage, expected);
  ASSERT_EQ(type_lineage(type_key<Zed>()), lineage);
}

TEST(Lineage, NamedKeysInterleaveNamedAndBare) {
  register_test_types();
  auto lineage = ax::dispatch::handler_lineage(NamedType{"role", type_key<BoolLike>()});
  std::vector<HandlerKey> expected{
      NamedType{"role", type_key<BoolLike>()},
      type_key<BoolLike>(),
      NamedType{"role", type_key<IntLike>()},
      type_key<IntLike>(),
  };
  ASSERT_EQ(lineage, expected);
}
