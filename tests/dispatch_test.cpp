#include "dispatch/type_dispatcher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

using ax::ErrorCode;
using ax::dispatch::DispatchKey;
using ax::dispatch::HandlerKey;
using ax::dispatch::NamedType;
using ax::dispatch::type_key;
using namespace ax::testing;

class DispatchTest : public ::testing::Test {
 protected:
  void SetUp() override { register_test_types(); }

  LabelDispatcher dispatcher;
};

TEST_F(DispatchTest, DirectRegistrationResolves) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("int")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<IntLike>()), "int");
  ASSERT_EQ(dispatcher.cached_size(), 0u);
}

TEST_F(DispatchTest, RegisterOverwritesSilently) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("first")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("second")));
  ASSERT_EQ(dispatcher.size(), 1u);
  ASSERT_EQ(resolve_label(dispatcher, type_key<IntLike>()), "second");
}

TEST_F(DispatchTest, DirectMatchBeatsInheritedMatch) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("A")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<BoolLike>(), label("B")));

  ASSERT_EQ(resolve_label(dispatcher, type_key<BoolLike>()), "B");
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");
}

TEST_F(DispatchTest, InheritedResultIsCached) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("A")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");
  ASSERT_EQ(dispatcher.cached_size(), 1u);
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");
  ASSERT_EQ(dispatcher.cached_size(), 1u);
}

TEST_F(DispatchTest, UnrelatedUnregisterKeepsInheritedResult) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("A")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<Top>(), label("top")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");

  dispatcher.unregister_handler(type_key<Top>());
  ASSERT_EQ(dispatcher.cached_size(), 0u);
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");
}

TEST_F(DispatchTest, UnregisteringBaseInvalidatesDescendants) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("A")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "A");
  ASSERT_EQ(resolve_label(dispatcher, type_key<BoolLike>()), "A");

  dispatcher.unregister_handler(type_key<IntLike>());
  ASSERT_EQ(resolve_label(dispatcher, type_key<OtherInt>()), "DispatchNotFound");
  ASSERT_EQ(resolve_label(dispatcher, type_key<BoolLike>()), "DispatchNotFound");
}

TEST_F(DispatchTest, RegisteringCloserAncestorReplacesCachedResult) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<Top>(), label("top")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<Bottom>()), "top");

  ASSERT_TRUE(dispatcher.register_handler(type_key<Left>(), label("left")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<Bottom>()), "left");
}

TEST_F(DispatchTest, UnregisterAbsentKeyIsNoop) {
  dispatcher.unregister_handler(type_key<IntLike>());
  dispatcher.unregister_handler(ax::dispatch::LazyKey{"nowhere.Thing"});
  dispatcher.unregister_handler(NamedType{"x", type_key<int>()});
  ASSERT_EQ(dispatcher.size(), 0u);
  ASSERT_FALSE(dispatcher.has_lazy_handlers());
}

TEST_F(DispatchTest, NotFoundCarriesKey) {
  auto handler = dispatcher.get_handler(type_key<OtherInt>());
  ASSERT_FALSE(handler);
  ASSERT_EQ(handler.error().code, ErrorCode::DispatchNotFound);
  ASSERT_NE(handler.error().message.find("OtherInt"), std::string::npos);
  ASSERT_EQ(dispatcher.cached_size(), 0u);
}

TEST_F(DispatchTest, TupleRegistrationExpandsToEachKey) {
  ASSERT_TRUE(dispatcher.register_handler({type_key<Left>(), type_key<Right>()}, label("side")));
  ASSERT_EQ(dispatcher.size(), 2u);
  ASSERT_EQ(resolve_label(dispatcher, type_key<Left>()), "side");
  ASSERT_EQ(resolve_label(dispatcher, type_key<Right>()), "side");

  dispatcher.unregister_handler({type_key<Left>(), type_key<Right>()});
  ASSERT_EQ(dispatcher.size(), 0u);
}

TEST_F(DispatchTest, InvalidTypeIsRejected) {
  auto registered = dispatcher.register_handler(entt::meta_type{}, label("nothing"));
  ASSERT_FALSE(registered);
  ASSERT_EQ(registered.error().code, ErrorCode::InvalidArgument);
  ASSERT_EQ(dispatcher.size(), 0u);

  auto handler = dispatcher.get_handler(entt::meta_type{});
  ASSERT_FALSE(handler);
  ASSERT_EQ(handler.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DispatchTest, NamedTypeFallsBackToBareType) {
  ASSERT_TRUE(dispatcher.register_handler(NamedType{"x", type_key<int>()}, label("X")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<int>(), label("Y")));

  ASSERT_EQ(resolve_label(dispatcher, NamedType{"x", type_key<int>()}), "X");
  ASSERT_EQ(resolve_label(dispatcher, type_key<int>()), "Y");
  ASSERT_EQ(resolve_label(dispatcher, NamedType{"y", type_key<int>()}), "Y");
}

TEST_F(DispatchTest, NamedLookupTriesNamedThenBarePerLevel) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("bare-int")));
  ASSERT_TRUE(dispatcher.register_handler(NamedType{"role", type_key<IntLike>()}, label("role-int")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<BoolLike>(), label("bare-bool")));

  // the bare BoolLike entry sits one level above the named IntLike entry
  ASSERT_EQ(resolve_label(dispatcher, NamedType{"role", type_key<BoolLike>()}), "bare-bool");
  ASSERT_EQ(resolve_label(dispatcher, NamedType{"role", type_key<OtherInt>()}), "role-int");
  ASSERT_EQ(resolve_label(dispatcher, NamedType{"other", type_key<OtherInt>()}), "bare-int");
}

TEST_F(DispatchTest, DiamondFollowsC3Order) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<Top>(), label("top")));
  ASSERT_TRUE(dispatcher.register_handler(type_key<Right>(), label("right")));
  ASSERT_EQ(resolve_label(dispatcher, type_key<Bottom>()), "right");
}

TEST_F(DispatchTest, CallDispatchesOnValueType) {
  ax::dispatch::TypeDispatcher<int(int)> scaler;
  ASSERT_TRUE(scaler.register_handler(type_key<IntLike>(), [](const entt::meta_any &, int factor) {
    return 10 * factor;
  }));
  ASSERT_TRUE(scaler.register_handler(type_key<BoolLike>(), [](const entt::meta_any &value, int factor) {
    return value.try_cast<const BoolLike>() ? factor : -1;
  }));

  auto as_bool = scaler(entt::meta_any{BoolLike{}}, 3);
  ASSERT_TRUE(as_bool);
  ASSERT_EQ(*as_bool, 3);

  auto as_other = scaler(entt::meta_any{OtherInt{}}, 3);
  ASSERT_TRUE(as_other);
  ASSERT_EQ(*as_other, 30);

  auto missing = scaler(entt::meta_any{Top{}}, 3);
  ASSERT_FALSE(missing);
  ASSERT_EQ(missing.error().code, ErrorCode::DispatchNotFound);

  auto empty = scaler(entt::meta_any{}, 3);
  ASSERT_FALSE(empty);
  ASSERT_EQ(empty.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DispatchTest, VoidHandlersReceiveArguments) {
  ax::dispatch::TypeDispatcher<void(std::string &)> writer;
  ASSERT_TRUE(writer.register_handler(type_key<Top>(), [](const entt::meta_any &, std::string &out) {
    out += "top;";
  }));

  std::string out;
  ASSERT_TRUE(writer(entt::meta_any{Left{}}, out));
  ASSERT_TRUE(writer(entt::meta_any{Bottom{}}, out));
  ASSERT_EQ(out, "top;top;");
}

TEST_F(DispatchTest, CopiesAreIndependent) {
  ASSERT_TRUE(dispatcher.register_handler(type_key<IntLike>(), label("A")));
  auto before = ax::dispatch::live_dispatcher_count();

  LabelDispatcher copy(dispatcher);
  ASSERT_EQ(ax::dispatch::live_dispatcher_count(), before + 1);
  ASSERT_TRUE(copy.register_handler(type_key<IntLike>(), label("copy")));

  ASSERT_EQ(resolve_label(dispatcher, type_key<IntLike>()), "A");
  ASSERT_EQ(resolve_label(copy, type_key<IntLike>()), "copy");
}
