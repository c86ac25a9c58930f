#include <amstore/op.hpp>
#include <amstore/value.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace amstore;

TEST(ObjType, names) {
    EXPECT_EQ(to_string_view(ObjType::map), "map");
    EXPECT_EQ(to_string_view(ObjType::list), "list");
    EXPECT_EQ(to_string_view(ObjType::text), "text");
}

TEST(NodeType, names_used_in_messages) {
    EXPECT_EQ(to_string_view(NodeType::integer), "int");
    EXPECT_EQ(to_string_view(NodeType::floating), "double");
    EXPECT_EQ(to_string_view(NodeType::boolean), "bool");
    EXPECT_EQ(to_string_view(NodeType::counter), "counter");
    EXPECT_EQ(to_string_view(NodeType::timestamp), "timestamp");
    EXPECT_EQ(to_string_view(NodeType::null), "null");
}

TEST(OpType, names) {
    EXPECT_EQ(to_string_view(OpType::put), "put");
    EXPECT_EQ(to_string_view(OpType::del), "del");
    EXPECT_EQ(to_string_view(OpType::insert), "insert");
    EXPECT_EQ(to_string_view(OpType::make_object), "make_object");
    EXPECT_EQ(to_string_view(OpType::increment), "increment");
}

// -- node_type_of -------------------------------------------------------------

TEST(NodeTypeOf, containers) {
    EXPECT_EQ(node_type_of(Value{ObjType::map}), NodeType::map);
    EXPECT_EQ(node_type_of(Value{ObjType::list}), NodeType::list);
    EXPECT_EQ(node_type_of(Value{ObjType::text}), NodeType::text);
}

TEST(NodeTypeOf, scalars) {
    EXPECT_EQ(node_type_of(Value{ScalarValue{Null{}}}), NodeType::null);
    EXPECT_EQ(node_type_of(Value{ScalarValue{true}}), NodeType::boolean);
    EXPECT_EQ(node_type_of(Value{ScalarValue{std::int64_t{7}}}), NodeType::integer);
    EXPECT_EQ(node_type_of(Value{ScalarValue{2.5}}), NodeType::floating);
    EXPECT_EQ(node_type_of(Value{ScalarValue{Counter{1}}}), NodeType::counter);
    EXPECT_EQ(node_type_of(Value{ScalarValue{Timestamp{1}}}), NodeType::timestamp);
    EXPECT_EQ(node_type_of(Value{ScalarValue{std::string{"s"}}}), NodeType::text);
}

TEST(NodeTypeOf, counter_and_int_are_distinct) {
    EXPECT_NE(node_type_of(Value{ScalarValue{Counter{5}}}),
              node_type_of(Value{ScalarValue{std::int64_t{5}}}));
}

// -- get_scalar ---------------------------------------------------------------

TEST(GetScalar, matching_alternative) {
    const auto v = Value{ScalarValue{std::int64_t{42}}};
    EXPECT_EQ(get_scalar<std::int64_t>(v), 42);
    EXPECT_EQ(get_scalar<double>(v), std::nullopt);
}

TEST(GetScalar, object_value_yields_nothing) {
    EXPECT_EQ(get_scalar<std::string>(Value{ObjType::text}), std::nullopt);
}

TEST(GetScalar, optional_overload) {
    auto none = std::optional<Value>{};
    EXPECT_EQ(get_scalar<bool>(none), std::nullopt);
    auto some = std::optional<Value>{Value{ScalarValue{Timestamp{99}}}};
    EXPECT_EQ(get_scalar<Timestamp>(some), Timestamp{99});
}

TEST(Value, predicates) {
    EXPECT_TRUE(is_object(Value{ObjType::list}));
    EXPECT_FALSE(is_scalar(Value{ObjType::list}));
    EXPECT_TRUE(is_scalar(Value{ScalarValue{Null{}}}));
}
