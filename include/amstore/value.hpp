/// @file value.hpp
/// @brief Value types: ScalarValue, Value, ObjType, NodeType.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace amstore {

/// JSON-style null.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A CRDT counter. Concurrent increments from different replicas are
/// summed instead of resolved by last-writer-wins.
struct Counter {
    std::int64_t value{0};

    auto operator<=>(const Counter&) const = default;
    auto operator==(const Counter&) const -> bool = default;
};

/// Milliseconds since the Unix epoch.
struct Timestamp {
    std::int64_t millis_since_epoch{0};

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// The three kinds of container object.
enum class ObjType : std::uint8_t {
    map,   ///< String-keyed mapping; key order is irrelevant.
    list,  ///< Ordered, index-addressable sequence (RGA).
    text,  ///< Sequence of Unicode code points (RGA).
};

constexpr auto to_string_view(ObjType type) noexcept -> std::string_view {
    switch (type) {
        case ObjType::map:  return "map";
        case ObjType::list: return "list";
        case ObjType::text: return "text";
    }
    return "unknown";
}

/// A primitive value stored in the tree.
///
/// Strings only appear as the single code points held by a text
/// object, or as plain string leaves written by other producers.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    Counter,
    Timestamp,
    std::string
>;

/// A value in the tree: a nested container type or a scalar.
using Value = std::variant<ObjType, ScalarValue>;

constexpr auto is_scalar(const Value& v) -> bool {
    return std::holds_alternative<ScalarValue>(v);
}

constexpr auto is_object(const Value& v) -> bool {
    return std::holds_alternative<ObjType>(v);
}

/// The variant of a node as seen by the typed accessors.
enum class NodeType : std::uint8_t {
    map,
    list,
    text,
    integer,
    floating,
    boolean,
    counter,
    timestamp,
    null,
};

constexpr auto to_string_view(NodeType type) noexcept -> std::string_view {
    switch (type) {
        case NodeType::map:       return "map";
        case NodeType::list:      return "list";
        case NodeType::text:      return "text";
        case NodeType::integer:   return "int";
        case NodeType::floating:  return "double";
        case NodeType::boolean:   return "bool";
        case NodeType::counter:   return "counter";
        case NodeType::timestamp: return "timestamp";
        case NodeType::null:      return "null";
    }
    return "unknown";
}

// -- Variant visitor helper ---------------------------------------------------

/// Builds an ad-hoc visitor from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Classify a stored value. A plain string scalar reads as text.
constexpr auto node_type_of(const Value& v) -> NodeType {
    return std::visit(overload{
        [](ObjType t) -> NodeType {
            switch (t) {
                case ObjType::map:  return NodeType::map;
                case ObjType::list: return NodeType::list;
                case ObjType::text: return NodeType::text;
            }
            return NodeType::null;
        },
        [](const ScalarValue& sv) -> NodeType {
            return std::visit(overload{
                [](Null) { return NodeType::null; },
                [](bool) { return NodeType::boolean; },
                [](std::int64_t) { return NodeType::integer; },
                [](double) { return NodeType::floating; },
                [](const Counter&) { return NodeType::counter; },
                [](const Timestamp&) { return NodeType::timestamp; },
                [](const std::string&) { return NodeType::text; },
            }, sv);
        },
    }, v);
}

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* sv = std::get_if<ScalarValue>(&v)) {
        if (const auto* t = std::get_if<T>(sv)) {
            return *t;
        }
    }
    return std::nullopt;
}

template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace amstore
