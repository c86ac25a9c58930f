/// @file op.hpp
/// @brief Operations: the unit of mutation inside a change.

#pragma once

#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace amstore {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    put,          ///< Set a scalar at a map key or over a list element.
    del,          ///< Delete a map key or a list/text element.
    insert,       ///< Insert a new element into a list or text.
    make_object,  ///< Create a container at a map key or over a list element.
    increment,    ///< Add to a counter.
};

constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::put:         return "put";
        case OpType::del:         return "del";
        case OpType::insert:      return "insert";
        case OpType::make_object: return "make_object";
        case OpType::increment:   return "increment";
    }
    return "unknown";
}

/// A single operation.
///
/// Map operations address their target by key. Sequence operations
/// address elements by identity: an insert names the element it goes
/// after (nullopt = head), while put/del/increment on a sequence name
/// the target element's insert id in pred. The index held in key is
/// the position at the time the op was made and is informational.
struct Op {
    OpId id;
    ObjId obj;
    Prop key;
    OpType action;
    Value value;
    std::vector<OpId> pred;               ///< Ops this one supersedes.
    std::optional<OpId> insert_after{};   ///< For insert: the preceding element.

    auto operator==(const Op&) const -> bool = default;
};

}  // namespace amstore
