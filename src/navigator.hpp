#pragma once

// Internal header, not installed. Resolves Paths against a DocState.

#include <amstore/path.hpp>
#include <amstore/transaction.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include "doc_state.hpp"

#include <string>
#include <vector>

namespace amstore::detail {

enum class NavMode : std::uint8_t {
    read_only,
    create_intermediate,
};

// The node a path designates, together with the container holding it.
struct NodeRef {
    ObjId parent;
    Segment segment;
    Slot slot;
};

// Where a write through a path lands. `container` is the deepest
// container that already exists; `missing` are the map keys still to
// be created beneath it, outermost first. A plan is computed without
// touching the document, so a failing write leaves it unchanged.
struct WritePlan {
    ObjId container;
    std::vector<std::string> missing;
    Segment terminal;
};

class Navigator {
public:
    explicit Navigator(const DocState& state) : state_{state} {}

    // Follow the whole path. Throws not_found or type_mismatch; an empty
    // path designates the root and resolves to the root map.
    auto resolve_object(const Path& path) const -> ObjId;

    // Follow the whole path to a node that must exist.
    auto find(const Path& path) const -> NodeRef;

    // Walk the path's parent in create-intermediate mode and check that
    // the terminal segment can be written there.
    auto plan_write(const Path& path) const -> WritePlan;

    // Create the containers a plan still needs. Returns the container
    // the terminal segment is written into.
    static auto realize(Transaction& tx, const WritePlan& plan) -> ObjId;

private:
    struct Cursor {
        ObjId container;
        std::vector<std::string> missing;
    };

    // Step from the container at `cursor` through segments[0, end).
    auto walk(const Path& path, std::size_t end, NavMode mode) const -> Cursor;

    auto step(const ObjId& container, const Path& path, std::size_t i, NavMode mode) const
        -> std::optional<Slot>;

    const DocState& state_;
};

}  // namespace amstore::detail
