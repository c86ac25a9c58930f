#include "navigator.hpp"

#include <amstore/error.hpp>

namespace amstore::detail {

namespace {

auto prefix(const Path& path, std::size_t n) -> std::string {
    if (n == 0) return "$";
    auto segments = std::vector<Segment>{path.segments().begin(),
                                         path.segments().begin() + static_cast<std::ptrdiff_t>(n)};
    return Path{std::move(segments)}.to_string();
}

auto type_name(ObjType type) -> std::string {
    return std::string{to_string_view(type)};
}

auto new_list_range_error(const Path& path, std::size_t i) -> Exception {
    const auto& idx = std::get<ArrayIndex>(path.segments()[i]);
    return Exception{ErrorKind::range_error,
        "index " + std::to_string(idx.index) + " out of range for new list at '" +
        prefix(path, i) + "'"};
}

}  // anonymous namespace

auto Navigator::step(const ObjId& container, const Path& path, std::size_t i, NavMode mode) const
    -> std::optional<Slot> {
    const auto type = state_.object_type(container);
    if (!type) throw Exception{ErrorKind::not_found, "no object at '" + prefix(path, i) + "'"};

    const auto& segment = path.segments()[i];
    if (const auto* key = std::get_if<MapKey>(&segment)) {
        if (*type != ObjType::map) {
            throw Exception{ErrorKind::type_mismatch,
                "expected a map at '" + prefix(path, i) + "' but found a " + type_name(*type)};
        }
        auto slot = state_.map_get(container, key->name);
        if (!slot && mode == NavMode::read_only) {
            throw Exception{ErrorKind::not_found, "no value at '" + prefix(path, i + 1) + "'"};
        }
        return slot;
    }

    const auto index = std::get<ArrayIndex>(segment).index;
    if (*type != ObjType::list) {
        throw Exception{ErrorKind::type_mismatch,
            "expected a list at '" + prefix(path, i) + "' but found a " + type_name(*type)};
    }
    auto slot = state_.list_get(container, index);
    if (!slot) {
        if (mode == NavMode::read_only) {
            throw Exception{ErrorKind::not_found, "no element at '" + prefix(path, i + 1) + "'"};
        }
        throw Exception{ErrorKind::range_error,
            "index " + std::to_string(index) + " out of range for length " +
            std::to_string(state_.list_length(container)) + " at '" + prefix(path, i) + "'"};
    }
    return slot;
}

auto Navigator::walk(const Path& path, std::size_t end, NavMode mode) const -> Cursor {
    auto cursor = Cursor{.container = root, .missing = {}};

    for (std::size_t i = 0; i < end; ++i) {
        const auto& segment = path.segments()[i];

        // Beneath a container that does not exist yet, only map keys can
        // be created; an index into a fresh list is always out of range.
        if (!cursor.missing.empty()) {
            if (const auto* key = std::get_if<MapKey>(&segment)) {
                cursor.missing.push_back(key->name);
                continue;
            }
            throw new_list_range_error(path, i);
        }

        auto slot = step(cursor.container, path, i, mode);
        if (!slot) {
            cursor.missing.push_back(std::get<MapKey>(segment).name);
            continue;
        }

        auto child = slot->child();
        if (!child) {
            throw Exception{ErrorKind::type_mismatch,
                "'" + prefix(path, i + 1) + "' is a " +
                std::string{to_string_view(node_type_of(slot->value))} + ", not a container"};
        }
        cursor.container = *child;
    }
    return cursor;
}

auto Navigator::resolve_object(const Path& path) const -> ObjId {
    return walk(path, path.size(), NavMode::read_only).container;
}

auto Navigator::find(const Path& path) const -> NodeRef {
    if (path.empty()) {
        throw Exception{ErrorKind::type_mismatch, "the root is a map"};
    }
    const auto last = path.size() - 1;
    auto cursor = walk(path, last, NavMode::read_only);
    auto slot = step(cursor.container, path, last, NavMode::read_only);
    return NodeRef{.parent = cursor.container, .segment = path.terminal(), .slot = std::move(*slot)};
}

auto Navigator::plan_write(const Path& path) const -> WritePlan {
    if (path.empty()) {
        throw Exception{ErrorKind::type_mismatch, "cannot overwrite the root map"};
    }
    const auto last = path.size() - 1;
    auto cursor = walk(path, last, NavMode::create_intermediate);
    const auto& terminal = path.terminal();

    if (!cursor.missing.empty()) {
        if (std::holds_alternative<ArrayIndex>(terminal)) throw new_list_range_error(path, last);
    } else {
        const auto type = *state_.object_type(cursor.container);
        if (std::holds_alternative<MapKey>(terminal)) {
            if (type != ObjType::map) {
                throw Exception{ErrorKind::type_mismatch,
                    "expected a map at '" + prefix(path, last) + "' but found a " + type_name(type)};
            }
        } else {
            // Overwriting a list element requires the element to exist.
            step(cursor.container, path, last, NavMode::create_intermediate);
        }
    }

    return WritePlan{
        .container = cursor.container,
        .missing = std::move(cursor.missing),
        .terminal = terminal,
    };
}

auto Navigator::realize(Transaction& tx, const WritePlan& plan) -> ObjId {
    auto obj = plan.container;
    for (const auto& key : plan.missing) {
        obj = tx.put_object(obj, key, ObjType::map);
    }
    return obj;
}

}  // namespace amstore::detail
