/// @file path.hpp
/// @brief Paths: typed segment sequences parsed from path strings.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace amstore {

/// A segment that selects a map entry by key.
struct MapKey {
    std::string name;

    auto operator==(const MapKey&) const -> bool = default;
};

/// A segment that selects a list element by position.
struct ArrayIndex {
    std::size_t index{0};

    auto operator==(const ArrayIndex&) const -> bool = default;
};

using Segment = std::variant<MapKey, ArrayIndex>;

/// Render one segment the way it is written in a path string.
auto to_string(const Segment& segment) -> std::string;

/// An ordered sequence of segments, resolved before any navigation.
///
/// Grammar accepted by parse():
/// @code
///   path     := [ "$." ] segment ( "." segment )*
///   segment  := key ( "[" digits "]" )*
///   key      := one or more characters other than '.', '[' and ']'
/// @endcode
///
/// @code
/// auto p = Path::parse("$.users[0].profile.name");
/// // [MapKey{"users"}, ArrayIndex{0}, MapKey{"profile"}, MapKey{"name"}]
/// @endcode
class Path {
public:
    /// The empty path, which designates the root map.
    Path() = default;

    explicit Path(std::vector<Segment> segments) : segments_{std::move(segments)} {}

    /// Parse a path string.
    /// @throws Exception with ErrorKind::parse_error on malformed input,
    ///         including the empty string.
    static auto parse(std::string_view raw) -> Path;

    auto segments() const -> const std::vector<Segment>& { return segments_; }
    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }

    /// Every segment but the last. Requires a non-empty path.
    auto parent() const -> Path;

    /// The last segment. Requires a non-empty path.
    auto terminal() const -> const Segment& { return segments_.back(); }

    /// Canonical rendering, without the root marker ("" for the root).
    auto to_string() const -> std::string;

    auto operator==(const Path&) const -> bool = default;

private:
    std::vector<Segment> segments_;
};

}  // namespace amstore
