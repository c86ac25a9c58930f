/// @file types.hpp
/// @brief Identity types: ActorId, ChangeHash, OpId, ObjId, Prop.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace amstore {

namespace detail {

// Lower-case hex rendering shared by the fixed-size identifiers.
template <std::size_t N>
auto to_hex(const std::array<std::byte, N>& bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto out = std::string{};
    out.reserve(N * 2);
    for (auto b : bytes) {
        auto v = static_cast<std::uint8_t>(b);
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out;
}

}  // namespace detail

/// A 16-byte identifier for one replica of a document.
///
/// Every locally originated operation is tagged with the replica's
/// ActorId. Actor ordering breaks ties between concurrent operations
/// that carry the same counter.
struct ActorId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ActorId() = default;

    explicit constexpr ActorId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ActorId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    /// A fresh identifier drawn from std::random_device.
    static auto random() -> ActorId;

    auto operator<=>(const ActorId&) const = default;
    auto operator==(const ActorId&) const -> bool = default;

    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    auto to_hex() const -> std::string { return detail::to_hex(bytes); }
};

/// SHA-256 of an encoded change; the identity of a change record.
///
/// Change records reference their causal predecessors by hash, so the
/// history forms a DAG addressed by these values.
struct ChangeHash {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw hash bytes.

    constexpr ChangeHash() = default;

    explicit constexpr ChangeHash(std::array<std::byte, size> b) : bytes{b} {}

    auto operator<=>(const ChangeHash&) const = default;
    auto operator==(const ChangeHash&) const -> bool = default;

    auto to_hex() const -> std::string { return detail::to_hex(bytes); }
};

/// Identifies a single operation: (counter, actor).
///
/// The counter is a Lamport clock: a replica always issues a counter
/// greater than every counter it has seen. Ties are broken by actor.
struct OpId {
    std::uint64_t counter{0};
    ActorId actor{};

    constexpr OpId() = default;
    constexpr OpId(std::uint64_t c, ActorId a) : counter{c}, actor{a} {}

    auto operator<=>(const OpId&) const = default;
    auto operator==(const OpId&) const -> bool = default;
};

/// Sentinel for the document root.
struct Root {
    auto operator<=>(const Root&) const = default;
    auto operator==(const Root&) const -> bool = default;
};

/// Identifies a container in the document tree: the root sentinel or
/// the OpId of the operation that created the container.
struct ObjId {
    std::variant<Root, OpId> inner;

    constexpr ObjId() : inner{Root{}} {}
    explicit constexpr ObjId(OpId id) : inner{id} {}

    auto is_root() const -> bool {
        return std::holds_alternative<Root>(inner);
    }

    auto operator<=>(const ObjId&) const = default;
    auto operator==(const ObjId&) const -> bool = default;
};

/// The root container -- always a map, always exists.
inline constexpr auto root = ObjId{};

/// A key into a map (string) or an index into a list/text (size_t).
using Prop = std::variant<std::string, std::size_t>;

}  // namespace amstore

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<amstore::ActorId> {
    auto operator()(const amstore::ActorId& id) const noexcept -> std::size_t {
        // FNV-1a
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<amstore::ChangeHash> {
    auto operator()(const amstore::ChangeHash& ch) const noexcept -> std::size_t {
        // SHA-256 output is already uniform; fold the leading bytes.
        auto result = std::size_t{0};
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | static_cast<std::size_t>(ch.bytes[i]);
        }
        return result;
    }
};

template <>
struct std::hash<amstore::OpId> {
    auto operator()(const amstore::OpId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.counter);
        auto h2 = std::hash<amstore::ActorId>{}(id.actor);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
