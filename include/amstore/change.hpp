/// @file change.hpp
/// @brief Change: an atomic group of operations from one replica.

#pragma once

#include <amstore/op.hpp>
#include <amstore/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace amstore {

/// The unit of replication.
///
/// One local mutating call produces exactly one Change. Its operations
/// carry consecutive counters starting at start_op, all authored by
/// actor. deps are the document heads at the time the change was made,
/// which places the change in the causal DAG.
struct Change {
    ActorId actor;
    std::uint64_t seq{0};                ///< Per-actor sequence number, 1-based.
    std::uint64_t start_op{0};
    std::int64_t timestamp{0};           ///< Milliseconds since the Unix epoch.
    std::optional<std::string> message;
    std::vector<ChangeHash> deps;
    std::vector<Op> operations;

    auto operator==(const Change&) const -> bool = default;
};

}  // namespace amstore
