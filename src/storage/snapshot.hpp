#pragma once

// Whole-document snapshot, written as one document chunk:
//   actor table   count, then sorted 16-byte ids
//   local actor   index into the table
//   next_counter
//   heads         count, then sorted hashes
//   changes       count, then length-prefixed change records in the order
//                 they were applied
//   pending       count, then length-prefixed buffered change records
//   clock         count, then (actor index, seq) pairs
//
// Internal header, not installed.

#include <amstore/types.hpp>

#include "chunk.hpp"
#include "deserializer.hpp"
#include "serializer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace amstore::storage {

struct Snapshot {
    ActorId actor;
    std::uint64_t next_counter = 1;
    std::vector<ChangeHash> heads;
    std::vector<std::vector<std::byte>> changes;
    std::vector<std::vector<std::byte>> pending;
    std::map<ActorId, std::uint64_t> clock;
};

inline auto encode_snapshot(const Snapshot& snap) -> std::vector<std::byte> {
    auto actor_list = std::vector<ActorId>{snap.actor};
    for (const auto& [actor, seq] : snap.clock) actor_list.push_back(actor);
    std::ranges::sort(actor_list);
    auto dup = std::ranges::unique(actor_list);
    actor_list.erase(dup.begin(), dup.end());
    const auto actors = ActorTable{std::move(actor_list)};

    auto s = Serializer{};
    s.write_uleb128(actors.actors().size());
    for (const auto& a : actors.actors()) s.write_actor_id(a);
    s.write_uleb128(actors.index_of(snap.actor));
    s.write_uleb128(snap.next_counter);

    s.write_uleb128(snap.heads.size());
    for (const auto& h : snap.heads) s.write_change_hash(h);

    s.write_uleb128(snap.changes.size());
    for (const auto& c : snap.changes) s.write_blob(c);

    s.write_uleb128(snap.pending.size());
    for (const auto& c : snap.pending) s.write_blob(c);

    s.write_uleb128(snap.clock.size());
    for (const auto& [actor, seq] : snap.clock) {
        s.write_uleb128(actors.index_of(actor));
        s.write_uleb128(seq);
    }

    auto out = std::vector<std::byte>{};
    write_chunk(ChunkType::document, s.data(), out);
    return out;
}

inline auto decode_snapshot(std::span<const std::byte> data) -> std::optional<Snapshot> {
    auto chunk = parse_chunk(data);
    if (!chunk || chunk->type != ChunkType::document || chunk->total_size != data.size()) {
        return std::nullopt;
    }

    auto d = Deserializer{chunk->body};
    auto snap = Snapshot{};

    auto num_actors = d.read_count(ActorId::size);
    if (!num_actors || *num_actors == 0) return std::nullopt;
    auto actors = std::vector<ActorId>{};
    for (std::size_t i = 0; i < *num_actors; ++i) {
        auto a = d.read_actor_id();
        if (!a) return std::nullopt;
        actors.push_back(*a);
    }

    auto local = d.read_uleb128();
    auto next_counter = d.read_uleb128();
    if (!local || *local >= actors.size() || !next_counter || *next_counter == 0) {
        return std::nullopt;
    }
    snap.actor = actors[static_cast<std::size_t>(*local)];
    snap.next_counter = *next_counter;

    auto num_heads = d.read_count(ChangeHash::size);
    if (!num_heads) return std::nullopt;
    for (std::size_t i = 0; i < *num_heads; ++i) {
        auto h = d.read_change_hash();
        if (!h) return std::nullopt;
        snap.heads.push_back(*h);
    }

    for (auto* records : {&snap.changes, &snap.pending}) {
        auto count = d.read_count();
        if (!count) return std::nullopt;
        for (std::size_t i = 0; i < *count; ++i) {
            auto blob = d.read_blob();
            if (!blob) return std::nullopt;
            records->emplace_back(blob->begin(), blob->end());
        }
    }

    auto num_clock = d.read_count(2);
    if (!num_clock) return std::nullopt;
    for (std::size_t i = 0; i < *num_clock; ++i) {
        auto idx = d.read_uleb128();
        auto seq = d.read_uleb128();
        if (!idx || *idx >= actors.size() || !seq) return std::nullopt;
        snap.clock[actors[static_cast<std::size_t>(*idx)]] = *seq;
    }

    if (!d.at_end()) return std::nullopt;
    return snap;
}

}  // namespace amstore::storage
