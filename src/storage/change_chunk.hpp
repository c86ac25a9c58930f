#pragma once

// Encoding of a single change record.
//
// Change body:
//   actor table  count, then 16-byte ids (author first, the rest sorted)
//   seq, start_op (ULEB128), timestamp (SLEB128)
//   message      flag byte, then string when the flag is 1
//   deps         count, then 32-byte hashes
//   ops          count, then one row per op:
//                obj, key, action, value, pred (count + op ids),
//                insert_after (flag byte, then op id when the flag is 1)
//
// Op ids are not stored: op i has id (start_op + i, author).
// The record is the body in a change chunk, or its raw DEFLATE form in a
// compressed chunk when that is smaller and the body exceeds the
// configured threshold. The change hash is SHA-256 over the change chunk
// type byte followed by the uncompressed body.
//
// Internal header, not installed.

#include <amstore/change.hpp>
#include <amstore/types.hpp>

#include "chunk.hpp"
#include "compression.hpp"
#include "deserializer.hpp"
#include "serializer.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>

namespace amstore::storage {

struct EncodedChange {
    std::vector<std::byte> bytes;
    ChangeHash hash;
};

struct DecodedChange {
    Change change;
    ChangeHash hash;
};

inline auto change_actor_table(const Change& change) -> ActorTable {
    auto others = std::vector<ActorId>{};
    auto note = [&](const OpId& id) {
        if (id.actor != change.actor) others.push_back(id.actor);
    };
    for (const auto& op : change.operations) {
        if (!op.obj.is_root()) note(std::get<OpId>(op.obj.inner));
        for (const auto& p : op.pred) note(p);
        if (op.insert_after) note(*op.insert_after);
    }
    std::ranges::sort(others);
    auto dup = std::ranges::unique(others);
    others.erase(dup.begin(), dup.end());

    auto actors = std::vector<ActorId>{change.actor};
    actors.insert(actors.end(), others.begin(), others.end());
    return ActorTable{std::move(actors)};
}

inline auto encode_change_body(const Change& change) -> std::vector<std::byte> {
    const auto actors = change_actor_table(change);
    auto s = Serializer{};

    s.write_uleb128(actors.actors().size());
    for (const auto& a : actors.actors()) s.write_actor_id(a);

    s.write_uleb128(change.seq);
    s.write_uleb128(change.start_op);
    s.write_sleb128(change.timestamp);
    if (change.message) {
        s.write_u8(1);
        s.write_string(*change.message);
    } else {
        s.write_u8(0);
    }

    s.write_uleb128(change.deps.size());
    for (const auto& d : change.deps) s.write_change_hash(d);

    s.write_uleb128(change.operations.size());
    for (const auto& op : change.operations) {
        s.write_obj_id(op.obj, actors);
        s.write_prop(op.key);
        s.write_u8(static_cast<std::uint8_t>(op.action));
        s.write_value(op.value);
        s.write_uleb128(op.pred.size());
        for (const auto& p : op.pred) s.write_op_id(p, actors);
        if (op.insert_after) {
            s.write_u8(1);
            s.write_op_id(*op.insert_after, actors);
        } else {
            s.write_u8(0);
        }
    }
    return s.take();
}

inline auto hash_change_body(std::span<const std::byte> body) -> ChangeHash {
    auto hasher = crypto::Sha256{};
    hasher.update(static_cast<std::byte>(ChunkType::change));
    hasher.update(body);
    return ChangeHash{hasher.finish()};
}

inline auto encode_change(const Change& change, std::size_t compression_threshold)
    -> EncodedChange {
    auto body = encode_change_body(change);
    auto result = EncodedChange{.bytes = {}, .hash = hash_change_body(body)};

    if (body.size() > compression_threshold) {
        if (auto packed = deflate_raw(body); packed && packed->size() < body.size()) {
            write_chunk(ChunkType::compressed, *packed, result.bytes);
            return result;
        }
    }
    write_chunk(ChunkType::change, body, result.bytes);
    return result;
}

inline auto decode_change_body(std::span<const std::byte> body) -> std::optional<Change> {
    auto d = Deserializer{body};

    auto num_actors = d.read_count(ActorId::size);
    if (!num_actors || *num_actors == 0) return std::nullopt;
    auto actors = std::vector<ActorId>{};
    actors.reserve(*num_actors);
    for (std::size_t i = 0; i < *num_actors; ++i) {
        auto a = d.read_actor_id();
        if (!a) return std::nullopt;
        actors.push_back(*a);
    }

    auto change = Change{};
    change.actor = actors.front();

    auto seq = d.read_uleb128();
    auto start_op = d.read_uleb128();
    auto timestamp = d.read_sleb128();
    if (!seq || *seq == 0 || !start_op || *start_op == 0 || !timestamp) return std::nullopt;
    change.seq = *seq;
    change.start_op = *start_op;
    change.timestamp = *timestamp;

    auto has_message = d.read_u8();
    if (!has_message || *has_message > 1) return std::nullopt;
    if (*has_message == 1) {
        auto msg = d.read_string();
        if (!msg) return std::nullopt;
        change.message = std::move(*msg);
    }

    auto num_deps = d.read_count(ChangeHash::size);
    if (!num_deps) return std::nullopt;
    for (std::size_t i = 0; i < *num_deps; ++i) {
        auto h = d.read_change_hash();
        if (!h) return std::nullopt;
        change.deps.push_back(*h);
    }

    // Smallest row: obj, key tag + index, action, value tag, pred count, flag.
    auto num_ops = d.read_count(6);
    if (!num_ops) return std::nullopt;
    if (change.start_op > std::numeric_limits<std::uint64_t>::max() - *num_ops) return std::nullopt;
    change.operations.reserve(*num_ops);

    for (std::size_t i = 0; i < *num_ops; ++i) {
        auto obj = d.read_obj_id(actors);
        auto key = d.read_prop();
        auto action = d.read_u8();
        if (!obj || !key || !action || *action > static_cast<std::uint8_t>(OpType::increment)) {
            return std::nullopt;
        }
        auto value = d.read_value();
        if (!value) return std::nullopt;

        auto num_pred = d.read_count(2);
        if (!num_pred) return std::nullopt;
        auto pred = std::vector<OpId>{};
        pred.reserve(*num_pred);
        for (std::size_t p = 0; p < *num_pred; ++p) {
            auto id = d.read_op_id(actors);
            if (!id) return std::nullopt;
            pred.push_back(*id);
        }

        auto has_after = d.read_u8();
        if (!has_after || *has_after > 1) return std::nullopt;
        auto insert_after = std::optional<OpId>{};
        if (*has_after == 1) {
            insert_after = d.read_op_id(actors);
            if (!insert_after) return std::nullopt;
        }

        change.operations.push_back(Op{
            .id = OpId{change.start_op + i, change.actor},
            .obj = *obj,
            .key = std::move(*key),
            .action = static_cast<OpType>(*action),
            .value = std::move(*value),
            .pred = std::move(pred),
            .insert_after = insert_after,
        });
    }

    if (!d.at_end()) return std::nullopt;
    return change;
}

// Decode one complete change record. Trailing bytes are an error.
inline auto decode_change(std::span<const std::byte> bytes) -> std::optional<DecodedChange> {
    auto chunk = parse_chunk(bytes);
    if (!chunk || chunk->total_size != bytes.size()) return std::nullopt;

    auto inflated = std::optional<std::vector<std::byte>>{};
    auto body = chunk->body;
    if (chunk->type == ChunkType::compressed) {
        inflated = inflate_raw(chunk->body);
        if (!inflated) return std::nullopt;
        body = *inflated;
    } else if (chunk->type != ChunkType::change) {
        return std::nullopt;
    }

    auto change = decode_change_body(body);
    if (!change) return std::nullopt;
    return DecodedChange{.change = std::move(*change), .hash = hash_change_body(body)};
}

}  // namespace amstore::storage
