#pragma once

// Byte stream writer for the binary formats.
// Internal header, not installed.

#include <amstore/types.hpp>
#include <amstore/value.hpp>
#include "../encoding/leb128.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <variant>
#include <vector>

namespace amstore::storage {

// Value tags. Tag 0 is a container, followed by its ObjType byte.
enum class ValueTag : std::uint8_t {
    object    = 0,
    null      = 1,
    boolean   = 2,
    integer   = 3,
    floating  = 4,
    counter   = 5,
    timestamp = 6,
    string    = 7,
};

// Actors referenced by a chunk, written once and then addressed by index.
class ActorTable {
public:
    ActorTable() = default;
    explicit ActorTable(std::vector<ActorId> actors) : actors_{std::move(actors)} {}

    auto index_of(const ActorId& actor) const -> std::uint64_t {
        auto it = std::ranges::find(actors_, actor);
        if (it == actors_.end()) {
            throw std::logic_error{"actor missing from actor table: " + actor.to_hex()};
        }
        return static_cast<std::uint64_t>(it - actors_.begin());
    }

    auto actors() const -> const std::vector<ActorId>& { return actors_; }

private:
    std::vector<ActorId> actors_;
};

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    // Little-endian IEEE 754, independent of host byte order.
    void write_f64(double value) {
        auto bits = std::bit_cast<std::uint64_t>(value);
        for (int i = 0; i < 8; ++i) {
            write_u8(static_cast<std::uint8_t>(bits >> (i * 8)));
        }
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        write_bytes(std::as_bytes(std::span{s.data(), s.size()}));
    }

    // Length-prefixed byte blob.
    void write_blob(std::span<const std::byte> bytes) {
        write_uleb128(bytes.size());
        write_bytes(bytes);
    }

    void write_actor_id(const ActorId& id) { write_bytes(id.bytes); }
    void write_change_hash(const ChangeHash& h) { write_bytes(h.bytes); }

    void write_op_id(const OpId& id, const ActorTable& actors) {
        write_uleb128(id.counter);
        write_uleb128(actors.index_of(id.actor));
    }

    void write_obj_id(const ObjId& id, const ActorTable& actors) {
        if (id.is_root()) {
            write_u8(0);
        } else {
            write_u8(1);
            write_op_id(std::get<OpId>(id.inner), actors);
        }
    }

    void write_prop(const Prop& prop) {
        std::visit(overload{
            [this](const std::string& key) { write_u8(0); write_string(key); },
            [this](std::size_t index) { write_u8(1); write_uleb128(index); },
        }, prop);
    }

    void write_value(const Value& val) {
        std::visit(overload{
            [this](ObjType type) {
                write_tag(ValueTag::object);
                write_u8(static_cast<std::uint8_t>(type));
            },
            [this](const ScalarValue& sv) { write_scalar(sv); },
        }, val);
    }

    void write_scalar(const ScalarValue& sv) {
        std::visit(overload{
            [this](Null) { write_tag(ValueTag::null); },
            [this](bool b) { write_tag(ValueTag::boolean); write_u8(b ? 1 : 0); },
            [this](std::int64_t i) { write_tag(ValueTag::integer); write_sleb128(i); },
            [this](double d) { write_tag(ValueTag::floating); write_f64(d); },
            [this](const Counter& c) { write_tag(ValueTag::counter); write_sleb128(c.value); },
            [this](const Timestamp& t) { write_tag(ValueTag::timestamp); write_sleb128(t.millis_since_epoch); },
            [this](const std::string& s) { write_tag(ValueTag::string); write_string(s); },
        }, sv);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    void write_tag(ValueTag tag) { write_u8(static_cast<std::uint8_t>(tag)); }

    std::vector<std::byte> data_;
};

}  // namespace amstore::storage
