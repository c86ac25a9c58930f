#pragma once

// Byte stream reader for the binary formats. Every read returns nullopt
// instead of reading past the end or accepting an out-of-range value.
// Internal header, not installed.

#include <amstore/types.hpp>
#include <amstore/value.hpp>
#include "serializer.hpp"
#include "../encoding/leb128.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace amstore::storage {

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data) : data_{data} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (at_end()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    // A count of items each at least min_item_size bytes long; counts
    // that cannot fit in the remaining input are rejected up front.
    auto read_count(std::size_t min_item_size = 1) -> std::optional<std::size_t> {
        auto n = read_uleb128();
        if (!n || *n > remaining() / std::max<std::size_t>(min_item_size, 1)) return std::nullopt;
        return static_cast<std::size_t>(*n);
    }

    auto read_f64() -> std::optional<double> {
        auto bytes = read_bytes(8);
        if (!bytes) return std::nullopt;
        auto bits = std::uint64_t{0};
        for (int i = 7; i >= 0; --i) {
            bits = (bits << 8) | static_cast<std::uint64_t>((*bytes)[static_cast<std::size_t>(i)]);
        }
        return std::bit_cast<double>(bits);
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_count();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(*len);
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_blob() -> std::optional<std::span<const std::byte>> {
        auto len = read_count();
        if (!len) return std::nullopt;
        return read_bytes(*len);
    }

    auto read_actor_id() -> std::optional<ActorId> {
        auto bytes = read_bytes(ActorId::size);
        if (!bytes) return std::nullopt;
        auto id = ActorId{};
        std::ranges::copy(*bytes, id.bytes.begin());
        return id;
    }

    auto read_change_hash() -> std::optional<ChangeHash> {
        auto bytes = read_bytes(ChangeHash::size);
        if (!bytes) return std::nullopt;
        auto h = ChangeHash{};
        std::ranges::copy(*bytes, h.bytes.begin());
        return h;
    }

    auto read_op_id(const std::vector<ActorId>& actors) -> std::optional<OpId> {
        auto counter = read_uleb128();
        if (!counter || *counter == 0) return std::nullopt;
        auto idx = read_uleb128();
        if (!idx || *idx >= actors.size()) return std::nullopt;
        return OpId{*counter, actors[static_cast<std::size_t>(*idx)]};
    }

    auto read_obj_id(const std::vector<ActorId>& actors) -> std::optional<ObjId> {
        auto tag = read_u8();
        if (!tag || *tag > 1) return std::nullopt;
        if (*tag == 0) return ObjId{};
        auto id = read_op_id(actors);
        if (!id) return std::nullopt;
        return ObjId{*id};
    }

    auto read_prop() -> std::optional<Prop> {
        auto tag = read_u8();
        if (!tag || *tag > 1) return std::nullopt;
        if (*tag == 0) {
            auto s = read_string();
            if (!s) return std::nullopt;
            return Prop{std::move(*s)};
        }
        auto idx = read_uleb128();
        if (!idx) return std::nullopt;
        return Prop{static_cast<std::size_t>(*idx)};
    }

    auto read_value() -> std::optional<Value> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        switch (static_cast<ValueTag>(*tag)) {
            case ValueTag::object: {
                auto type = read_u8();
                if (!type || *type > static_cast<std::uint8_t>(ObjType::text)) return std::nullopt;
                return Value{static_cast<ObjType>(*type)};
            }
            case ValueTag::null:
                return Value{ScalarValue{Null{}}};
            case ValueTag::boolean: {
                auto b = read_u8();
                if (!b || *b > 1) return std::nullopt;
                return Value{ScalarValue{*b == 1}};
            }
            case ValueTag::integer: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return Value{ScalarValue{*v}};
            }
            case ValueTag::floating: {
                auto v = read_f64();
                if (!v) return std::nullopt;
                return Value{ScalarValue{*v}};
            }
            case ValueTag::counter: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return Value{ScalarValue{Counter{*v}}};
            }
            case ValueTag::timestamp: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return Value{ScalarValue{Timestamp{*v}}};
            }
            case ValueTag::string: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return Value{ScalarValue{std::move(*s)}};
            }
        }
        return std::nullopt;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

}  // namespace amstore::storage
