#pragma once

// Chunk envelope shared by snapshots and change records:
//   magic      4 bytes  85 6F 4A 83
//   checksum   4 bytes  leading bytes of SHA-256(body)
//   type       1 byte   ChunkType
//   length     ULEB128
//   body       length bytes
//
// Internal header, not installed.

#include "../crypto/sha256.hpp"
#include "../encoding/leb128.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace amstore::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{0x85}, std::byte{0x6F}, std::byte{0x4A}, std::byte{0x83}
};

enum class ChunkType : std::uint8_t {
    document   = 0x00,
    change     = 0x01,
    compressed = 0x02,  // a change whose body is raw DEFLATE
};

// A validated chunk at the front of some buffer.
struct ChunkView {
    ChunkType type;
    std::span<const std::byte> body;
    std::size_t total_size;  // envelope + body
};

inline auto chunk_checksum(std::span<const std::byte> body) -> std::array<std::byte, 4> {
    auto digest = crypto::sha256(body);
    auto result = std::array<std::byte, 4>{};
    std::copy_n(digest.begin(), result.size(), result.begin());
    return result;
}

// Parse and verify the chunk at the start of data. Fails on bad magic,
// unknown type, truncated body or checksum mismatch.
inline auto parse_chunk(std::span<const std::byte> data) -> std::optional<ChunkView> {
    constexpr auto fixed = chunk_magic.size() + 4 + 1;
    if (data.size() < fixed) return std::nullopt;
    if (!std::equal(chunk_magic.begin(), chunk_magic.end(), data.begin())) return std::nullopt;

    const auto type_byte = static_cast<std::uint8_t>(data[8]);
    if (type_byte > static_cast<std::uint8_t>(ChunkType::compressed)) return std::nullopt;

    auto len = encoding::decode_uleb128(data.subspan(fixed));
    if (!len) return std::nullopt;
    const auto body_offset = fixed + len->bytes_read;
    if (len->value > data.size() - body_offset) return std::nullopt;

    auto body = data.subspan(body_offset, static_cast<std::size_t>(len->value));
    auto expected = chunk_checksum(body);
    if (!std::equal(expected.begin(), expected.end(), data.begin() + 4)) return std::nullopt;

    return ChunkView{
        .type = static_cast<ChunkType>(type_byte),
        .body = body,
        .total_size = body_offset + body.size(),
    };
}

inline void write_chunk(ChunkType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());
    auto checksum = chunk_checksum(body);
    output.insert(output.end(), checksum.begin(), checksum.end());
    output.push_back(static_cast<std::byte>(type));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace amstore::storage
