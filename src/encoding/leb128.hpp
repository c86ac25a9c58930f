#pragma once

// LEB128 (Little Endian Base 128) variable-length integers.
// Every length, counter and sequence number in the binary formats uses it.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace amstore::encoding {

// Longest encoding of a 64-bit value.
inline constexpr std::size_t max_leb128_bytes = 10;

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= std::byte{0x80};
        output.push_back(byte);
    } while (value != 0);
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_uleb128(value, result);
    return result;
}

template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

// Decode an unsigned value from the front of input. Fails on truncated
// input and on encodings that do not fit in 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::uint64_t>> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < input.size() && i < max_leb128_bytes; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        const auto shift = 7 * i;
        // The tenth byte may only carry the top bit of the value.
        if (i == max_leb128_bytes - 1 && bits > 1) return std::nullopt;
        value |= bits << shift;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return Decoded<std::uint64_t>{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    auto more = true;
    while (more) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;  // arithmetic shift keeps the sign
        const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            more = false;
        } else {
            byte |= std::byte{0x80};
        }
        output.push_back(byte);
    }
}

inline auto encode_sleb128(std::int64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_sleb128(value, result);
    return result;
}

inline auto decode_sleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::int64_t>> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < input.size() && i < max_leb128_bytes; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        const auto shift = 7 * i;
        value |= bits << shift;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            const auto width = shift + 7;
            if (width < 64 && (input[i] & std::byte{0x40}) != std::byte{0}) {
                value |= ~std::uint64_t{0} << width;  // sign extend
            }
            return Decoded<std::int64_t>{.value = static_cast<std::int64_t>(value),
                                         .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

}  // namespace amstore::encoding
