#pragma once

// Raw DEFLATE (no zlib/gzip header) for large change records.
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace amstore::storage {

// Inflated records larger than this are rejected as corrupt.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

inline auto deflate_raw(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    // windowBits = -15: raw deflate
    if (::deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto output = std::vector<std::byte>(::deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    const auto ret = ::deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(produced);
    return output;
}

// Inflate raw DEFLATE data. Fails on corrupt or trailing input and on
// output that would exceed max_output.
inline auto inflate_raw(std::span<const std::byte> input,
                        std::size_t max_output = max_inflated_size)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    auto output = std::vector<std::byte>(std::min(std::max<std::size_t>(input.size() * 4, 64), max_output));
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto ret = Z_OK;
    while (true) {
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + stream.total_out);
        stream.avail_out = static_cast<uInt>(output.size() - stream.total_out);
        ret = ::inflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_END) break;
        if ((ret != Z_BUF_ERROR && ret != Z_OK) || stream.avail_out != 0 ||
            output.size() >= max_output) {
            break;
        }
        output.resize(std::min(output.size() * 2, max_output));
    }

    const auto produced = stream.total_out;
    const auto leftover = stream.avail_in;
    ::inflateEnd(&stream);
    if (ret != Z_STREAM_END || leftover != 0) return std::nullopt;

    output.resize(produced);
    return output;
}

}  // namespace amstore::storage
