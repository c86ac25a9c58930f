#pragma once

// Code-point segmentation of UTF-8 text. Text objects hold one element
// per code point, and every text length or offset counts code points.
// Internal header, not installed.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace amstore::encoding {

// Byte length of the sequence introduced by lead. Malformed lead or
// continuation bytes are treated as one-byte units so that any byte
// string splits losslessly.
inline auto utf8_sequence_length(std::string_view text, std::size_t pos) -> std::size_t {
    const auto lead = static_cast<unsigned char>(text[pos]);
    auto len = std::size_t{1};
    if (lead >= 0xF0 && lead <= 0xF4) len = 4;
    else if (lead >= 0xE0) len = lead <= 0xEF ? 3 : 1;
    else if (lead >= 0xC2) len = 2;
    if (pos + len > text.size()) return 1;
    for (std::size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

inline auto split_code_points(std::string_view text) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    out.reserve(text.size());
    for (std::size_t pos = 0; pos < text.size();) {
        auto len = utf8_sequence_length(text, pos);
        out.emplace_back(text.substr(pos, len));
        pos += len;
    }
    return out;
}

}  // namespace amstore::encoding
