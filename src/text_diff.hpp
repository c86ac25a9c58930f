#pragma once

// Internal header, not installed. Unified diff application for text values.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace amstore::detail {

// Apply a unified diff (the hunks; file headers are skipped) to
// `original` and return the patched text. Throws Exception with
// ErrorKind::invalid_diff when the diff is malformed or its context or
// removed lines do not match `original`.
auto apply_unified_diff(std::string_view original, std::string_view diff) -> std::string;

// The single splice that turns `before` into `after`: everything between
// their common byte prefix and suffix, widened to whole pieces of `before`.
// pos and del count pieces.
struct TextSplice {
    std::size_t pos = 0;
    std::size_t del = 0;
    std::string insert;
};

auto minimal_splice(const std::vector<std::string>& before, std::string_view after) -> TextSplice;

// As above, with `before` split into code points.
auto minimal_splice(std::string_view before, std::string_view after) -> TextSplice;

}  // namespace amstore::detail
