/// @file options.hpp
/// @brief Per-document tuning knobs.

#pragma once

#include <cstddef>

namespace amstore {

/// Settings a Document is constructed with. A DocumentStore hands its
/// options to every document it creates or loads.
struct DocumentOptions {
    /// Change bodies larger than this many bytes are emitted as raw
    /// DEFLATE compressed chunks.
    std::size_t compression_threshold = 256;

    /// Upper bound on received change records held back while their
    /// dependencies are missing.
    std::size_t max_pending_changes = 1024;

    auto operator==(const DocumentOptions&) const -> bool = default;
};

}  // namespace amstore
