// Fuzz target for Document::load(). Any snapshot that loads must save back
// to the same bytes and load again.

#include <amstore/amstore.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    try {
        auto doc = amstore::Document::load(span);
        auto saved = doc.save();
        auto again = amstore::Document::load(saved);
        if (again.save() != saved) std::abort();
    } catch (const amstore::Exception&) {
        // Rejected input is fine; crashes and leaks are not.
    }
    return 0;
}
