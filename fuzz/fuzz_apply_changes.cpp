// Fuzz target for Document::apply_changes(). The input is split into change
// records on 0xFF separators and applied to a small seeded document.

#include <amstore/amstore.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace {

auto split_records(const uint8_t* data, size_t size) -> std::vector<std::vector<std::byte>> {
    auto records = std::vector<std::vector<std::byte>>{1};
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0xFF && records.size() < 16) {
            records.emplace_back();
            continue;
        }
        records.back().push_back(static_cast<std::byte>(data[i]));
    }
    return records;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto doc = amstore::Document{amstore::ActorId{}};
    doc.put_text(amstore::Path::parse("title"), "seed");
    doc.create_list(amstore::Path::parse("items"));

    try {
        doc.apply_changes(split_records(data, size));
        auto reloaded = amstore::Document::load(doc.save());
        (void)reloaded.get_heads();
    } catch (const amstore::Exception&) {
        // Malformed or causally invalid records are expected.
    }
    return 0;
}
