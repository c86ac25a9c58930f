// text_editor: concurrent text editing with splice, diff and merge
//
// Demonstrates: text values, splice_text, put_diff, fork/merge of
//               concurrent edits, the change history

#include <amstore/amstore.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace am = amstore;

int main() {
    auto actor1 = am::ActorId{};
    actor1.bytes[0] = std::byte{1};
    auto doc = am::Document{actor1};
    const auto content = am::Path::parse("content");

    doc.put_text(content, "Hello World");
    std::printf("Initial: \"%s\"\n", doc.get_text(content).c_str());

    // Replace "World" in place
    doc.splice_text(content, 6, 5, "C++20");
    std::printf("After splice: \"%s\"\n", doc.get_text(content).c_str());

    // Apply an edit expressed as a unified diff; only the changed
    // characters become operations.
    doc.put_diff(content, "@@ -1 +1 @@\n-Hello C++20\n+Hello, C++20!\n");
    std::printf("After diff: \"%s\" (%zu ops)\n", doc.get_text(content).c_str(),
                doc.get_change_history().back().operations.size());

    // Concurrent editing with merge
    auto doc2 = doc.fork();
    doc.splice_text(content, static_cast<std::int64_t>(doc.get_text(content).size()), 0, " rocks");
    doc2.splice_text(content, 0, 0, ">>> ");

    doc.merge(doc2);
    doc2.merge(doc);
    std::printf("\nAfter concurrent edits + merge:\n  doc:  \"%s\"\n  doc2: \"%s\"\n",
                doc.get_text(content).c_str(), doc2.get_text(content).c_str());

    std::printf("\nHistory:\n");
    for (const auto& change : doc.get_change_history()) {
        std::printf("  %s seq %llu: %zu ops\n", change.actor.to_hex().substr(0, 8).c_str(),
                    static_cast<unsigned long long>(change.seq), change.operations.size());
    }
    return 0;
}
