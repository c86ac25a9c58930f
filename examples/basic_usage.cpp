// basic_usage: demonstrates the path-addressed amstore API
//
// Shows typed puts and gets, autovivified intermediate maps, lists,
// counters, timestamps, text splicing, JSON export and save/load.
//
// Build: cmake -B build -DAMSTORE_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/basic_usage

#include <amstore/amstore.hpp>
#include <amstore/json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace am = amstore;

int main() {
    auto doc = am::Document{};
    auto p = [](std::string_view raw) { return am::Path::parse(raw); };

    // -- Typed puts; intermediate maps are created on demand ------------------
    doc.put_text(p("title"), "Shopping List");
    doc.put_text(p("owner.name"), "Alice");
    doc.put_int(p("owner.age"), 34);
    doc.put_bool(p("owner.verified"), true);
    doc.put_double(p("budget"), 42.5);
    doc.put_timestamp(p("created"), 1700000000000);

    // -- Lists ----------------------------------------------------------------
    doc.create_list(p("items"));
    doc.append_text(p("items"), "Milk");
    doc.append_text(p("items"), "Eggs");
    doc.append_text(p("items"), "Bread");
    std::printf("Items: %zu, first: %s\n", doc.list_len(p("items")),
                doc.get_text(p("items[0]")).c_str());

    // -- Counters -------------------------------------------------------------
    doc.put_counter(p("views"), 0);
    doc.increment_counter(p("views"), 3);
    std::printf("Views: %lld\n", static_cast<long long>(doc.get_counter(p("views"))));

    // -- Text splicing --------------------------------------------------------
    doc.put_text(p("note"), "Hello World");
    doc.splice_text(p("note"), 6, 5, "Redis");
    std::printf("Note: %s\n", doc.get_text(p("note")).c_str());

    // -- Errors carry a kind --------------------------------------------------
    try {
        (void)doc.get_int(p("title"));
    } catch (const am::Exception& e) {
        std::printf("Expected failure: %s\n", e.what());
    }

    // -- JSON view ------------------------------------------------------------
    std::printf("\n%s\n", am::json::to_string(doc, true).c_str());

    // -- Save / load ----------------------------------------------------------
    auto bytes = doc.save();
    auto loaded = am::Document::load(bytes);
    std::printf("\nSaved %zu bytes, %zu changes; loaded owner: %s\n", bytes.size(),
                loaded.num_changes(), loaded.get_text(p("owner.name")).c_str());

    return 0;
}
