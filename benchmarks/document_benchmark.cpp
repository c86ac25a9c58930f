// amstore benchmarks: measures throughput of the path-addressed commands.

#include <amstore/amstore.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace amstore;

static auto p(std::string_view raw) -> Path { return Path::parse(raw); }

static auto make_doc() -> Document { return Document{ActorId::random()}; }

static auto populated(int keys) -> Document {
    auto doc = make_doc();
    doc.transact([keys](Transaction& tx) {
        for (int i = 0; i < keys; ++i) {
            tx.put(root, "key" + std::to_string(i), std::int64_t{i});
        }
    });
    return doc;
}

// =============================================================================
// Paths
// =============================================================================

static void bm_path_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto path = Path::parse("$.users[12].profile.addresses[0].city");
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_path_parse);

// =============================================================================
// Typed accessors
// =============================================================================

static void bm_put_int(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("stats.count");
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.put_int(path, i++);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_put_int);

static void bm_put_nested_autovivify(benchmark::State& state) {
    std::int64_t i = 0;
    for (auto _ : state) {
        state.PauseTiming();
        auto doc = make_doc();
        state.ResumeTiming();
        doc.put_int(p("a.b.c.d.e"), i++);
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_put_nested_autovivify);

static void bm_get_int(benchmark::State& state) {
    auto doc = populated(100);
    const auto path = p("key50");
    for (auto _ : state) {
        auto val = doc.get_int(path);
        benchmark::DoNotOptimize(val);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_int);

static void bm_increment_counter(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("hits");
    doc.put_counter(path, 0);
    for (auto _ : state) {
        doc.increment_counter(path, 1);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_increment_counter);

// =============================================================================
// Lists
// =============================================================================

static void bm_append_int(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("items");
    doc.create_list(path);
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.append_int(path, i++);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_append_int);

static void bm_list_index_get(benchmark::State& state) {
    auto doc = make_doc();
    doc.create_list(p("items"));
    for (int i = 0; i < 1000; ++i) doc.append_int(p("items"), i);
    const auto path = p("items[500]");
    for (auto _ : state) {
        auto val = doc.get_int(path);
        benchmark::DoNotOptimize(val);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_list_index_get);

// =============================================================================
// Text
// =============================================================================

static void bm_splice_text_append(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("text");
    doc.put_text(path, "");
    std::int64_t pos = 0;
    for (auto _ : state) {
        doc.splice_text(path, pos++, 0, "x");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_splice_text_append);

static void bm_put_diff(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("text");
    const auto before = std::string{"Hello World"};
    const auto after = std::string{"Hello Redis"};
    doc.put_text(path, before);
    auto forward = true;
    for (auto _ : state) {
        const auto& from = forward ? before : after;
        const auto& to = forward ? after : before;
        doc.put_diff(path, "@@ -1 +1 @@\n-" + from + "\n+" + to + "\n");
        forward = !forward;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_put_diff);

static void bm_get_text(benchmark::State& state) {
    auto doc = make_doc();
    const auto path = p("text");
    doc.put_text(path, std::string(1000, 'x'));
    for (auto _ : state) {
        auto text = doc.get_text(path);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_text);

// =============================================================================
// Save / Load
// =============================================================================

static void bm_save(benchmark::State& state) {
    auto doc = populated(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto bytes = doc.save();
        benchmark::DoNotOptimize(bytes);
        state.SetBytesProcessed(static_cast<std::int64_t>(bytes.size()));
    }
}
BENCHMARK(bm_save)->Range(10, 1000);

static void bm_load(benchmark::State& state) {
    auto bytes = populated(static_cast<int>(state.range(0))).save();
    for (auto _ : state) {
        auto loaded = Document::load(bytes);
        benchmark::DoNotOptimize(loaded);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_load)->Range(10, 1000);

// =============================================================================
// Replication
// =============================================================================

static void bm_apply_changes(benchmark::State& state) {
    auto source = make_doc();
    for (int i = 0; i < 100; ++i) source.put_int(p("k" + std::to_string(i)), i);
    auto changes = source.get_changes();

    for (auto _ : state) {
        state.PauseTiming();
        auto replica = make_doc();
        state.ResumeTiming();
        replica.apply_changes(changes);
        benchmark::DoNotOptimize(replica);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * changes.size()));
}
BENCHMARK(bm_apply_changes);

static void bm_merge(benchmark::State& state) {
    for (auto _ : state) {
        state.PauseTiming();
        auto doc1 = make_doc();
        doc1.put_int(p("base"), 0);
        auto doc2 = doc1.fork();
        for (int i = 0; i < 10; ++i) {
            doc1.put_int(p("a" + std::to_string(i)), i);
            doc2.put_int(p("b" + std::to_string(i)), i);
        }
        state.ResumeTiming();

        doc1.merge(doc2);
        benchmark::DoNotOptimize(doc1);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge);

// =============================================================================
// Store
// =============================================================================

static void bm_store_put_with_listener(benchmark::State& state) {
    auto store = DocumentStore{};
    auto published = std::size_t{0};
    store.on_change([&published](std::string_view, std::span<const std::byte> change) {
        published += change.size();
    });
    store.new_document("doc");
    std::int64_t i = 0;
    for (auto _ : state) {
        store.put_int("doc", "stats.count", i++);
    }
    benchmark::DoNotOptimize(published);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_put_with_listener);

static void bm_to_json(benchmark::State& state) {
    auto store = DocumentStore{};
    store.from_json("doc", R"({"name":"Ada","tags":["x","y","z"],"nested":{"a":1,"b":[true,false]}})");
    for (auto _ : state) {
        auto text = store.to_json("doc");
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_to_json);
