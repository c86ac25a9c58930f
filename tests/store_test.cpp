#include <amstore/error.hpp>
#include <amstore/log.hpp>
#include <amstore/store.hpp>

#include <gtest/gtest.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace amstore;

namespace {

template <typename Fn>
void expect_kind(ErrorKind kind, Fn&& fn) {
    try {
        fn();
        ADD_FAILURE() << "expected " << to_string_view(kind);
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

auto to_bytes(std::string_view s) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

struct Recorded {
    std::vector<std::pair<std::string, std::vector<std::byte>>> changes;
    std::vector<std::pair<std::string, std::string>> events;
};

auto recording_store(Recorded& rec) -> DocumentStore {
    auto store = DocumentStore{};
    store.on_change([&rec](std::string_view key, std::span<const std::byte> change) {
        rec.changes.emplace_back(std::string{key}, std::vector<std::byte>(change.begin(), change.end()));
    });
    store.on_event([&rec](std::string_view event, std::string_view key) {
        rec.events.emplace_back(std::string{event}, std::string{key});
    });
    return store;
}

}  // namespace

// -- Commands -----------------------------------------------------------------

TEST(DocumentStore, typed_put_and_get) {
    auto store = DocumentStore{};
    store.new_document("doc");
    store.put_text("doc", "user.name", "Alice");
    store.put_int("doc", "user.age", 30);
    store.put_double("doc", "user.score", 4.5);
    store.put_bool("doc", "user.active", true);
    store.put_timestamp("doc", "user.joined", 1700000000000);
    store.put_counter("doc", "visits", 0);
    store.inc_counter("doc", "visits", 3);

    EXPECT_EQ(store.get_text("doc", "$.user.name"), "Alice");
    EXPECT_EQ(store.get_int("doc", "user.age"), 30);
    EXPECT_DOUBLE_EQ(store.get_double("doc", "user.score"), 4.5);
    EXPECT_TRUE(store.get_bool("doc", "user.active"));
    EXPECT_EQ(store.get_timestamp("doc", "user.joined"), 1700000000000);
    EXPECT_EQ(store.get_counter("doc", "visits"), 3);
    EXPECT_EQ(store.map_len("doc", ""), 2u);
    EXPECT_EQ(store.map_len("doc", "user"), 5u);
}

TEST(DocumentStore, list_and_text_commands) {
    auto store = DocumentStore{};
    store.new_document("doc");
    store.create_list("doc", "tags");
    store.append_text("doc", "tags", "a");
    store.append_int("doc", "tags", 2);
    store.append_double("doc", "tags", 3.0);
    store.append_bool("doc", "tags", true);
    EXPECT_EQ(store.list_len("doc", "tags"), 4u);
    EXPECT_EQ(store.get_text("doc", "tags[0]"), "a");

    store.put_text("doc", "greeting", "Hello World");
    store.splice_text("doc", "greeting", 6, 5, "Redis");
    EXPECT_EQ(store.get_text("doc", "greeting"), "Hello Redis");

    store.put_diff("doc", "greeting", "@@ -1 +1 @@\n-Hello Redis\n+Hello Diff\n");
    EXPECT_EQ(store.get_text("doc", "greeting"), "Hello Diff");
}

TEST(DocumentStore, missing_document_is_not_found) {
    auto store = DocumentStore{};
    expect_kind(ErrorKind::not_found, [&] { store.put_int("nope", "a", 1); });
    expect_kind(ErrorKind::not_found, [&] { (void)store.get_int("nope", "a"); });
    expect_kind(ErrorKind::not_found, [&] { (void)store.save("nope"); });
    expect_kind(ErrorKind::not_found, [&] { store.apply("nope", {}); });
    EXPECT_FALSE(store.contains("nope"));
}

TEST(DocumentStore, bad_path_is_parse_error) {
    auto store = DocumentStore{};
    store.new_document("doc");
    expect_kind(ErrorKind::parse_error, [&] { store.put_int("doc", "a..b", 1); });
    expect_kind(ErrorKind::parse_error, [&] { (void)store.get_int("doc", ""); });
}

TEST(DocumentStore, new_replaces_existing_document) {
    auto store = DocumentStore{};
    store.new_document("doc");
    store.put_int("doc", "a", 1);
    store.new_document("doc");
    EXPECT_EQ(store.map_len("doc", ""), 0u);
    EXPECT_EQ(store.num_changes("doc"), 0u);
}

TEST(DocumentStore, save_load_between_keys) {
    auto store = DocumentStore{};
    store.new_document("src");
    store.put_text("src", "k", "v");
    store.load("copy", store.save("src"));
    EXPECT_EQ(store.get_text("copy", "k"), "v");
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"copy", "src"}));
    EXPECT_EQ(store.size(), 2u);

    expect_kind(ErrorKind::decode_error, [&] { store.load("bad", to_bytes("garbage")); });
    EXPECT_FALSE(store.contains("bad"));
}

TEST(DocumentStore, apply_replicates_between_keys) {
    auto store = DocumentStore{};
    store.new_document("a");
    store.load("b", store.save("a"));
    store.put_int("a", "x", 1);
    store.put_int("a", "y", 2);
    store.apply("b", store.changes("a"));
    EXPECT_EQ(store.get_int("b", "y"), 2);
    EXPECT_EQ(store.num_changes("b"), 2u);
}

TEST(DocumentStore, commands_that_accept_a_missing_key) {
    auto store = DocumentStore{};
    store.from_json("fresh", R"({"a":1})");
    EXPECT_TRUE(store.contains("fresh"));
    EXPECT_EQ(store.get_int("fresh", "a"), 1);
    EXPECT_FALSE(store.remove("absent"));
    expect_kind(ErrorKind::not_found, [&] { (void)store.to_json("absent"); });
    expect_kind(ErrorKind::not_found, [&] { (void)store.num_changes("absent"); });
}

TEST(DocumentStore, remove) {
    auto store = DocumentStore{};
    store.new_document("doc");
    EXPECT_TRUE(store.remove("doc"));
    EXPECT_FALSE(store.remove("doc"));
    EXPECT_FALSE(store.contains("doc"));
}

// -- Notifications ------------------------------------------------------------

TEST(DocumentStore, mutations_publish_change_and_event) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.new_document("doc");
    store.put_text("doc", "name", "Alice");

    ASSERT_EQ(rec.changes.size(), 1u);
    EXPECT_EQ(rec.changes[0].first, "doc");
    EXPECT_EQ(rec.changes[0].second, *store.document("doc").last_change());

    ASSERT_EQ(rec.events.size(), 2u);
    EXPECT_EQ(rec.events[0], (std::pair<std::string, std::string>{"am.new", "doc"}));
    EXPECT_EQ(rec.events[1], (std::pair<std::string, std::string>{"am.puttext", "doc"}));
}

TEST(DocumentStore, published_changes_rebuild_a_replica) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.new_document("doc");
    store.put_int("doc", "a", 1);
    store.create_list("doc", "l");
    store.append_bool("doc", "l", true);
    store.put_counter("doc", "c", 1);
    store.inc_counter("doc", "c", 1);
    ASSERT_EQ(rec.changes.size(), 5u);

    auto replica = Document{};
    for (const auto& [key, change] : rec.changes) {
        EXPECT_EQ(key, "doc");
        replica.apply_changes({change});
    }
    EXPECT_EQ(replica.get_int(Path::parse("a")), 1);
    EXPECT_TRUE(replica.get_bool(Path::parse("l[0]")));
    EXPECT_EQ(replica.get_counter(Path::parse("c")), 2);
    EXPECT_EQ(replica.get_heads(), store.document("doc").get_heads());
}

TEST(DocumentStore, failed_command_publishes_nothing) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.new_document("doc");
    store.put_int("doc", "a", 1);
    rec = Recorded{};

    expect_kind(ErrorKind::type_mismatch, [&] { store.inc_counter("doc", "a", 1); });
    expect_kind(ErrorKind::type_mismatch, [&] { store.put_int("doc", "a.b", 1); });
    EXPECT_TRUE(rec.changes.empty());
    EXPECT_TRUE(rec.events.empty());
}

TEST(DocumentStore, no_op_command_emits_event_without_change) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.new_document("doc");
    store.create_list("doc", "l");
    rec = Recorded{};

    store.create_list("doc", "l");
    EXPECT_TRUE(rec.changes.empty());
    ASSERT_EQ(rec.events.size(), 1u);
    EXPECT_EQ(rec.events[0].first, "am.createlist");
}

TEST(DocumentStore, listener_failure_does_not_undo_the_write) {
    auto warnings = std::vector<std::string>{};
    set_log_sink([&](LogLevel level, std::string_view msg) {
        if (level == LogLevel::warn) warnings.emplace_back(msg);
    });

    auto store = DocumentStore{};
    store.on_change([](std::string_view, std::span<const std::byte>) {
        throw std::runtime_error{"consumer offline"};
    });
    store.new_document("doc");
    store.put_int("doc", "a", 1);
    set_log_sink(nullptr);

    EXPECT_EQ(store.get_int("doc", "a"), 1);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("consumer offline"), std::string::npos);
}

TEST(DocumentStore, remove_emits_del_event) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.new_document("doc");
    store.remove("doc");
    ASSERT_EQ(rec.events.size(), 2u);
    EXPECT_EQ(rec.events[1].first, "am.del");
}

TEST(DocumentStore, change_channel_name) {
    EXPECT_EQ(change_channel("doc:1"), "changes:doc:1");
}

// -- JSON ---------------------------------------------------------------------

TEST(DocumentStore, from_json_then_to_json) {
    auto rec = Recorded{};
    auto store = recording_store(rec);
    store.from_json("doc", R"({"name":"Ada","tags":["x",2],"nested":{"ok":true}})");

    EXPECT_EQ(store.get_text("doc", "name"), "Ada");
    EXPECT_EQ(store.get_int("doc", "tags[1]"), 2);
    EXPECT_TRUE(store.get_bool("doc", "nested.ok"));
    EXPECT_EQ(store.to_json("doc"), R"({"name":"Ada","nested":{"ok":true},"tags":["x",2]})");
    EXPECT_EQ(rec.changes.size(), 1u);
    EXPECT_EQ(rec.events.back().first, "am.fromjson");
}

TEST(DocumentStore, from_json_rejects_bad_input) {
    auto store = DocumentStore{};
    store.new_document("doc");
    store.put_int("doc", "keep", 1);
    expect_kind(ErrorKind::parse_error, [&] { store.from_json("doc", "{not json"); });
    expect_kind(ErrorKind::parse_error, [&] { store.from_json("doc", "[1,2]"); });
    EXPECT_EQ(store.get_int("doc", "keep"), 1);
}

// -- Base64 -------------------------------------------------------------------

TEST(Base64, known_vectors) {
    EXPECT_EQ(base64_encode(to_bytes("")), "");
    EXPECT_EQ(base64_encode(to_bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(to_bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(to_bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(to_bytes("foobar")), "Zm9vYmFy");
    EXPECT_EQ(base64_decode("Zm9vYg=="), to_bytes("foob"));
}

TEST(Base64, decodes_change_records) {
    auto store = DocumentStore{};
    store.new_document("doc");
    store.put_int("doc", "a", 1);
    auto change = *store.document("doc").last_change();
    EXPECT_EQ(base64_decode(base64_encode(change)), change);
}

TEST(Base64, rejects_malformed_text) {
    expect_kind(ErrorKind::decode_error, [] { (void)base64_decode("abc"); });
    expect_kind(ErrorKind::decode_error, [] { (void)base64_decode("ab!d"); });
    expect_kind(ErrorKind::decode_error, [] { (void)base64_decode("a=bc"); });
    expect_kind(ErrorKind::decode_error, [] { (void)base64_decode("ab=c"); });
}
