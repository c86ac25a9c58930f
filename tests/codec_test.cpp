#include <amstore/document.hpp>
#include <amstore/error.hpp>

#include "../src/storage/change_chunk.hpp"
#include "../src/storage/snapshot.hpp"

#include <gtest/gtest.h>

using namespace amstore;

namespace {

auto p(std::string_view raw) -> Path { return Path::parse(raw); }

template <typename Fn>
void expect_kind(ErrorKind kind, Fn&& fn) {
    try {
        fn();
        ADD_FAILURE() << "expected " << to_string_view(kind);
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

auto populated() -> Document {
    auto doc = Document{};
    doc.put_text(p("title"), "Shopping");
    doc.put_int(p("meta.version"), 3);
    doc.put_double(p("meta.ratio"), 0.25);
    doc.put_bool(p("meta.shared"), true);
    doc.put_counter(p("views"), 10);
    doc.increment_counter(p("views"), 5);
    doc.put_timestamp(p("created"), 1700000000000);
    doc.create_list(p("items"));
    doc.append_text(p("items"), "milk");
    doc.append_int(p("items"), 12);
    doc.put_text(p("notes"), "Hello World");
    doc.splice_text(p("notes"), 6, 5, "Redis");
    return doc;
}

void expect_same_content(const Document& a, const Document& b) {
    EXPECT_EQ(a.get_text(p("title")), b.get_text(p("title")));
    EXPECT_EQ(a.get_int(p("meta.version")), b.get_int(p("meta.version")));
    EXPECT_DOUBLE_EQ(a.get_double(p("meta.ratio")), b.get_double(p("meta.ratio")));
    EXPECT_EQ(a.get_bool(p("meta.shared")), b.get_bool(p("meta.shared")));
    EXPECT_EQ(a.get_counter(p("views")), b.get_counter(p("views")));
    EXPECT_EQ(a.get_timestamp(p("created")), b.get_timestamp(p("created")));
    EXPECT_EQ(a.list_len(p("items")), b.list_len(p("items")));
    EXPECT_EQ(a.get_text(p("items[0]")), b.get_text(p("items[0]")));
    EXPECT_EQ(a.get_int(p("items[1]")), b.get_int(p("items[1]")));
    EXPECT_EQ(a.get_text(p("notes")), b.get_text(p("notes")));
}

}  // namespace

// -- Save and load ------------------------------------------------------------

TEST(Codec, load_of_save_reproduces_content) {
    auto doc = populated();
    auto loaded = Document::load(doc.save());
    expect_same_content(doc, loaded);
    EXPECT_EQ(loaded.get_text(p("notes")), "Hello Redis");
    EXPECT_EQ(loaded.get_counter(p("views")), 15);
    EXPECT_EQ(loaded.actor_id(), doc.actor_id());
    EXPECT_EQ(loaded.get_heads(), doc.get_heads());
    EXPECT_EQ(loaded.num_changes(), doc.num_changes());
}

TEST(Codec, save_is_deterministic_and_stable_across_load) {
    auto doc = populated();
    auto first = doc.save();
    EXPECT_EQ(doc.save(), first);
    EXPECT_EQ(Document::load(first).save(), first);
}

TEST(Codec, empty_document_round_trips) {
    auto doc = Document{};
    auto loaded = Document::load(doc.save());
    EXPECT_EQ(loaded.map_len(Path{}), 0u);
    EXPECT_EQ(loaded.num_changes(), 0u);
    EXPECT_TRUE(loaded.get_heads().empty());
}

TEST(Codec, editing_continues_after_load) {
    auto doc = populated();
    auto loaded = Document::load(doc.save());
    loaded.put_int(p("meta.version"), 4);

    auto history = loaded.get_change_history();
    EXPECT_EQ(history.back().seq, doc.get_change_history().back().seq + 1);
    EXPECT_GT(history.back().start_op, doc.get_change_history().back().start_op);

    // The saved-from document accepts the continuation.
    doc.apply_changes({*loaded.last_change()});
    EXPECT_EQ(doc.get_int(p("meta.version")), 4);
}

TEST(Codec, loaded_document_has_no_last_change) {
    auto loaded = Document::load(populated().save());
    EXPECT_FALSE(loaded.last_change().has_value());
}

TEST(Codec, load_applies_options) {
    auto opts = DocumentOptions{.compression_threshold = 16, .max_pending_changes = 2};
    auto loaded = Document::load(populated().save(), opts);
    EXPECT_EQ(loaded.options(), opts);
}

// -- Corruption ---------------------------------------------------------------

TEST(Codec, corrupt_bytes_are_decode_errors) {
    auto bytes = populated().save();
    for (std::size_t i = 0; i < bytes.size(); i += 7) {
        auto damaged = bytes;
        damaged[i] ^= std::byte{0x5A};
        expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(damaged); });
    }
}

TEST(Codec, truncated_bytes_are_decode_errors) {
    auto bytes = populated().save();
    for (auto len : {std::size_t{0}, std::size_t{4}, std::size_t{9}, bytes.size() / 2, bytes.size() - 1}) {
        auto prefix = std::vector<std::byte>(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(len));
        expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(prefix); });
    }
}

TEST(Codec, change_record_is_not_a_snapshot) {
    auto doc = Document{};
    doc.put_int(p("a"), 1);
    expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(*doc.last_change()); });
}

TEST(Codec, inconsistent_heads_are_rejected) {
    auto doc = populated();
    auto snap = *storage::decode_snapshot(doc.save());
    snap.heads.clear();
    auto forged = storage::encode_snapshot(snap);
    expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(forged); });
}

TEST(Codec, reordered_history_is_rejected) {
    auto doc = populated();
    auto snap = *storage::decode_snapshot(doc.save());
    std::swap(snap.changes[0], snap.changes[1]);
    auto forged = storage::encode_snapshot(snap);
    expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(forged); });
}

TEST(Codec, counter_behind_history_is_rejected) {
    auto doc = populated();
    auto snap = *storage::decode_snapshot(doc.save());
    snap.next_counter = 1;
    auto forged = storage::encode_snapshot(snap);
    expect_kind(ErrorKind::decode_error, [&] { (void)Document::load(forged); });
}

// -- Change records -----------------------------------------------------------

TEST(Codec, last_change_is_the_latest_record) {
    auto doc = Document{};
    doc.put_int(p("a"), 1);
    auto first = *doc.last_change();
    doc.put_int(p("b"), 2);
    auto second = *doc.last_change();
    EXPECT_NE(first, second);
    EXPECT_EQ(doc.get_changes(), (std::vector<std::vector<std::byte>>{first, second}));
}

TEST(Codec, replaying_emitted_changes_rebuilds_document) {
    auto source = Document{};
    auto emitted = std::vector<std::vector<std::byte>>{};
    auto capture = [&] { emitted.push_back(*source.last_change()); };

    source.put_text(p("title"), "Shopping");
    capture();
    source.create_list(p("items"));
    capture();
    source.append_text(p("items"), "milk");
    capture();
    source.put_counter(p("n"), 1);
    capture();
    source.increment_counter(p("n"), 2);
    capture();

    auto replica = Document{};
    for (const auto& change : emitted) replica.apply_changes({change});
    EXPECT_EQ(replica.get_text(p("title")), "Shopping");
    EXPECT_EQ(replica.get_text(p("items[0]")), "milk");
    EXPECT_EQ(replica.get_counter(p("n")), 3);
    EXPECT_EQ(replica.get_heads(), source.get_heads());
}

TEST(Codec, large_change_is_compressed_and_still_applies) {
    auto doc = Document{ActorId::random(), DocumentOptions{.compression_threshold = 32,
                                                           .max_pending_changes = 1024}};
    doc.put_text(p("body"), std::string(2000, 'a'));
    auto record = *doc.last_change();
    auto decoded = storage::decode_change(record);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(record[8], static_cast<std::byte>(storage::ChunkType::compressed));

    auto replica = Document{};
    replica.apply_changes({record});
    EXPECT_EQ(replica.get_text(p("body")).size(), 2000u);
}

TEST(Codec, get_changes_since_heads) {
    auto doc = Document{};
    doc.put_int(p("a"), 1);
    auto heads = doc.get_heads();
    doc.put_int(p("b"), 2);
    doc.put_int(p("c"), 3);

    auto newer = doc.get_changes(heads);
    ASSERT_EQ(newer.size(), 2u);
    EXPECT_TRUE(doc.get_changes(doc.get_heads()).empty());
}

TEST(Codec, change_history_exposes_metadata) {
    auto doc = Document{};
    doc.put_int(p("a"), 1);
    doc.put_int(p("b"), 2);
    auto history = doc.get_change_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].actor, doc.actor_id());
    EXPECT_EQ(history[0].seq, 1u);
    EXPECT_TRUE(history[0].deps.empty());
    EXPECT_EQ(history[1].seq, 2u);
    ASSERT_EQ(history[1].deps.size(), 1u);
    EXPECT_GT(history[1].timestamp, 0);
}
