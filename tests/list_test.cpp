#include <amstore/document.hpp>
#include <amstore/error.hpp>

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

}  // namespace

// -- create_list --------------------------------------------------------------

TEST(CreateList, creates_empty_list_with_intermediates) {
    auto doc = Document{};
    doc.create_list(p("a.b.items"));
    EXPECT_EQ(doc.node_type(p("a.b.items")), NodeType::list);
    EXPECT_EQ(doc.list_len(p("a.b.items")), 0u);
    EXPECT_EQ(doc.num_changes(), 1u);
}

TEST(CreateList, existing_empty_list_is_left_alone) {
    auto doc = Document{};
    doc.create_list(p("items"));
    doc.create_list(p("items"));
    EXPECT_EQ(doc.num_changes(), 1u);
    EXPECT_FALSE(doc.last_change().has_value());
}

TEST(CreateList, refuses_to_overwrite_data) {
    auto doc = Document{};
    doc.create_list(p("items"));
    doc.append_int(p("items"), 1);
    doc.put_text(p("title"), "keep me");

    expect_kind(ErrorKind::type_mismatch, [&] { doc.create_list(p("items")); });
    expect_kind(ErrorKind::type_mismatch, [&] { doc.create_list(p("title")); });
    EXPECT_EQ(doc.list_len(p("items")), 1u);
    EXPECT_EQ(doc.get_text(p("title")), "keep me");
}

TEST(CreateList, nested_list_over_existing_element) {
    auto doc = Document{};
    doc.create_list(p("grid"));
    doc.append_int(p("grid"), 0);
    expect_kind(ErrorKind::type_mismatch, [&] { doc.create_list(p("grid[0]")); });

    doc.transact([&](Transaction& tx) {
        auto grid = *doc.get_obj_id(root, "grid");
        tx.delete_index(grid, 0);
    });
    EXPECT_EQ(doc.list_len(p("grid")), 0u);
    expect_kind(ErrorKind::range_error, [&] { doc.create_list(p("grid[0]")); });
}

// -- append_scalar ------------------------------------------------------------

TEST(AppendScalar, appends_in_order_with_each_type) {
    auto doc = Document{};
    doc.create_list(p("l"));
    doc.append_text(p("l"), "one");
    doc.append_int(p("l"), 2);
    doc.append_double(p("l"), 3.5);
    doc.append_bool(p("l"), false);
    doc.append_scalar(p("l"), Timestamp{123});

    EXPECT_EQ(doc.list_len(p("l")), 5u);
    EXPECT_EQ(doc.get_text(p("l[0]")), "one");
    EXPECT_EQ(doc.get_int(p("l[1]")), 2);
    EXPECT_DOUBLE_EQ(doc.get_double(p("l[2]")), 3.5);
    EXPECT_FALSE(doc.get_bool(p("l[3]")));
    EXPECT_EQ(doc.get_timestamp(p("l[4]")), 123);
    EXPECT_EQ(doc.num_changes(), 6u);
}

TEST(AppendScalar, missing_list_is_not_found) {
    auto doc = Document{};
    expect_kind(ErrorKind::not_found, [&] { doc.append_int(p("nope"), 1); });
    EXPECT_EQ(doc.num_changes(), 0u);
}

TEST(AppendScalar, non_list_is_type_mismatch) {
    auto doc = Document{};
    doc.put_int(p("n"), 1);
    doc.put_text(p("t"), "text");
    doc.put_int(p("m.x"), 1);
    expect_kind(ErrorKind::type_mismatch, [&] { doc.append_int(p("n"), 1); });
    expect_kind(ErrorKind::type_mismatch, [&] { doc.append_int(p("t"), 1); });
    expect_kind(ErrorKind::type_mismatch, [&] { doc.append_int(p("m"), 1); });
}

TEST(AppendScalar, nested_lists) {
    auto doc = Document{};
    doc.create_list(p("rows"));
    doc.transact([&](Transaction& tx) {
        auto rows = *doc.get_obj_id(root, "rows");
        tx.insert_object(rows, 0, ObjType::list);
    });
    doc.append_int(p("rows[0]"), 7);
    doc.append_int(p("rows[0]"), 8);
    EXPECT_EQ(doc.list_len(p("rows")), 1u);
    EXPECT_EQ(doc.list_len(p("rows[0]")), 2u);
    EXPECT_EQ(doc.get_int(p("rows[0][1]")), 8);
}

// -- Indexing -----------------------------------------------------------------

TEST(ListIndex, put_overwrites_existing_element) {
    auto doc = Document{};
    doc.create_list(p("l"));
    doc.append_int(p("l"), 1);
    doc.append_int(p("l"), 2);
    doc.put_text(p("l[1]"), "two");
    EXPECT_EQ(doc.list_len(p("l")), 2u);
    EXPECT_EQ(doc.get_text(p("l[1]")), "two");
}

TEST(ListIndex, put_past_end_is_range_error) {
    auto doc = Document{};
    doc.create_list(p("l"));
    doc.append_int(p("l"), 1);
    expect_kind(ErrorKind::range_error, [&] { doc.put_int(p("l[1]"), 2); });
    expect_kind(ErrorKind::not_found, [&] { (void)doc.get_int(p("l[1]")); });
}

TEST(ListIndex, list_len_type_checks) {
    auto doc = Document{};
    doc.put_int(p("n"), 1);
    expect_kind(ErrorKind::type_mismatch, [&] { (void)doc.list_len(p("n")); });
    expect_kind(ErrorKind::not_found, [&] { (void)doc.list_len(p("x")); });
    expect_kind(ErrorKind::type_mismatch, [&] { (void)doc.list_len(Path{}); });
}

// -- map_len ------------------------------------------------------------------

TEST(MapLen, counts_live_keys) {
    auto doc = Document{};
    doc.put_int(p("a"), 1);
    doc.put_int(p("m.x"), 1);
    doc.put_int(p("m.y"), 2);
    EXPECT_EQ(doc.map_len(Path{}), 2u);
    EXPECT_EQ(doc.map_len(p("m")), 2u);

    doc.transact([&](Transaction& tx) { tx.delete_key(*doc.get_obj_id(root, "m"), "x"); });
    EXPECT_EQ(doc.map_len(p("m")), 1u);
    expect_kind(ErrorKind::type_mismatch, [&] { (void)doc.map_len(p("a")); });
}

// -- Transaction-level list editing -------------------------------------------

TEST(ListTransaction, insert_delete_and_set) {
    auto doc = Document{};
    auto list = doc.transact([](Transaction& tx) {
        auto l = tx.put_object(root, "l", ObjType::list);
        tx.insert(l, 0, std::int64_t{1});
        tx.insert(l, 1, std::int64_t{3});
        tx.insert(l, 1, std::int64_t{2});
        return l;
    });
    EXPECT_EQ(doc.length(list), 3u);
    EXPECT_EQ(get_scalar<std::int64_t>(doc.get(list, std::size_t{1})), 2);

    doc.transact([&](Transaction& tx) {
        tx.delete_index(list, 0);
        tx.set(list, 0, std::int64_t{20});
    });
    EXPECT_EQ(doc.length(list), 2u);
    EXPECT_EQ(doc.get_int(p("l[0]")), 20);
    EXPECT_EQ(doc.get_int(p("l[1]")), 3);
}

TEST(ListTransaction, sequence_ops_reject_maps_and_text) {
    auto doc = Document{};
    doc.put_text(p("t"), "abc");
    auto text = *doc.get_obj_id(root, "t");
    expect_kind(ErrorKind::type_mismatch, [&] {
        doc.transact([&](Transaction& tx) { tx.insert(text, 0, true); });
    });
    expect_kind(ErrorKind::type_mismatch, [&] {
        doc.transact([&](Transaction& tx) { tx.insert(root, 0, true); });
    });
    EXPECT_EQ(doc.get_text(p("t")), "abc");
}
