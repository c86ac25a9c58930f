// json_test.cpp: nlohmann/json export, import and value conversions

#include <amstore/amstore.hpp>
#include <amstore/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace am = amstore;
using json = nlohmann::json;

namespace {

auto p(std::string_view raw) -> am::Path { return am::Path::parse(raw); }

}  // namespace

// =============================================================================
// Export
// =============================================================================

TEST(JsonExport, empty_document_is_empty_object) {
    auto doc = am::Document{};
    EXPECT_EQ(am::json::export_json(doc), json::object());
    EXPECT_EQ(am::json::to_string(doc), "{}");
}

TEST(JsonExport, scalars_map_to_plain_json) {
    auto doc = am::Document{};
    doc.put_text(p("s"), "text");
    doc.put_int(p("i"), -4);
    doc.put_double(p("d"), 1.5);
    doc.put_bool(p("b"), false);
    doc.put_counter(p("c"), 12);
    doc.put_timestamp(p("t"), 1700000000123);
    doc.transact([](am::Transaction& tx) { tx.put(am::root, "n", am::Null{}); });

    auto j = am::json::export_json(doc);
    EXPECT_EQ(j["s"], "text");
    EXPECT_EQ(j["i"], -4);
    EXPECT_EQ(j["d"], 1.5);
    EXPECT_EQ(j["b"], false);
    EXPECT_EQ(j["c"], 12);
    EXPECT_EQ(j["t"], "2023-11-14T22:13:20.123Z");
    EXPECT_TRUE(j["n"].is_null());
}

TEST(JsonExport, nested_containers) {
    auto doc = am::Document{};
    doc.put_text(p("user.name"), "Ada");
    doc.create_list(p("user.langs"));
    doc.append_text(p("user.langs"), "en");
    doc.append_int(p("user.langs"), 7);

    auto expected = json{{"user", {{"name", "Ada"}, {"langs", {"en", 7}}}}};
    EXPECT_EQ(am::json::export_json(doc), expected);
}

TEST(JsonExport, subtree_export) {
    auto doc = am::Document{};
    doc.put_int(p("a.b.c"), 1);
    auto a = *doc.get_obj_id(am::root, "a");
    EXPECT_EQ(am::json::export_json(doc, a), (json{{"b", {{"c", 1}}}}));
}

TEST(JsonExport, pretty_printing) {
    auto doc = am::Document{};
    doc.put_int(p("x"), 1);
    EXPECT_EQ(am::json::to_string(doc, true), "{\n  \"x\": 1\n}");
}

// =============================================================================
// Import
// =============================================================================

TEST(JsonImport, builds_document_in_one_change) {
    auto doc = am::Document{};
    am::json::import_json(doc, json::parse(R"({
        "title": "Todo",
        "done": false,
        "count": 3,
        "ratio": 0.5,
        "items": [{"name": "milk"}, "eggs", [1, 2]],
        "nothing": null
    })"));

    EXPECT_EQ(doc.num_changes(), 1u);
    EXPECT_EQ(doc.get_text(p("title")), "Todo");
    EXPECT_FALSE(doc.get_bool(p("done")));
    EXPECT_EQ(doc.get_int(p("count")), 3);
    EXPECT_DOUBLE_EQ(doc.get_double(p("ratio")), 0.5);
    EXPECT_EQ(doc.list_len(p("items")), 3u);
    EXPECT_EQ(doc.get_text(p("items[0].name")), "milk");
    EXPECT_EQ(doc.get_text(p("items[1]")), "eggs");
    EXPECT_EQ(doc.get_int(p("items[2][1]")), 2);
    EXPECT_EQ(doc.node_type(p("nothing")), am::NodeType::null);
}

TEST(JsonImport, strings_become_editable_text) {
    auto doc = am::Document{};
    am::json::import_json(doc, json{{"note", "Hello World"}});
    doc.splice_text(p("note"), 6, 5, "Redis");
    EXPECT_EQ(doc.get_text(p("note")), "Hello Redis");
}

TEST(JsonImport, tagged_counter_and_timestamp) {
    auto doc = am::Document{};
    am::json::import_json(doc, json{
        {"hits", {{"__type", "counter"}, {"value", 5}}},
        {"at", {{"__type", "timestamp"}, {"value", 1000}}},
    });
    EXPECT_EQ(doc.get_counter(p("hits")), 5);
    EXPECT_EQ(doc.get_timestamp(p("at")), 1000);
}

TEST(JsonImport, into_existing_object) {
    auto doc = am::Document{};
    doc.put_int(p("cfg.keep"), 1);
    auto cfg = *doc.get_obj_id(am::root, "cfg");
    am::json::import_json(doc, json{{"added", true}}, cfg);
    EXPECT_EQ(doc.get_int(p("cfg.keep")), 1);
    EXPECT_TRUE(doc.get_bool(p("cfg.added")));
}

TEST(JsonImport, non_object_root_is_parse_error) {
    auto doc = am::Document{};
    try {
        am::json::import_json(doc, json::array({1, 2}));
        FAIL() << "expected parse_error";
    } catch (const am::Exception& e) {
        EXPECT_EQ(e.kind(), am::ErrorKind::parse_error);
    }
    EXPECT_EQ(doc.num_changes(), 0u);
}

TEST(JsonImport, export_of_import_is_identity_for_plain_json) {
    auto input = json::parse(R"({"a":[1,2,{"b":"c"}],"d":{"e":null,"f":2.5},"g":true})");
    auto doc = am::Document{};
    am::json::import_json(doc, input);
    EXPECT_EQ(am::json::export_json(doc), input);
}

// =============================================================================
// Value conversions
// =============================================================================

TEST(JsonValue, scalar_to_json) {
    EXPECT_EQ(json(am::ScalarValue{std::int64_t{5}}), 5);
    EXPECT_EQ(json(am::ScalarValue{std::string{"s"}}), "s");
    EXPECT_EQ(json(am::ScalarValue{am::Counter{2}}),
              (json{{"__type", "counter"}, {"value", 2}}));
    EXPECT_TRUE(json(am::ScalarValue{am::Null{}}).is_null());
}

TEST(JsonValue, json_to_scalar) {
    EXPECT_EQ(json(true).get<am::ScalarValue>(), am::ScalarValue{true});
    EXPECT_EQ(json(-3).get<am::ScalarValue>(), am::ScalarValue{std::int64_t{-3}});
    EXPECT_EQ(json(2.5).get<am::ScalarValue>(), am::ScalarValue{2.5});
    EXPECT_EQ(json(nullptr).get<am::ScalarValue>(), am::ScalarValue{am::Null{}});
}

TEST(JsonValue, huge_unsigned_becomes_double) {
    auto big = json(std::numeric_limits<std::uint64_t>::max());
    auto sv = big.get<am::ScalarValue>();
    ASSERT_TRUE(std::holds_alternative<double>(sv));
    EXPECT_DOUBLE_EQ(std::get<double>(sv), 18446744073709551615.0);
}

TEST(JsonValue, ids_as_hex) {
    auto actor = am::ActorId{};
    actor.bytes[0] = std::byte{0xAB};
    auto j = json(actor);
    EXPECT_EQ(j, actor.to_hex());
    EXPECT_EQ(j.get<am::ActorId>(), actor);

    EXPECT_THROW((void)json("xyz").get<am::ActorId>(), am::Exception);
    EXPECT_THROW((void)json(std::string(64, 'g')).get<am::ChangeHash>(), am::Exception);
}

TEST(JsonValue, change_metadata) {
    auto doc = am::Document{};
    doc.transact([](am::Transaction& tx) {
        tx.put(am::root, "a", std::int64_t{1});
        tx.set_message("first");
    });
    auto j = json(doc.get_change_history().front());
    EXPECT_EQ(j["actor"], doc.actor_id().to_hex());
    EXPECT_EQ(j["seq"], 1);
    EXPECT_EQ(j["ops"], 1);
    EXPECT_EQ(j["message"], "first");
    EXPECT_TRUE(j["deps"].empty());
}

// =============================================================================
// ISO 8601
// =============================================================================

TEST(Iso8601, epoch_and_millis) {
    EXPECT_EQ(am::json::iso8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(am::json::iso8601(1700000000123), "2023-11-14T22:13:20.123Z");
}

TEST(Iso8601, before_epoch) {
    EXPECT_EQ(am::json::iso8601(-1), "1969-12-31T23:59:59.999Z");
}
