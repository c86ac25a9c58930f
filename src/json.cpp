#include <amstore/json.hpp>

#include <amstore/error.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

namespace amstore {

namespace {

auto hex_char_to_nibble(char c) -> std::byte {
    if (c >= '0' && c <= '9') return std::byte(c - '0');
    if (c >= 'a' && c <= 'f') return std::byte(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return std::byte(c - 'A' + 10);
    throw Exception{ErrorKind::parse_error, "invalid hex character '" + std::string(1, c) + "'"};
}

template <std::size_t N>
void hex_to_bytes(std::string_view hex, std::array<std::byte, N>& out) {
    if (hex.size() != N * 2) {
        throw Exception{ErrorKind::parse_error,
            "expected " + std::to_string(N * 2) + " hex digits, got " + std::to_string(hex.size())};
    }
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = (hex_char_to_nibble(hex[i * 2]) << 4) | hex_char_to_nibble(hex[i * 2 + 1]);
    }
}

}  // anonymous namespace

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Counter& c) {
    j = nlohmann::json{{"__type", "counter"}, {"value", c.value}};
}

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = nlohmann::json{{"__type", "timestamp"}, {"value", t.millis_since_epoch}};
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const Counter& c) { to_json(j, c); },
        [&](const Timestamp& t) { to_json(j, t); },
        [&](const std::string& s) { j = s; },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_object() && j.contains("__type") && j.contains("value")) {
        if (!j["__type"].is_string() || !j["value"].is_number_integer()) {
            throw Exception{ErrorKind::parse_error, "malformed tagged value " + j.dump()};
        }
        auto type = j["__type"].get<std::string>();
        if (type == "counter") {
            sv = Counter{j["value"].get<std::int64_t>()};
            return;
        }
        if (type == "timestamp") {
            sv = Timestamp{j["value"].get<std::int64_t>()};
            return;
        }
    }
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sv = static_cast<std::int64_t>(val);
        } else {
            sv = static_cast<double>(val);
        }
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw Exception{ErrorKind::parse_error, "cannot convert JSON " +
                                                    std::string{j.type_name()} + " to a scalar"};
    }
}

void to_json(nlohmann::json& j, const ActorId& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, ActorId& id) {
    hex_to_bytes(j.get<std::string>(), id.bytes);
}

void to_json(nlohmann::json& j, const ChangeHash& h) {
    j = h.to_hex();
}

void from_json(const nlohmann::json& j, ChangeHash& h) {
    hex_to_bytes(j.get<std::string>(), h.bytes);
}

void to_json(nlohmann::json& j, const Change& c) {
    j = nlohmann::json{
        {"actor", c.actor},
        {"seq", c.seq},
        {"start_op", c.start_op},
        {"timestamp", c.timestamp},
        {"deps", c.deps},
        {"ops", c.operations.size()},
    };
    if (c.message) {
        j["message"] = *c.message;
    }
}

namespace json {

auto iso8601(std::int64_t millis_since_epoch) -> std::string {
    using namespace std::chrono;
    const auto tp = sys_time<milliseconds>{milliseconds{millis_since_epoch}};
    const auto day = floor<days>(tp);
    const auto ymd = year_month_day{day};
    const auto tod = hh_mm_ss{tp - day};

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<int>(tod.subseconds().count()));
    return buf;
}

// -- Export -------------------------------------------------------------------

namespace {

auto export_object(const Document& doc, const ObjId& obj) -> nlohmann::json;

auto export_value(const Document& doc, const Value& val, const ObjId& parent, const Prop& prop)
    -> nlohmann::json {
    return std::visit(overload{
        [&](ObjType) -> nlohmann::json {
            auto child = std::visit(overload{
                [&](const std::string& key) { return doc.get_obj_id(parent, key); },
                [&](std::size_t index) { return doc.get_obj_id(parent, index); },
            }, prop);
            if (child) return export_object(doc, *child);
            return nlohmann::json{};
        },
        [](const ScalarValue& sv) -> nlohmann::json {
            return std::visit(overload{
                [](Null) -> nlohmann::json { return nullptr; },
                [](bool b) -> nlohmann::json { return b; },
                [](std::int64_t i) -> nlohmann::json { return i; },
                [](double d) -> nlohmann::json { return d; },
                [](const Counter& c) -> nlohmann::json { return c.value; },
                [](const Timestamp& t) -> nlohmann::json { return iso8601(t.millis_since_epoch); },
                [](const std::string& s) -> nlohmann::json { return s; },
            }, sv);
        },
    }, val);
}

auto export_object(const Document& doc, const ObjId& obj) -> nlohmann::json {
    auto type = doc.object_type(obj);
    if (!type) return nlohmann::json{};

    if (*type == ObjType::text) {
        return nlohmann::json(doc.text(obj));
    }

    if (*type == ObjType::map) {
        auto result = nlohmann::json::object();
        for (const auto& key : doc.keys(obj)) {
            if (auto val = doc.get(obj, key)) {
                result[key] = export_value(doc, *val, obj, Prop{key});
            }
        }
        return result;
    }

    auto result = nlohmann::json::array();
    auto len = doc.length(obj);
    for (std::size_t i = 0; i < len; ++i) {
        if (auto val = doc.get(obj, i)) {
            result.push_back(export_value(doc, *val, obj, Prop{i}));
        }
    }
    return result;
}

}  // anonymous namespace

auto export_json(const Document& doc, const ObjId& obj) -> nlohmann::json {
    return export_object(doc, obj);
}

auto to_string(const Document& doc, bool pretty) -> std::string {
    return export_json(doc).dump(pretty ? 2 : -1);
}

// -- Import -------------------------------------------------------------------

namespace {

// {"__type": "counter" | "timestamp", "value": n} is a scalar, not a map.
auto is_tagged_scalar(const nlohmann::json& val) -> bool {
    if (!val.is_object() || val.size() != 2) return false;
    auto type = val.find("__type");
    if (type == val.end() || !val.contains("value")) return false;
    return *type == "counter" || *type == "timestamp";
}

void import_at_key(Transaction& tx, const ObjId& obj, std::string_view key,
                   const nlohmann::json& val);
void import_at_index(Transaction& tx, const ObjId& obj, std::size_t index,
                     const nlohmann::json& val);

void import_at_key(Transaction& tx, const ObjId& obj, std::string_view key,
                   const nlohmann::json& val) {
    if (val.is_object() && !is_tagged_scalar(val)) {
        auto child = tx.put_object(obj, key, ObjType::map);
        for (auto& [k, v] : val.items()) {
            import_at_key(tx, child, k, v);
        }
    } else if (val.is_array()) {
        auto child = tx.put_object(obj, key, ObjType::list);
        for (std::size_t i = 0; i < val.size(); ++i) {
            import_at_index(tx, child, i, val[i]);
        }
    } else {
        tx.put(obj, key, val.get<ScalarValue>());
    }
}

void import_at_index(Transaction& tx, const ObjId& obj, std::size_t index,
                     const nlohmann::json& val) {
    if (val.is_object() && !is_tagged_scalar(val)) {
        auto child = tx.insert_object(obj, index, ObjType::map);
        for (auto& [k, v] : val.items()) {
            import_at_key(tx, child, k, v);
        }
    } else if (val.is_array()) {
        auto child = tx.insert_object(obj, index, ObjType::list);
        for (std::size_t i = 0; i < val.size(); ++i) {
            import_at_index(tx, child, i, val[i]);
        }
    } else {
        tx.insert(obj, index, val.get<ScalarValue>());
    }
}

}  // anonymous namespace

void import_json(Document& doc, const nlohmann::json& j, const ObjId& target) {
    doc.transact([&](Transaction& tx) {
        import_json(tx, j, target);
    });
}

void import_json(Transaction& tx, const nlohmann::json& j, const ObjId& target) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::parse_error,
            "expected a JSON object, got " + std::string{j.type_name()}};
    }
    for (auto& [key, val] : j.items()) {
        import_at_key(tx, target, key, val);
    }
}

}  // namespace json

}  // namespace amstore
