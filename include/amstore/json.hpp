/// @file json.hpp
/// @brief nlohmann/json interoperability for amstore.
///
/// Provides ADL serialization of the scalar and identity types, and
/// export/import of whole documents as plain JSON.

#pragma once

#include <amstore/change.hpp>
#include <amstore/document.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace amstore {

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Counter& c);
void to_json(nlohmann::json& j, const Timestamp& t);

/// Tagged form: counters and timestamps become
/// {"__type": "counter"|"timestamp", "value": n} so they survive a round trip.
void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

void to_json(nlohmann::json& j, const ActorId& id);
void from_json(const nlohmann::json& j, ActorId& id);

void to_json(nlohmann::json& j, const ChangeHash& h);
void from_json(const nlohmann::json& j, ChangeHash& h);

/// Change metadata (actor, seq, deps, op count, ...), without the ops.
void to_json(nlohmann::json& j, const Change& c);

namespace json {

/// Export a document (or subtree) as plain JSON.
///
/// Maps become objects, lists become arrays and text objects become
/// strings. Counters become numbers and timestamps become ISO 8601 UTC
/// strings ("2024-01-02T03:04:05.678Z").
auto export_json(const Document& doc, const ObjId& obj = root) -> nlohmann::json;

/// export_json rendered as a string; indented by two spaces when pretty.
auto to_string(const Document& doc, bool pretty = false) -> std::string;

/// Write the members of a JSON object into the map `target`, as one
/// change. Strings become text objects; null becomes Null.
/// @throws Exception parse_error when j is not an object.
void import_json(Document& doc, const nlohmann::json& j, const ObjId& target = root);

/// As above, inside an existing transaction.
void import_json(Transaction& tx, const nlohmann::json& j, const ObjId& target = root);

/// Milliseconds since the Unix epoch as an ISO 8601 UTC string.
auto iso8601(std::int64_t millis_since_epoch) -> std::string;

}  // namespace json

}  // namespace amstore
