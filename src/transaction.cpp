#include <amstore/transaction.hpp>

#include <amstore/error.hpp>

#include "doc_state.hpp"
#include "encoding/utf8.hpp"
#include "storage/change_chunk.hpp"

#include <chrono>
#include <utility>

namespace amstore {

namespace {

auto describe(ObjType type) -> std::string {
    return std::string{to_string_view(type)};
}

auto index_error(std::size_t index, std::size_t length) -> Exception {
    return Exception{ErrorKind::range_error,
        "index " + std::to_string(index) + " out of range for length " + std::to_string(length)};
}

auto now_millis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // anonymous namespace

Transaction::Transaction(detail::DocState& state)
    : state_{state}, start_op_{state.next_counter} {}

void Transaction::record(Op op) {
    state_.apply_op(op);
    pending_ops_.push_back(std::move(op));
}

void Transaction::require_type(const ObjId& obj, ObjType type) const {
    auto actual = state_.object_type(obj);
    if (!actual) throw Exception{ErrorKind::not_found, "unknown object"};
    if (*actual != type) {
        throw Exception{ErrorKind::type_mismatch,
            "object is a " + describe(*actual) + ", expected a " + describe(type)};
    }
}

void Transaction::require_sequence(const ObjId& obj) const {
    auto actual = state_.object_type(obj);
    if (!actual) throw Exception{ErrorKind::not_found, "unknown object"};
    if (*actual == ObjType::map) {
        throw Exception{ErrorKind::type_mismatch, "object is a map, expected a list"};
    }
    if (*actual == ObjType::text) {
        throw Exception{ErrorKind::type_mismatch, "object is text, use splice_text"};
    }
}

// -- Map operations -----------------------------------------------------------

void Transaction::put(const ObjId& obj, std::string_view key, ScalarValue val) {
    if (auto* s = std::get_if<std::string>(&val)) {
        put_text(obj, key, *s);
        return;
    }
    require_type(obj, ObjType::map);
    auto k = std::string{key};
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = k,
        .action = OpType::put,
        .value = Value{std::move(val)},
        .pred = state_.map_pred(obj, k),
    });
}

auto Transaction::put_object(const ObjId& obj, std::string_view key, ObjType type) -> ObjId {
    require_type(obj, ObjType::map);
    auto k = std::string{key};
    auto op_id = state_.next_op_id();
    record(Op{
        .id = op_id,
        .obj = obj,
        .key = k,
        .action = OpType::make_object,
        .value = Value{type},
        .pred = state_.map_pred(obj, k),
    });
    return ObjId{op_id};
}

auto Transaction::put_text(const ObjId& obj, std::string_view key, std::string_view text) -> ObjId {
    auto text_obj = put_object(obj, key, ObjType::text);
    fill_text(text_obj, text);
    return text_obj;
}

void Transaction::delete_key(const ObjId& obj, std::string_view key) {
    require_type(obj, ObjType::map);
    auto k = std::string{key};
    auto pred = state_.map_pred(obj, k);
    if (pred.empty()) return;
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = k,
        .action = OpType::del,
        .value = Value{ScalarValue{Null{}}},
        .pred = std::move(pred),
    });
}

// -- List operations ----------------------------------------------------------

void Transaction::insert_value(const ObjId& obj, std::size_t index, Value value) {
    require_sequence(obj);
    auto length = state_.list_length(obj);
    if (index > length) throw index_error(index, length);
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = index,
        .action = OpType::insert,
        .value = std::move(value),
        .pred = {},
        .insert_after = state_.insert_after_for(obj, index),
    });
}

void Transaction::insert(const ObjId& obj, std::size_t index, ScalarValue val) {
    if (auto* s = std::get_if<std::string>(&val)) {
        insert_text(obj, index, *s);
        return;
    }
    insert_value(obj, index, Value{std::move(val)});
}

auto Transaction::insert_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId {
    auto op_id = OpId{state_.next_counter, state_.actor};
    insert_value(obj, index, Value{type});
    return ObjId{op_id};
}

auto Transaction::insert_text(const ObjId& obj, std::size_t index, std::string_view text) -> ObjId {
    auto text_obj = insert_object(obj, index, ObjType::text);
    fill_text(text_obj, text);
    return text_obj;
}

void Transaction::overwrite(const ObjId& obj, std::size_t index, Value value) {
    require_sequence(obj);
    const auto* elem = state_.list_element(obj, index);
    if (!elem) throw index_error(index, state_.list_length(obj));
    auto action = is_object(value) ? OpType::make_object : OpType::put;
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = index,
        .action = action,
        .value = std::move(value),
        .pred = {elem->insert_id},
    });
}

void Transaction::set(const ObjId& obj, std::size_t index, ScalarValue val) {
    if (auto* s = std::get_if<std::string>(&val)) {
        set_text(obj, index, *s);
        return;
    }
    overwrite(obj, index, Value{std::move(val)});
}

auto Transaction::set_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId {
    auto op_id = OpId{state_.next_counter, state_.actor};
    overwrite(obj, index, Value{type});
    return ObjId{op_id};
}

auto Transaction::set_text(const ObjId& obj, std::size_t index, std::string_view text) -> ObjId {
    auto text_obj = set_object(obj, index, ObjType::text);
    fill_text(text_obj, text);
    return text_obj;
}

void Transaction::delete_index(const ObjId& obj, std::size_t index) {
    require_sequence(obj);
    const auto* elem = state_.list_element(obj, index);
    if (!elem) throw index_error(index, state_.list_length(obj));
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = index,
        .action = OpType::del,
        .value = Value{ScalarValue{Null{}}},
        .pred = {elem->insert_id},
    });
}

// -- Text operations ----------------------------------------------------------

void Transaction::fill_text(const ObjId& text_obj, std::string_view text) {
    splice_text(text_obj, 0, 0, text);
}

void Transaction::splice_text(const ObjId& obj, std::size_t pos, std::size_t del,
                              std::string_view text) {
    require_type(obj, ObjType::text);
    auto length = state_.list_length(obj);
    if (pos > length || del > length - pos) {
        throw Exception{ErrorKind::range_error,
            "splice of " + std::to_string(del) + " at " + std::to_string(pos) +
            " out of range for length " + std::to_string(length)};
    }

    for (std::size_t i = 0; i < del; ++i) {
        const auto* elem = state_.list_element(obj, pos);
        record(Op{
            .id = state_.next_op_id(),
            .obj = obj,
            .key = pos,
            .action = OpType::del,
            .value = Value{ScalarValue{Null{}}},
            .pred = {elem->insert_id},
        });
    }

    auto after = state_.insert_after_for(obj, pos);
    auto index = pos;
    for (auto& code_point : encoding::split_code_points(text)) {
        auto op_id = state_.next_op_id();
        record(Op{
            .id = op_id,
            .obj = obj,
            .key = index++,
            .action = OpType::insert,
            .value = Value{ScalarValue{std::move(code_point)}},
            .pred = {},
            .insert_after = after,
        });
        after = op_id;
    }
}

// -- Counters -----------------------------------------------------------------

void Transaction::increment(const ObjId& obj, std::string_view key, std::int64_t delta) {
    require_type(obj, ObjType::map);
    auto k = std::string{key};
    auto slot = state_.map_get(obj, k);
    if (!slot) throw Exception{ErrorKind::not_found, "no value at key '" + k + "'"};
    if (!get_scalar<Counter>(slot->value)) {
        throw Exception{ErrorKind::type_mismatch,
            "value at key '" + k + "' is a " +
            std::string{to_string_view(node_type_of(slot->value))} + ", expected a counter"};
    }
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = k,
        .action = OpType::increment,
        .value = Value{ScalarValue{Counter{delta}}},
        .pred = state_.map_pred(obj, k),
    });
}

void Transaction::increment(const ObjId& obj, std::size_t index, std::int64_t delta) {
    require_sequence(obj);
    const auto* elem = state_.list_element(obj, index);
    if (!elem) throw index_error(index, state_.list_length(obj));
    if (!get_scalar<Counter>(elem->value)) {
        throw Exception{ErrorKind::type_mismatch,
            "element " + std::to_string(index) + " is a " +
            std::string{to_string_view(node_type_of(elem->value))} + ", expected a counter"};
    }
    record(Op{
        .id = state_.next_op_id(),
        .obj = obj,
        .key = index,
        .action = OpType::increment,
        .value = Value{ScalarValue{Counter{delta}}},
        .pred = {elem->insert_id, elem->value_id},
    });
}

void Transaction::set_message(std::string message) {
    message_ = std::move(message);
}

// -- Commit -------------------------------------------------------------------

void Transaction::commit() {
    if (pending_ops_.empty()) {
        state_.last_local = std::nullopt;
        return;
    }

    auto seq = std::uint64_t{1};
    if (auto it = state_.clock.find(state_.actor); it != state_.clock.end()) seq = it->second + 1;

    auto change = Change{
        .actor = state_.actor,
        .seq = seq,
        .start_op = start_op_,
        .timestamp = now_millis(),
        .message = std::move(message_),
        .deps = state_.heads,
        .operations = std::move(pending_ops_),
    };
    pending_ops_.clear();

    auto encoded = storage::encode_change(change, state_.options.compression_threshold);
    state_.add_to_history(detail::ChangeRecord{
        .change = std::move(change),
        .hash = encoded.hash,
        .bytes = std::move(encoded.bytes),
    });
    state_.last_local = state_.history.size() - 1;
}

}  // namespace amstore
