#include <amstore/document.hpp>
#include <amstore/error.hpp>

#include "doc_state.hpp"
#include "navigator.hpp"
#include "text_diff.hpp"

#include <algorithm>
#include <cstring>
#include <random>

namespace amstore {

auto ActorId::random() -> ActorId {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto id = ActorId{};
    for (std::size_t i = 0; i < id.bytes.size(); i += sizeof(std::uint64_t)) {
        auto word = engine();
        std::memcpy(&id.bytes[i], &word, sizeof(word));
    }
    return id;
}

namespace {

auto quoted(const Path& path) -> std::string {
    return "'" + path.to_string() + "'";
}

auto mismatch(const Path& path, NodeType actual, std::string_view expected) -> Exception {
    return Exception{ErrorKind::type_mismatch,
        quoted(path) + " is a " + std::string{to_string_view(actual)} +
        ", expected a " + std::string{expected}};
}

}  // anonymous namespace

Document::Document()
    : Document{ActorId::random(), DocumentOptions{}} {}

Document::Document(DocumentOptions options)
    : Document{ActorId::random(), options} {}

Document::Document(ActorId actor, DocumentOptions options)
    : state_{std::make_unique<detail::DocState>()} {
    state_->actor = actor;
    state_->options = options;
}

Document::~Document() = default;

Document::Document(Document&& other) noexcept = default;

auto Document::operator=(Document&& other) noexcept -> Document& = default;

Document::Document(const Document& other)
    : state_{std::make_unique<detail::DocState>(*other.state_)} {}

auto Document::operator=(const Document& other) -> Document& {
    if (this != &other) {
        state_ = std::make_unique<detail::DocState>(*other.state_);
    }
    return *this;
}

auto Document::actor_id() const -> const ActorId& {
    return state_->actor;
}

auto Document::options() const -> const DocumentOptions& {
    return state_->options;
}

// -- Transactions -------------------------------------------------------------

void Document::mutate(const std::function<void(Transaction&)>& fn) {
    auto tx = Transaction{*state_};
    fn(tx);
    tx.commit();
}

void Document::transact(const std::function<void(Transaction&)>& fn) {
    auto backup = *state_;
    try {
        mutate(fn);
    } catch (...) {
        *state_ = std::move(backup);
        throw;
    }
}

// -- Typed scalar access ------------------------------------------------------

void Document::put_scalar(const Path& path, ScalarValue value) {
    auto plan = detail::Navigator{*state_}.plan_write(path);
    mutate([&](Transaction& tx) {
        auto obj = detail::Navigator::realize(tx, plan);
        std::visit(overload{
            [&](const MapKey& key) { tx.put(obj, key.name, std::move(value)); },
            [&](const ArrayIndex& idx) { tx.set(obj, idx.index, std::move(value)); },
        }, plan.terminal);
    });
}

auto Document::get_scalar(const Path& path, NodeType expected) const -> ScalarValue {
    if (expected == NodeType::map || expected == NodeType::list) {
        throw Exception{ErrorKind::type_mismatch,
            std::string{to_string_view(expected)} + " is not a scalar type"};
    }

    auto node = detail::Navigator{*state_}.find(path);
    auto actual = node_type_of(node.slot.value);
    if (actual != expected) throw mismatch(path, actual, to_string_view(expected));

    if (auto child = node.slot.child()) {
        return ScalarValue{state_->text_content(*child)};
    }
    return std::get<ScalarValue>(node.slot.value);
}

void Document::put_text(const Path& path, std::string_view value) {
    put_scalar(path, ScalarValue{std::string{value}});
}

void Document::put_int(const Path& path, std::int64_t value) {
    put_scalar(path, ScalarValue{value});
}

void Document::put_double(const Path& path, double value) {
    put_scalar(path, ScalarValue{value});
}

void Document::put_bool(const Path& path, bool value) {
    put_scalar(path, ScalarValue{value});
}

void Document::put_counter(const Path& path, std::int64_t value) {
    put_scalar(path, ScalarValue{Counter{value}});
}

void Document::put_timestamp(const Path& path, std::int64_t millis_since_epoch) {
    put_scalar(path, ScalarValue{Timestamp{millis_since_epoch}});
}

auto Document::get_text(const Path& path) const -> std::string {
    return std::get<std::string>(get_scalar(path, NodeType::text));
}

auto Document::get_int(const Path& path) const -> std::int64_t {
    return std::get<std::int64_t>(get_scalar(path, NodeType::integer));
}

auto Document::get_double(const Path& path) const -> double {
    return std::get<double>(get_scalar(path, NodeType::floating));
}

auto Document::get_bool(const Path& path) const -> bool {
    return std::get<bool>(get_scalar(path, NodeType::boolean));
}

auto Document::get_counter(const Path& path) const -> std::int64_t {
    return std::get<Counter>(get_scalar(path, NodeType::counter)).value;
}

auto Document::get_timestamp(const Path& path) const -> std::int64_t {
    return std::get<Timestamp>(get_scalar(path, NodeType::timestamp)).millis_since_epoch;
}

auto Document::node_type(const Path& path) const -> std::optional<NodeType> {
    if (path.empty()) return NodeType::map;
    try {
        return node_type_of(detail::Navigator{*state_}.find(path).slot.value);
    } catch (const Exception& e) {
        if (e.kind() == ErrorKind::not_found) return std::nullopt;
        throw;
    }
}

void Document::increment_counter(const Path& path, std::int64_t delta) {
    auto node = detail::Navigator{*state_}.find(path);
    auto actual = node_type_of(node.slot.value);
    if (actual != NodeType::counter) throw mismatch(path, actual, "counter");

    mutate([&](Transaction& tx) {
        std::visit(overload{
            [&](const MapKey& key) { tx.increment(node.parent, key.name, delta); },
            [&](const ArrayIndex& idx) { tx.increment(node.parent, idx.index, delta); },
        }, node.segment);
    });
}

// -- Lists and text -----------------------------------------------------------

namespace {

// The container at path, which must be of the given type.
auto resolve_container(const detail::DocState& state, const Path& path, ObjType type) -> ObjId {
    if (path.empty()) {
        if (type == ObjType::map) return root;
        throw Exception{ErrorKind::type_mismatch,
            "the root is a map, expected a " + std::string{to_string_view(type)}};
    }
    auto node = detail::Navigator{state}.find(path);
    auto child = node.slot.child();
    if (!child || state.object_type(*child) != type) {
        throw mismatch(path, node_type_of(node.slot.value), to_string_view(type));
    }
    return *child;
}

}  // anonymous namespace

void Document::create_list(const Path& path) {
    if (auto existing = node_type(path)) {
        if (*existing == NodeType::list) {
            auto list = resolve_container(*state_, path, ObjType::list);
            if (state_->list_length(list) == 0) {
                state_->last_local = std::nullopt;
                return;
            }
        }
        throw Exception{ErrorKind::type_mismatch,
            quoted(path) + " already holds a " +
            (*existing == NodeType::list ? std::string{"non-empty list"}
                                         : std::string{to_string_view(*existing)})};
    }

    auto plan = detail::Navigator{*state_}.plan_write(path);
    mutate([&](Transaction& tx) {
        auto obj = detail::Navigator::realize(tx, plan);
        std::visit(overload{
            [&](const MapKey& key) { tx.put_object(obj, key.name, ObjType::list); },
            [&](const ArrayIndex& idx) { tx.set_object(obj, idx.index, ObjType::list); },
        }, plan.terminal);
    });
}

void Document::append_scalar(const Path& path, ScalarValue value) {
    auto list = resolve_container(*state_, path, ObjType::list);
    mutate([&](Transaction& tx) {
        tx.insert(list, state_->list_length(list), std::move(value));
    });
}

void Document::append_text(const Path& path, std::string_view value) {
    append_scalar(path, ScalarValue{std::string{value}});
}

void Document::append_int(const Path& path, std::int64_t value) {
    append_scalar(path, ScalarValue{value});
}

void Document::append_double(const Path& path, double value) {
    append_scalar(path, ScalarValue{value});
}

void Document::append_bool(const Path& path, bool value) {
    append_scalar(path, ScalarValue{value});
}

auto Document::list_len(const Path& path) const -> std::size_t {
    return state_->list_length(resolve_container(*state_, path, ObjType::list));
}

auto Document::map_len(const Path& path) const -> std::size_t {
    return state_->map_keys(resolve_container(*state_, path, ObjType::map)).size();
}

void Document::splice_text(const Path& path, std::int64_t start, std::int64_t delete_count,
                           std::string_view insert) {
    auto text_obj = resolve_container(*state_, path, ObjType::text);
    auto length = static_cast<std::int64_t>(state_->list_length(text_obj));
    if (start < 0 || delete_count < 0 || start > length || delete_count > length - start) {
        throw Exception{ErrorKind::range_error,
            "splice of " + std::to_string(delete_count) + " at " + std::to_string(start) +
            " out of range for text of length " + std::to_string(length) + " at " + quoted(path)};
    }
    mutate([&](Transaction& tx) {
        tx.splice_text(text_obj, static_cast<std::size_t>(start),
                       static_cast<std::size_t>(delete_count), insert);
    });
}

void Document::put_diff(const Path& path, std::string_view diff) {
    auto text_obj = resolve_container(*state_, path, ObjType::text);
    auto pieces = state_->text_pieces(text_obj);
    auto updated = detail::apply_unified_diff(state_->text_content(text_obj), diff);
    auto splice = detail::minimal_splice(pieces, updated);
    mutate([&](Transaction& tx) {
        if (splice.del == 0 && splice.insert.empty()) return;
        tx.splice_text(text_obj, splice.pos, splice.del, splice.insert);
    });
}

// -- Object-level access ------------------------------------------------------

auto Document::object_type(const ObjId& obj) const -> std::optional<ObjType> {
    return state_->object_type(obj);
}

auto Document::keys(const ObjId& obj) const -> std::vector<std::string> {
    return state_->map_keys(obj);
}

auto Document::length(const ObjId& obj) const -> std::size_t {
    return state_->object_length(obj);
}

auto Document::get(const ObjId& obj, std::string_view key) const -> std::optional<Value> {
    auto slot = state_->map_get(obj, std::string{key});
    if (!slot) return std::nullopt;
    return slot->value;
}

auto Document::get_all(const ObjId& obj, std::string_view key) const -> std::vector<Value> {
    const auto* state = state_->get_object(obj);
    if (!state) return {};
    auto it = state->map_entries.find(std::string{key});
    if (it == state->map_entries.end()) return {};

    auto entries = it->second;
    std::ranges::sort(entries, [](const auto& a, const auto& b) { return a.op_id < b.op_id; });
    auto result = std::vector<Value>{};
    result.reserve(entries.size());
    for (auto& entry : entries) result.push_back(std::move(entry.value));
    return result;
}

auto Document::get(const ObjId& obj, std::size_t index) const -> std::optional<Value> {
    auto slot = state_->list_get(obj, index);
    if (!slot) return std::nullopt;
    return slot->value;
}

auto Document::get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId> {
    auto slot = state_->map_get(obj, std::string{key});
    if (!slot) return std::nullopt;
    return slot->child();
}

auto Document::get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId> {
    auto slot = state_->list_get(obj, index);
    if (!slot) return std::nullopt;
    return slot->child();
}

auto Document::text(const ObjId& obj) const -> std::string {
    return state_->text_content(obj);
}

}  // namespace amstore
