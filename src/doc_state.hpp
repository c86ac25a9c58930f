#pragma once

// Internal header, not installed. Implementation detail of Document.

#include <amstore/change.hpp>
#include <amstore/op.hpp>
#include <amstore/options.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace amstore::detail {

// An entry at a map key. Several entries at one key = concurrent conflict;
// the highest op id wins reads.
struct MapEntry {
    OpId op_id;
    Value value;
};

// An element of a list or text. Deleted elements stay as tombstones so
// later inserts can still find their origin.
struct ListElement {
    OpId insert_id;
    std::optional<OpId> insert_after;  // nullopt = head
    OpId value_id;                     // op that wrote the current value
    Value value;
    bool visible = true;
};

struct ObjectState {
    ObjType type;
    std::map<std::string, std::vector<MapEntry>> map_entries;
    std::vector<ListElement> list_elements;
};

// An applied change together with its hash and encoded record.
struct ChangeRecord {
    Change change;
    ChangeHash hash;
    std::vector<std::byte> bytes;
};

// The value at a map key or list position, with the id of the op that
// wrote it. A container value's ObjId is ObjId{value_id}.
struct Slot {
    OpId value_id;
    Value value;

    auto child() const -> std::optional<ObjId> {
        if (is_object(value)) return ObjId{value_id};
        return std::nullopt;
    }
};

struct DocState {
    ActorId actor;
    DocumentOptions options;
    std::uint64_t next_counter = 1;
    std::map<ObjId, ObjectState> objects;

    // The causal history is an arena owned here; records reference
    // their dependencies by hash, resolved through history_index.
    std::vector<ChangeRecord> history;
    std::unordered_map<ChangeHash, std::size_t> history_index;
    std::vector<ChangeHash> heads;  // sorted
    std::map<ActorId, std::uint64_t> clock;

    // Received records whose dependencies have not all arrived.
    std::vector<ChangeRecord> pending;

    // History index of the record made by the last local mutating call.
    std::optional<std::size_t> last_local;

    DocState() {
        objects[root] = ObjectState{.type = ObjType::map, .map_entries = {}, .list_elements = {}};
    }

    auto next_op_id() -> OpId {
        return OpId{next_counter++, actor};
    }

    auto get_object(const ObjId& id) -> ObjectState* {
        auto it = objects.find(id);
        return it != objects.end() ? &it->second : nullptr;
    }

    auto get_object(const ObjId& id) const -> const ObjectState* {
        auto it = objects.find(id);
        return it != objects.end() ? &it->second : nullptr;
    }

    auto object_type(const ObjId& obj) const -> std::optional<ObjType> {
        const auto* state = get_object(obj);
        if (!state) return std::nullopt;
        return state->type;
    }

    // -- Map reads ------------------------------------------------------------

    auto map_get(const ObjId& obj, const std::string& key) const -> std::optional<Slot> {
        const auto* state = get_object(obj);
        if (!state) return std::nullopt;
        auto it = state->map_entries.find(key);
        if (it == state->map_entries.end() || it->second.empty()) return std::nullopt;
        auto winner = std::ranges::max_element(it->second,
            [](const MapEntry& a, const MapEntry& b) { return a.op_id < b.op_id; });
        return Slot{.value_id = winner->op_id, .value = winner->value};
    }

    auto map_pred(const ObjId& obj, const std::string& key) const -> std::vector<OpId> {
        const auto* state = get_object(obj);
        if (!state) return {};
        auto it = state->map_entries.find(key);
        if (it == state->map_entries.end()) return {};
        auto result = std::vector<OpId>{};
        result.reserve(it->second.size());
        std::ranges::transform(it->second, std::back_inserter(result), &MapEntry::op_id);
        return result;
    }

    auto map_keys(const ObjId& obj) const -> std::vector<std::string> {
        const auto* state = get_object(obj);
        if (!state) return {};
        auto result = std::vector<std::string>{};
        result.reserve(state->map_entries.size());
        for (const auto& [key, entries] : state->map_entries) {
            if (!entries.empty()) result.push_back(key);
        }
        return result;
    }

    // -- Sequence reads -------------------------------------------------------

    // Position in list_elements of the index-th visible element, or
    // list_elements.size() when there is none.
    static auto visible_index_to_real(const ObjectState& state, std::size_t index) -> std::size_t {
        auto visible_count = std::size_t{0};
        for (std::size_t i = 0; i < state.list_elements.size(); ++i) {
            if (state.list_elements[i].visible) {
                if (visible_count == index) return i;
                ++visible_count;
            }
        }
        return state.list_elements.size();
    }

    auto list_element(const ObjId& obj, std::size_t index) const -> const ListElement* {
        const auto* state = get_object(obj);
        if (!state) return nullptr;
        auto real_idx = visible_index_to_real(*state, index);
        if (real_idx >= state->list_elements.size()) return nullptr;
        return &state->list_elements[real_idx];
    }

    auto list_get(const ObjId& obj, std::size_t index) const -> std::optional<Slot> {
        const auto* elem = list_element(obj, index);
        if (!elem) return std::nullopt;
        return Slot{.value_id = elem->value_id, .value = elem->value};
    }

    auto list_length(const ObjId& obj) const -> std::size_t {
        const auto* state = get_object(obj);
        if (!state) return 0;
        return static_cast<std::size_t>(std::ranges::count_if(
            state->list_elements, &ListElement::visible));
    }

    // The element a new element at visible_index goes after.
    auto insert_after_for(const ObjId& obj, std::size_t visible_index) const -> std::optional<OpId> {
        if (visible_index == 0) return std::nullopt;
        const auto* elem = list_element(obj, visible_index - 1);
        if (!elem) return std::nullopt;
        return elem->insert_id;
    }

    auto text_content(const ObjId& obj) const -> std::string {
        const auto* state = get_object(obj);
        if (!state) return {};
        auto result = std::string{};
        for (const auto& elem : state->list_elements) {
            if (!elem.visible) continue;
            if (auto s = get_scalar<std::string>(elem.value)) result += *s;
        }
        return result;
    }

    // The visible elements of a text object as stored, one string each.
    auto text_pieces(const ObjId& obj) const -> std::vector<std::string> {
        const auto* state = get_object(obj);
        if (!state) return {};
        auto pieces = std::vector<std::string>{};
        for (const auto& elem : state->list_elements) {
            if (!elem.visible) continue;
            auto s = get_scalar<std::string>(elem.value);
            pieces.push_back(s ? *s : std::string{});
        }
        return pieces;
    }

    auto object_length(const ObjId& obj) const -> std::size_t {
        const auto* state = get_object(obj);
        if (!state) return 0;
        if (state->type == ObjType::map) return map_keys(obj).size();
        return list_length(obj);
    }

    // -- RGA integration ------------------------------------------------------

    // Where a new element goes: right of its origin, after any sibling
    // with a higher id (and that sibling's descendants).
    static auto find_rga_position(const ObjectState& state, std::optional<OpId> insert_after,
                                  OpId new_id) -> std::size_t {
        std::size_t pos = 0;

        if (insert_after) {
            auto it = std::ranges::find(state.list_elements, *insert_after, &ListElement::insert_id);
            if (it == state.list_elements.end()) return state.list_elements.size();
            pos = static_cast<std::size_t>(it - state.list_elements.begin()) + 1;
        }

        auto scanned = std::unordered_set<OpId>{};
        if (insert_after) scanned.insert(*insert_after);

        while (pos < state.list_elements.size()) {
            const auto& elem = state.list_elements[pos];
            const bool same_origin = (elem.insert_after == insert_after);
            const bool in_subtree = !same_origin && elem.insert_after &&
                                    scanned.contains(*elem.insert_after);

            if (same_origin && elem.insert_id > new_id) {
                scanned.insert(elem.insert_id);
                ++pos;
            } else if (in_subtree) {
                scanned.insert(elem.insert_id);
                ++pos;
            } else {
                break;
            }
        }
        return pos;
    }

    // -- Applying operations --------------------------------------------------

    // Apply one op. Local edits and received changes both go through
    // here, so every replica integrates an op the same way.
    void apply_op(const Op& op) {
        next_counter = std::max(next_counter, op.id.counter + 1);

        auto* obj_state = get_object(op.obj);
        if (!obj_state) return;

        if (std::holds_alternative<ObjType>(op.value) &&
            (op.action == OpType::make_object || op.action == OpType::insert)) {
            objects.try_emplace(ObjId{op.id},
                ObjectState{.type = std::get<ObjType>(op.value), .map_entries = {}, .list_elements = {}});
        }

        auto in_pred = [&](const OpId& id) {
            return std::ranges::find(op.pred, id) != op.pred.end();
        };
        auto target_element = [&]() -> ListElement* {
            auto it = std::ranges::find_if(obj_state->list_elements,
                [&](const ListElement& e) { return in_pred(e.insert_id); });
            return it != obj_state->list_elements.end() ? &*it : nullptr;
        };

        const auto* key = std::get_if<std::string>(&op.key);
        const bool is_map = obj_state->type == ObjType::map;
        if (is_map && !key) return;

        switch (op.action) {
            case OpType::put:
            case OpType::make_object: {
                if (is_map) {
                    auto& entries = obj_state->map_entries[*key];
                    std::erase_if(entries, [&](const MapEntry& e) { return in_pred(e.op_id); });
                    entries.push_back(MapEntry{.op_id = op.id, .value = op.value});
                } else if (auto* elem = target_element(); elem && op.id > elem->value_id) {
                    elem->value = op.value;
                    elem->value_id = op.id;
                }
                break;
            }
            case OpType::insert: {
                if (is_map) break;
                auto pos = find_rga_position(*obj_state, op.insert_after, op.id);
                obj_state->list_elements.insert(
                    obj_state->list_elements.begin() + static_cast<std::ptrdiff_t>(pos),
                    ListElement{.insert_id = op.id, .insert_after = op.insert_after,
                                .value_id = op.id, .value = op.value, .visible = true});
                break;
            }
            case OpType::del: {
                if (is_map) {
                    auto it = obj_state->map_entries.find(*key);
                    if (it == obj_state->map_entries.end()) break;
                    std::erase_if(it->second, [&](const MapEntry& e) { return in_pred(e.op_id); });
                    if (it->second.empty()) obj_state->map_entries.erase(it);
                } else if (auto* elem = target_element()) {
                    elem->visible = false;
                }
                break;
            }
            case OpType::increment: {
                auto delta = get_scalar<Counter>(op.value);
                if (!delta) break;
                auto bump = [&](Value& v) {
                    if (auto* sv = std::get_if<ScalarValue>(&v)) {
                        if (auto* c = std::get_if<Counter>(sv)) c->value += delta->value;
                    }
                };
                if (is_map) {
                    auto it = obj_state->map_entries.find(*key);
                    if (it == obj_state->map_entries.end()) break;
                    for (auto& entry : it->second) {
                        if (in_pred(entry.op_id)) bump(entry.value);
                    }
                } else if (auto* elem = target_element(); elem && in_pred(elem->value_id)) {
                    bump(elem->value);
                }
                break;
            }
        }
    }

    // -- History --------------------------------------------------------------

    auto has_change(const ChangeHash& hash) const -> bool {
        return history_index.contains(hash);
    }

    auto deps_satisfied(const Change& change) const -> bool {
        return std::ranges::all_of(change.deps,
            [&](const ChangeHash& d) { return has_change(d); });
    }

    // Record a change whose ops have already been applied.
    void add_to_history(ChangeRecord record) {
        auto& seq = clock[record.change.actor];
        seq = std::max(seq, record.change.seq);

        std::erase_if(heads, [&](const ChangeHash& h) {
            return std::ranges::find(record.change.deps, h) != record.change.deps.end();
        });
        heads.insert(std::ranges::upper_bound(heads, record.hash), record.hash);

        history_index.emplace(record.hash, history.size());
        history.push_back(std::move(record));
    }

    // Apply a received change whose dependencies are all present.
    void integrate(ChangeRecord record) {
        for (const auto& op : record.change.operations) {
            apply_op(op);
        }
        add_to_history(std::move(record));
    }

    // Hashes of every change reachable from the given heads.
    auto ancestors_of(const std::vector<ChangeHash>& from) const -> std::unordered_set<ChangeHash> {
        auto seen = std::unordered_set<ChangeHash>{};
        auto stack = std::vector<ChangeHash>{};
        for (const auto& h : from) {
            if (has_change(h)) stack.push_back(h);
        }
        while (!stack.empty()) {
            auto h = stack.back();
            stack.pop_back();
            if (!seen.insert(h).second) continue;
            for (const auto& dep : history[history_index.at(h)].change.deps) {
                if (!seen.contains(dep)) stack.push_back(dep);
            }
        }
        return seen;
    }
};

}  // namespace amstore::detail
