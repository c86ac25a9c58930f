#include <amstore/document.hpp>
#include <amstore/error.hpp>
#include <amstore/log.hpp>

#include "doc_state.hpp"
#include "storage/change_chunk.hpp"
#include "storage/snapshot.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace amstore {

namespace {

auto decode_record(std::span<const std::byte> bytes) -> std::optional<detail::ChangeRecord> {
    auto decoded = storage::decode_change(bytes);
    if (!decoded) return std::nullopt;
    return detail::ChangeRecord{
        .change = std::move(decoded->change),
        .hash = decoded->hash,
        .bytes = std::vector<std::byte>(bytes.begin(), bytes.end()),
    };
}

auto expected_seq(const std::map<ActorId, std::uint64_t>& clock, const ActorId& actor)
    -> std::uint64_t {
    auto it = clock.find(actor);
    return it == clock.end() ? 1 : it->second + 1;
}

auto load_error(std::string message) -> Exception {
    if (detail::log_enabled()) {
        detail::log(LogLevel::warn, "load failed: " + message);
    }
    return Exception{ErrorKind::decode_error, std::move(message)};
}

}  // anonymous namespace

// -- Snapshots ----------------------------------------------------------------

auto Document::save() const -> std::vector<std::byte> {
    auto snap = storage::Snapshot{
        .actor = state_->actor,
        .next_counter = state_->next_counter,
        .heads = state_->heads,
        .changes = {},
        .pending = {},
        .clock = state_->clock,
    };
    snap.changes.reserve(state_->history.size());
    for (const auto& record : state_->history) snap.changes.push_back(record.bytes);
    for (const auto& record : state_->pending) snap.pending.push_back(record.bytes);
    return storage::encode_snapshot(snap);
}

auto Document::load(std::span<const std::byte> data, DocumentOptions options) -> Document {
    auto snap = storage::decode_snapshot(data);
    if (!snap) throw load_error("malformed document snapshot");

    auto doc = Document{snap->actor, options};
    auto& state = *doc.state_;

    for (std::size_t i = 0; i < snap->changes.size(); ++i) {
        auto record = decode_record(snap->changes[i]);
        if (!record) throw load_error("malformed change record " + std::to_string(i));
        if (state.has_change(record->hash)) {
            throw load_error("duplicate change " + record->hash.to_hex());
        }
        if (!state.deps_satisfied(record->change)) {
            throw load_error("change " + record->hash.to_hex() + " precedes its dependencies");
        }
        if (record->change.seq != expected_seq(state.clock, record->change.actor)) {
            throw load_error("change " + record->hash.to_hex() + " is out of sequence");
        }
        state.integrate(std::move(*record));
    }

    for (const auto& bytes : snap->pending) {
        auto record = decode_record(bytes);
        if (!record) throw load_error("malformed buffered change record");
        state.pending.push_back(std::move(*record));
    }

    if (state.heads != snap->heads) throw load_error("stored heads do not match the history");
    if (state.clock != snap->clock) throw load_error("stored clock does not match the history");
    if (snap->next_counter < state.next_counter) {
        throw load_error("stored op counter is behind the history");
    }
    state.next_counter = snap->next_counter;

    if (detail::log_enabled()) {
        detail::log(LogLevel::debug, "loaded document with " + std::to_string(state.history.size()) +
                    " changes");
    }
    return doc;
}

// -- Change records -----------------------------------------------------------

auto Document::last_change() const -> std::optional<std::vector<std::byte>> {
    if (!state_->last_local) return std::nullopt;
    return state_->history[*state_->last_local].bytes;
}

void Document::apply_changes(const std::vector<std::vector<std::byte>>& changes) {
    auto incoming = std::vector<detail::ChangeRecord>{};
    incoming.reserve(changes.size());
    for (std::size_t i = 0; i < changes.size(); ++i) {
        auto record = decode_record(changes[i]);
        if (!record) {
            if (detail::log_enabled()) {
                detail::log(LogLevel::warn, "rejected malformed change record at position " +
                            std::to_string(i));
            }
            throw Exception{ErrorKind::decode_error,
                "malformed change record at position " + std::to_string(i)};
        }
        incoming.push_back(std::move(*record));
    }

    // Candidates: the existing buffer plus every new record not seen yet.
    auto candidates = state_->pending;
    auto seen = std::unordered_set<ChangeHash>{};
    for (const auto& record : candidates) seen.insert(record.hash);
    for (auto& record : incoming) {
        if (state_->has_change(record.hash) || !seen.insert(record.hash).second) continue;
        candidates.push_back(std::move(record));
    }

    // Work out the application order before touching the document, so a
    // rejected call leaves it exactly as it was.
    auto order = std::vector<std::size_t>{};
    auto ready = std::vector<bool>(candidates.size(), false);
    auto known = std::unordered_set<ChangeHash>{};
    auto clock = state_->clock;
    auto is_known = [&](const ChangeHash& h) { return state_->has_change(h) || known.contains(h); };

    for (bool progress = true; progress;) {
        progress = false;
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (ready[i]) continue;
            const auto& change = candidates[i].change;
            if (!std::ranges::all_of(change.deps, is_known)) continue;
            if (change.seq != expected_seq(clock, change.actor)) {
                if (detail::log_enabled()) {
                    detail::log(LogLevel::warn, "rejected change " + candidates[i].hash.to_hex() +
                                ": out of sequence for its actor");
                }
                throw Exception{ErrorKind::invalid_change,
                    "change " + candidates[i].hash.to_hex() + " has seq " +
                    std::to_string(change.seq) + ", expected " +
                    std::to_string(expected_seq(clock, change.actor))};
            }
            clock[change.actor] = change.seq;
            known.insert(candidates[i].hash);
            ready[i] = true;
            order.push_back(i);
            progress = true;
        }
    }

    const auto waiting = candidates.size() - order.size();
    if (waiting > state_->options.max_pending_changes) {
        if (detail::log_enabled()) {
            detail::log(LogLevel::warn, "rejected " + std::to_string(changes.size()) +
                        " change records: buffer limit exceeded");
        }
        throw Exception{ErrorKind::invalid_change,
            std::to_string(waiting) + " changes would wait for dependencies, limit is " +
            std::to_string(state_->options.max_pending_changes)};
    }

    for (auto i : order) state_->integrate(std::move(candidates[i]));

    auto still_pending = std::vector<detail::ChangeRecord>{};
    still_pending.reserve(waiting);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (!ready[i]) still_pending.push_back(std::move(candidates[i]));
    }
    if (!still_pending.empty()) {
        if (detail::log_enabled()) {
            detail::log(LogLevel::debug, std::to_string(still_pending.size()) +
                        " changes awaiting dependencies");
        }
    }
    state_->pending = std::move(still_pending);
    state_->last_local = std::nullopt;
}

auto Document::get_changes(const std::vector<ChangeHash>& since) const
    -> std::vector<std::vector<std::byte>> {
    auto result = std::vector<std::vector<std::byte>>{};
    const auto have = state_->ancestors_of(since);
    for (const auto& record : state_->history) {
        if (!have.contains(record.hash)) result.push_back(record.bytes);
    }
    return result;
}

auto Document::get_change_history() const -> std::vector<Change> {
    auto result = std::vector<Change>{};
    result.reserve(state_->history.size());
    for (const auto& record : state_->history) result.push_back(record.change);
    return result;
}

auto Document::num_changes() const -> std::size_t {
    return state_->history.size();
}

auto Document::get_heads() const -> std::vector<ChangeHash> {
    return state_->heads;
}

auto Document::pending_changes() const -> std::size_t {
    return state_->pending.size();
}

auto Document::missing_deps() const -> std::vector<ChangeHash> {
    auto buffered = std::unordered_set<ChangeHash>{};
    for (const auto& record : state_->pending) buffered.insert(record.hash);

    auto result = std::vector<ChangeHash>{};
    for (const auto& record : state_->pending) {
        for (const auto& dep : record.change.deps) {
            if (!state_->has_change(dep) && !buffered.contains(dep)) result.push_back(dep);
        }
    }
    std::ranges::sort(result);
    auto dup = std::ranges::unique(result);
    result.erase(dup.begin(), dup.end());
    return result;
}

// -- Fork and merge -----------------------------------------------------------

auto Document::fork() const -> Document {
    return fork(ActorId::random());
}

auto Document::fork(const ActorId& actor) const -> Document {
    auto forked = Document{*this};
    forked.state_->actor = actor;
    forked.state_->last_local = std::nullopt;
    return forked;
}

void Document::merge(const Document& other) {
    auto missing = std::vector<std::vector<std::byte>>{};
    for (const auto& record : other.state_->history) {
        if (!state_->has_change(record.hash)) missing.push_back(record.bytes);
    }
    apply_changes(missing);
}

}  // namespace amstore
