/// @file store.hpp
/// @brief DocumentStore: keyed documents behind the command surface.

#pragma once

#include <amstore/document.hpp>
#include <amstore/options.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace amstore {

/// Called with (document key, change record) after every mutating
/// command that produced a change.
using ChangeListener = std::function<void(std::string_view, std::span<const std::byte>)>;

/// Called with (event name, document key) after every successful
/// mutating command. Event names are "am." plus the lower-case command
/// name, e.g. "am.puttext".
using EventListener = std::function<void(std::string_view, std::string_view)>;

/// The channel a host publishes a document's change records on.
auto change_channel(std::string_view key) -> std::string;

/// Standard base64 (RFC 4648, padded), for carrying change records over
/// text channels.
auto base64_encode(std::span<const std::byte> data) -> std::string;

/// @throws Exception decode_error on characters outside the alphabet or
///         bad padding.
auto base64_decode(std::string_view text) -> std::vector<std::byte>;

/// Owns one Document per host key and exposes the command table.
///
/// Path arguments are path strings and are parsed on every call, so a
/// malformed path fails with parse_error before anything else is
/// checked. new_document, load and from_json create the document when
/// the key has none, and remove reports a missing key by returning
/// false. Every other command on a key without a document fails with
/// not_found.
///
/// Listener exceptions are logged and swallowed: a committed mutation is
/// never rolled back because a listener failed.
class DocumentStore {
public:
    DocumentStore() = default;
    explicit DocumentStore(DocumentOptions options) : options_{options} {}

    // -- Document lifecycle ---------------------------------------------------

    /// NEW: replace whatever is at key with a fresh empty document.
    void new_document(std::string_view key);

    /// SAVE.
    auto save(std::string_view key) const -> std::vector<std::byte>;

    /// LOAD: replace whatever is at key with the decoded document.
    void load(std::string_view key, std::span<const std::byte> data);

    /// APPLY.
    void apply(std::string_view key, const std::vector<std::vector<std::byte>>& changes);

    /// DEL: drop the document at key.
    /// @return false when there was none.
    auto remove(std::string_view key) -> bool;

    auto contains(std::string_view key) const -> bool;
    auto size() const -> std::size_t { return docs_.size(); }
    auto keys() const -> std::vector<std::string>;

    /// Direct access to a stored document.
    /// @throws Exception not_found.
    auto document(std::string_view key) -> Document&;
    auto document(std::string_view key) const -> const Document&;

    // -- Scalars --------------------------------------------------------------

    void put_text(std::string_view key, std::string_view path, std::string_view value);
    void put_int(std::string_view key, std::string_view path, std::int64_t value);
    void put_double(std::string_view key, std::string_view path, double value);
    void put_bool(std::string_view key, std::string_view path, bool value);
    void put_counter(std::string_view key, std::string_view path, std::int64_t value);
    void put_timestamp(std::string_view key, std::string_view path, std::int64_t millis);

    auto get_text(std::string_view key, std::string_view path) const -> std::string;
    auto get_int(std::string_view key, std::string_view path) const -> std::int64_t;
    auto get_double(std::string_view key, std::string_view path) const -> double;
    auto get_bool(std::string_view key, std::string_view path) const -> bool;
    auto get_counter(std::string_view key, std::string_view path) const -> std::int64_t;
    auto get_timestamp(std::string_view key, std::string_view path) const -> std::int64_t;

    void inc_counter(std::string_view key, std::string_view path, std::int64_t delta);

    // -- Lists, maps and text -------------------------------------------------

    void create_list(std::string_view key, std::string_view path);
    void append_text(std::string_view key, std::string_view path, std::string_view value);
    void append_int(std::string_view key, std::string_view path, std::int64_t value);
    void append_double(std::string_view key, std::string_view path, double value);
    void append_bool(std::string_view key, std::string_view path, bool value);
    auto list_len(std::string_view key, std::string_view path) const -> std::size_t;

    /// MAPLEN. An empty path string means the root map.
    auto map_len(std::string_view key, std::string_view path) const -> std::size_t;

    void splice_text(std::string_view key, std::string_view path, std::int64_t start,
                     std::int64_t delete_count, std::string_view insert);
    void put_diff(std::string_view key, std::string_view path, std::string_view diff);

    // -- JSON and history -----------------------------------------------------

    auto to_json(std::string_view key, bool pretty = false) const -> std::string;

    /// FROMJSON: replace whatever is at key with a document built from a
    /// JSON object, written as one change.
    void from_json(std::string_view key, std::string_view json);

    auto changes(std::string_view key, const std::vector<ChangeHash>& since = {}) const
        -> std::vector<std::vector<std::byte>>;
    auto num_changes(std::string_view key) const -> std::size_t;

    // -- Hooks ----------------------------------------------------------------

    void on_change(ChangeListener listener) { change_listener_ = std::move(listener); }
    void on_event(EventListener listener) { event_listener_ = std::move(listener); }

private:
    // Run a mutating command against the document at key, then notify.
    void write(std::string_view command, std::string_view key,
               const std::function<void(Document&)>& fn);
    void notify(std::string_view command, std::string_view key,
                const std::optional<std::vector<std::byte>>& change);

    auto find(std::string_view key) -> Document&;
    auto find(std::string_view key) const -> const Document&;

    DocumentOptions options_;
    std::map<std::string, Document, std::less<>> docs_;
    ChangeListener change_listener_;
    EventListener event_listener_;
};

}  // namespace amstore
