/// @file document.hpp
/// @brief The Document class -- the primary API for amstore.

#pragma once

#include <amstore/change.hpp>
#include <amstore/options.hpp>
#include <amstore/path.hpp>
#include <amstore/transaction.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace amstore {

namespace detail {
struct DocState;
}  // namespace detail

/// A CRDT document addressed by paths.
///
/// A Document owns one tree (the root is a map) and the causal history
/// of changes that built it. Every mutating call produces at most one
/// change record, retrievable through last_change() for replication,
/// and leaves the document untouched when it throws. Replicas converge
/// by exchanging those records with apply_changes().
///
/// A Document is not thread-safe. Callers serialize access to one
/// document; distinct documents share no state.
///
/// @code
/// auto doc = Document{};
/// doc.put_text(Path::parse("profile.name"), "Alice");     // creates map "profile"
/// doc.create_list(Path::parse("tags"));
/// doc.append_text(Path::parse("tags"), "admin");
/// auto name = doc.get_text(Path::parse("profile.name"));  // "Alice"
/// @endcode
class Document {
public:
    /// Construct an empty document with a random actor id.
    Document();

    explicit Document(DocumentOptions options);

    /// Construct an empty document with a fixed actor id.
    explicit Document(ActorId actor, DocumentOptions options = {});

    ~Document();

    Document(Document&&) noexcept;
    auto operator=(Document&&) noexcept -> Document&;

    /// Deep-copy a document. The copy is independent and shares no state.
    Document(const Document&);
    auto operator=(const Document&) -> Document&;

    // -- Identity -------------------------------------------------------------

    auto actor_id() const -> const ActorId&;
    auto options() const -> const DocumentOptions&;

    // -- Typed scalar access --------------------------------------------------

    /// Write a scalar at a path, creating missing intermediate maps.
    ///
    /// Whatever was at the terminal position is replaced. A std::string
    /// value is stored as a text object.
    /// @throws Exception type_mismatch when the parent chain crosses a
    ///         non-container or the wrong container kind; range_error when
    ///         an index is past the end of its list.
    void put_scalar(const Path& path, ScalarValue value);

    /// Read a scalar, requiring the node at path to be of `expected` type.
    /// Integers and doubles are never converted into each other.
    /// @throws Exception not_found, type_mismatch.
    auto get_scalar(const Path& path, NodeType expected) const -> ScalarValue;

    void put_text(const Path& path, std::string_view value);
    void put_int(const Path& path, std::int64_t value);
    void put_double(const Path& path, double value);
    void put_bool(const Path& path, bool value);
    void put_counter(const Path& path, std::int64_t value);
    void put_timestamp(const Path& path, std::int64_t millis_since_epoch);

    auto get_text(const Path& path) const -> std::string;
    auto get_int(const Path& path) const -> std::int64_t;
    auto get_double(const Path& path) const -> double;
    auto get_bool(const Path& path) const -> bool;
    auto get_counter(const Path& path) const -> std::int64_t;
    auto get_timestamp(const Path& path) const -> std::int64_t;

    /// The type of the node at path, or nullopt when the path is absent.
    /// The empty path is the root map.
    /// @throws Exception type_mismatch when the path crosses a scalar.
    auto node_type(const Path& path) const -> std::optional<NodeType>;

    /// Add delta to the counter at path.
    void increment_counter(const Path& path, std::int64_t delta);

    // -- Lists and text -------------------------------------------------------

    /// Create an empty list at path.
    ///
    /// An existing empty list is left as it is (no change is recorded);
    /// any other existing node fails with type_mismatch rather than being
    /// overwritten.
    void create_list(const Path& path);

    /// Append a scalar to the list at path.
    /// @throws Exception not_found, type_mismatch.
    void append_scalar(const Path& path, ScalarValue value);

    void append_text(const Path& path, std::string_view value);
    void append_int(const Path& path, std::int64_t value);
    void append_double(const Path& path, double value);
    void append_bool(const Path& path, bool value);

    /// Number of elements in the list at path.
    auto list_len(const Path& path) const -> std::size_t;

    /// Number of keys in the map at path (the empty path is the root).
    auto map_len(const Path& path) const -> std::size_t;

    /// Replace `delete_count` code points at `start` of the text at path
    /// with `insert`, as one change.
    /// @throws Exception range_error when start or delete_count is
    ///         negative, or start + delete_count exceeds the length.
    void splice_text(const Path& path, std::int64_t start, std::int64_t delete_count,
                     std::string_view insert);

    /// Apply a unified diff to the text at path. The edit is recorded as
    /// one minimal splice.
    /// @throws Exception invalid_diff when the diff is malformed or does
    ///         not match the current text.
    void put_diff(const Path& path, std::string_view diff);

    // -- Object-level access --------------------------------------------------

    /// Run fn inside one transaction. Everything fn does commits as a
    /// single change; if fn throws, the document is restored and the
    /// exception propagates.
    void transact(const std::function<void(Transaction&)>& fn);

    /// Run fn inside one transaction and return its result.
    ///
    /// @code
    /// auto list_id = doc.transact([](Transaction& tx) {
    ///     return tx.put_object(root, "items", ObjType::list);
    /// });
    /// @endcode
    template <typename Fn>
        requires std::invocable<Fn, Transaction&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&>;

    auto object_type(const ObjId& obj) const -> std::optional<ObjType>;
    auto keys(const ObjId& obj) const -> std::vector<std::string>;
    auto length(const ObjId& obj) const -> std::size_t;

    /// Get the winning value at a map key.
    auto get(const ObjId& obj, std::string_view key) const -> std::optional<Value>;

    /// Get all concurrent values at a map key (for conflict inspection).
    auto get_all(const ObjId& obj, std::string_view key) const -> std::vector<Value>;

    /// Get the value at a list index.
    auto get(const ObjId& obj, std::size_t index) const -> std::optional<Value>;

    /// The id of the object at a map key or list index, when there is one.
    auto get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId>;
    auto get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId>;

    /// Content of a text object.
    auto text(const ObjId& obj) const -> std::string;

    // -- Persistence and replication ------------------------------------------

    /// Serialize the whole document: tree, actor, history and buffered
    /// changes. The encoding is deterministic for a given state.
    auto save() const -> std::vector<std::byte>;

    /// Reconstruct a document from save() output.
    /// @throws Exception decode_error on truncated, corrupt or
    ///         inconsistent input. No partial document is ever returned.
    static auto load(std::span<const std::byte> data, DocumentOptions options = {}) -> Document;

    /// The change record produced by the most recent mutating call, or
    /// nullopt if that call changed nothing.
    auto last_change() const -> std::optional<std::vector<std::byte>>;

    /// Merge encoded change records, in any order.
    ///
    /// Every record is decoded before any is applied. Records already in
    /// the history are skipped. A record whose dependencies are missing
    /// is buffered and applied once they arrive.
    /// @throws Exception decode_error on a malformed record;
    ///         invalid_change when the buffer limit would be exceeded.
    ///         In both cases nothing from the call is applied.
    void apply_changes(const std::vector<std::vector<std::byte>>& changes);

    /// Encoded changes not reachable from `since` (all when empty), in
    /// causal order.
    auto get_changes(const std::vector<ChangeHash>& since = {}) const
        -> std::vector<std::vector<std::byte>>;

    /// Decoded form of every applied change, in causal order.
    auto get_change_history() const -> std::vector<Change>;

    auto num_changes() const -> std::size_t;
    auto get_heads() const -> std::vector<ChangeHash>;

    /// Number of received changes waiting for their dependencies.
    auto pending_changes() const -> std::size_t;

    /// Dependencies named by buffered changes that are not yet present.
    auto missing_deps() const -> std::vector<ChangeHash>;

    /// A copy of this document that writes as a different actor.
    auto fork() const -> Document;
    auto fork(const ActorId& actor) const -> Document;

    /// Apply every change of other that this document lacks.
    void merge(const Document& other);

private:
    // Run fn in a transaction without taking a backup; used by the path
    // operations, which validate before generating any op.
    void mutate(const std::function<void(Transaction&)>& fn);

    std::unique_ptr<detail::DocState> state_;
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, Transaction&> &&
             (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
auto Document::transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
    auto result = std::optional<std::invoke_result_t<Fn, Transaction&>>{};
    transact(std::function<void(Transaction&)>{
        [&](Transaction& tx) { result.emplace(fn(tx)); }});
    return std::move(*result);
}

}  // namespace amstore
