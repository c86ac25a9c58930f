/// @file transaction.hpp
/// @brief Transaction class for low-level, object-addressed mutation.

#pragma once

#include <amstore/op.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace amstore {

namespace detail { struct DocState; }

/// A mutation interface addressed by object id rather than by path.
///
/// Transactions are created by Document::transact() and by the path
/// operations of Document. Every method validates its arguments before
/// it generates an operation and throws amstore::Exception when they
/// do not hold. All operations made in one transaction commit as a
/// single change; if the callback throws, none of them are kept.
///
/// @code
/// doc.transact([](auto& tx) {
///     tx.put(root, "name", std::string{"Alice"});
///     auto tags = tx.put_object(root, "tags", ObjType::list);
///     tx.insert(tags, 0, std::int64_t{1});
/// });
/// @endcode
class Transaction {
    friend class Document;
    explicit Transaction(detail::DocState& state);

public:
    /// Set a scalar value at a map key.
    /// A std::string value is stored as a text object.
    void put(const ObjId& obj, std::string_view key, ScalarValue val);

    /// Create a nested object at a map key.
    /// @return The ObjId of the newly created object.
    auto put_object(const ObjId& obj, std::string_view key, ObjType type) -> ObjId;

    /// Create a text object at a map key holding the given content.
    auto put_text(const ObjId& obj, std::string_view key, std::string_view text) -> ObjId;

    /// Delete a map key. Deleting an absent key does nothing.
    void delete_key(const ObjId& obj, std::string_view key);

    /// Insert a scalar value into a list at the given index.
    /// @throws Exception range_error when index > length.
    void insert(const ObjId& obj, std::size_t index, ScalarValue val);

    /// Insert a nested object into a list at the given index.
    auto insert_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId;

    /// Insert a text object into a list at the given index.
    auto insert_text(const ObjId& obj, std::size_t index, std::string_view text) -> ObjId;

    /// Overwrite the list element at index with a scalar.
    /// @throws Exception range_error when index >= length.
    void set(const ObjId& obj, std::size_t index, ScalarValue val);

    /// Overwrite the list element at index with a new object.
    auto set_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId;

    /// Overwrite the list element at index with a new text object.
    auto set_text(const ObjId& obj, std::size_t index, std::string_view text) -> ObjId;

    /// Delete the list element at index.
    void delete_index(const ObjId& obj, std::size_t index);

    /// Delete `del` code points at `pos` of a text object, then insert
    /// `text` there.
    /// @throws Exception range_error when pos + del exceeds the length.
    void splice_text(const ObjId& obj, std::size_t pos, std::size_t del,
                     std::string_view text);

    /// Add delta to the counter at a map key.
    void increment(const ObjId& obj, std::string_view key, std::int64_t delta);

    /// Add delta to the counter at a list index.
    void increment(const ObjId& obj, std::size_t index, std::int64_t delta);

    /// Attach a message to the change this transaction commits.
    void set_message(std::string message);

    /// Number of operations made so far.
    auto pending_ops() const -> std::size_t { return pending_ops_.size(); }

private:
    void commit();
    void record(Op op);
    void require_type(const ObjId& obj, ObjType type) const;
    void require_sequence(const ObjId& obj) const;
    void insert_value(const ObjId& obj, std::size_t index, Value value);
    void overwrite(const ObjId& obj, std::size_t index, Value value);
    void fill_text(const ObjId& text_obj, std::string_view text);

    detail::DocState& state_;
    std::uint64_t start_op_;
    std::vector<Op> pending_ops_;
    std::optional<std::string> message_;
};

}  // namespace amstore
