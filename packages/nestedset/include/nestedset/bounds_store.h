#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nestedset/node.h"
#include "nestedset/proto/proto_generated.h"

namespace nestedset {

/// A bound column
enum class BoundColumn : uint8_t { Left, Right };
/// A comparison against a bound column
enum class BoundComparison : uint8_t { Less, LessEqual, Greater, GreaterEqual, Equal };
/// The scan order, ascending left bounds by default
enum class NodeOrder : uint8_t { Default, Reversed };

/// Is a status reported by the storage layer?
bool IsStorageError(proto::StatusCode status);

/// A range predicate on a bound column
struct BoundPredicate {
    /// The column
    BoundColumn column;
    /// The comparison
    BoundComparison comparison;
    /// The value
    Bound value;

    /// Does a row match?
    bool Matches(const NodeRow& row) const;
};

/// A filter that is translated into a SELECT by the stores
struct NodeFilter {
    /// The bound predicates, all must hold
    std::vector<BoundPredicate> bounds;
    /// Filter on the parent key, an inner null selects the roots
    std::optional<std::optional<NodeID>> parent_id;
    /// Exclude a node
    std::optional<NodeID> excluded_node_id;
    /// The scan order
    NodeOrder order = NodeOrder::Default;
    /// The number of rows to skip
    size_t offset = 0;
    /// The maximum number of rows
    std::optional<size_t> limit;
    /// Include soft-deleted rows? (service scan)
    bool include_soft_deleted = false;

    /// Add a bound predicate
    NodeFilter& Where(BoundColumn column, BoundComparison comparison, Bound value) {
        bounds.push_back(BoundPredicate{column, comparison, value});
        return *this;
    }
    /// Filter on the parent key
    NodeFilter& WhereParent(std::optional<NodeID> parent) {
        parent_id = parent;
        return *this;
    }
    /// Exclude a node
    NodeFilter& WhereNot(NodeID node) {
        excluded_node_id = node;
        return *this;
    }
    /// Does a row match?
    bool Matches(const NodeRow& row) const;
};

/// The bulk update that moves a subtree [left, right] to a new position.
///
/// Every bound value v is mapped by a four-way case split:
///   v < range_begin or v > range_end    unchanged (before or after both ranges)
///   left <= v <= right                  v + distance (inside the moved subtree)
///   otherwise                           v + shift (between the old and the new position)
///
/// Moving right (position > right + 1) the range is [left, position - 1], the subtree moves by
/// position - right - 1 and the bounds in between move down by the subtree height.
/// Moving left (position < left) the range is [position, right], the subtree moves by position - left and the bounds
/// in between move up by the subtree height.
struct BoundsMove {
    /// The left bound of the subtree
    Bound left;
    /// The right bound of the subtree
    Bound right;
    /// The target position
    Bound position;
    /// The first affected bound value
    Bound range_begin;
    /// The last affected bound value
    Bound range_end;
    /// The offset of the subtree bounds
    Bound distance;
    /// The offset of the bounds between the old and the new position
    Bound shift;

    /// Compute a move, null if the position is inside the subtree or the subtree is already there
    static std::optional<BoundsMove> Create(Bound left, Bound right, Bound position);
    /// Map a bound value
    Bound Map(Bound value) const {
        if (value < range_begin || value > range_end) {
            return value;
        } else if (value >= left && value <= right) {
            return value + distance;
        } else {
            return value + shift;
        }
    }
};

/// The storage of the tree table.
///
/// Stores execute bulk range statements against the left, right and parent columns inside the current transaction.
/// They know nothing about the tree.
/// Bulk updates and the max bound always cover soft-deleted rows.
class BoundsStore {
   public:
    /// A listener that is invoked for every row removed by a range delete
    using RowListener = std::function<void(const NodeRow&)>;

   protected:
    /// The message of the last storage error
    std::string last_error;
    /// The row-deleted listener
    RowListener row_deleted_listener;

   public:
    /// Destructor
    virtual ~BoundsStore() = default;

    /// Get the message of the last storage error
    const std::string& GetLastError() const { return last_error; }
    /// Set a listener for rows that are removed by range deletes
    void SetRowDeletedListener(RowListener listener) { row_deleted_listener = std::move(listener); }

    /// Begin a transaction, nested transactions are savepoints
    virtual proto::StatusCode BeginTransaction() = 0;
    /// Commit the innermost transaction
    virtual proto::StatusCode Commit() = 0;
    /// Roll back the innermost transaction
    virtual proto::StatusCode Rollback() = 0;
    /// Get the transaction nesting depth
    virtual size_t GetTransactionDepth() const = 0;

    /// SELECT MAX(right), 0 for an empty table
    virtual std::pair<Bound, proto::StatusCode> ReadMaxRight() = 0;
    /// Read a single row
    virtual std::pair<std::optional<NodeRow>, proto::StatusCode> ReadNode(NodeID node_id,
                                                                          bool include_soft_deleted) = 0;
    /// Read all rows matching a filter
    virtual proto::StatusCode Scan(const NodeFilter& filter, std::vector<NodeRow>& out) = 0;

    /// UPDATE column = column + delta WHERE column >= cut
    virtual std::pair<size_t, proto::StatusCode> ShiftBounds(BoundColumn column, Bound cut, Bound delta) = 0;
    /// Move a subtree with a single bulk UPDATE of both bound columns
    virtual std::pair<size_t, proto::StatusCode> MoveBounds(const BoundsMove& move) = 0;
    /// DELETE WHERE left BETWEEN left AND right
    virtual std::pair<size_t, proto::StatusCode> DeleteRange(Bound left, Bound right) = 0;
    /// DELETE a single row
    virtual std::pair<size_t, proto::StatusCode> DeleteRow(NodeID node_id) = 0;

    /// Insert a row, the key of the row is ignored and allocated by the store
    virtual std::pair<NodeID, proto::StatusCode> InsertRow(const NodeRow& row) = 0;
    /// Update the parent key of a row
    virtual proto::StatusCode UpdateParent(NodeID node_id, std::optional<NodeID> parent_id) = 0;
    /// Update the name of a row
    virtual proto::StatusCode UpdateName(NodeID node_id, std::string_view name) = 0;
    /// Set the soft-delete marker of a row
    virtual proto::StatusCode MarkDeleted(NodeID node_id, bool deleted) = 0;
};

/// A store transaction that is rolled back unless committed.
/// Transactions nest, an inner transaction is a savepoint of the outer one.
class Transaction {
   protected:
    /// The store
    BoundsStore& store;
    /// The status of BEGIN
    proto::StatusCode begin_status;
    /// Was committed or rolled back?
    bool finished;

   public:
    /// Constructor
    explicit Transaction(BoundsStore& store);
    /// Destructor
    ~Transaction();
    /// Transactions must not be copied
    Transaction(const Transaction& other) = delete;
    /// Transactions must not be copy-assigned
    Transaction& operator=(const Transaction& other) = delete;

    /// Get the status of BEGIN
    proto::StatusCode GetStatus() const { return begin_status; }
    /// Commit the transaction
    proto::StatusCode Commit();
    /// Roll the transaction back
    proto::StatusCode Rollback();
};

}  // namespace nestedset
