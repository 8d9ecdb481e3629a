#pragma once

#include <vector>

#include "ankerl/unordered_dense.h"
#include "nestedset/bounds_store.h"

namespace nestedset {

/// A tree table held in process memory.
/// Transactions snapshot the table and restore the snapshot on rollback.
class MemoryBoundsStore : public BoundsStore {
   protected:
    /// A table snapshot
    struct Snapshot {
        /// The rows
        std::vector<NodeRow> rows;
        /// The next node id
        NodeID next_node_id;
    };

    /// The rows in insertion order
    std::vector<NodeRow> rows;
    /// The row index by key
    ankerl::unordered_dense::map<NodeID, size_t> rows_by_id;
    /// The next node id
    NodeID next_node_id = 1;
    /// The snapshots of the open transactions
    std::vector<Snapshot> snapshots;

    /// Rebuild the key index
    void RebuildIndex();
    /// Find a row
    NodeRow* FindRow(NodeID node_id);

   public:
    /// Constructor
    MemoryBoundsStore() = default;

    /// Get all rows in insertion order
    auto& GetRows() const { return rows; }
    /// Insert a row with its key and bounds as-is
    void InsertRaw(NodeRow row);

    /// Begin a transaction
    proto::StatusCode BeginTransaction() override;
    /// Commit the innermost transaction
    proto::StatusCode Commit() override;
    /// Roll back the innermost transaction
    proto::StatusCode Rollback() override;
    /// Get the transaction nesting depth
    size_t GetTransactionDepth() const override { return snapshots.size(); }

    /// SELECT MAX(right)
    std::pair<Bound, proto::StatusCode> ReadMaxRight() override;
    /// Read a single row
    std::pair<std::optional<NodeRow>, proto::StatusCode> ReadNode(NodeID node_id, bool include_soft_deleted) override;
    /// Read all rows matching a filter
    proto::StatusCode Scan(const NodeFilter& filter, std::vector<NodeRow>& out) override;

    /// Shift a bound column
    std::pair<size_t, proto::StatusCode> ShiftBounds(BoundColumn column, Bound cut, Bound delta) override;
    /// Move a subtree
    std::pair<size_t, proto::StatusCode> MoveBounds(const BoundsMove& move) override;
    /// Delete a bound range
    std::pair<size_t, proto::StatusCode> DeleteRange(Bound left, Bound right) override;
    /// Delete a single row
    std::pair<size_t, proto::StatusCode> DeleteRow(NodeID node_id) override;

    /// Insert a row
    std::pair<NodeID, proto::StatusCode> InsertRow(const NodeRow& row) override;
    /// Update the parent key of a row
    proto::StatusCode UpdateParent(NodeID node_id, std::optional<NodeID> parent_id) override;
    /// Update the name of a row
    proto::StatusCode UpdateName(NodeID node_id, std::string_view name) override;
    /// Set the soft-delete marker of a row
    proto::StatusCode MarkDeleted(NodeID node_id, bool deleted) override;
};

}  // namespace nestedset
