#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>
#include <string_view>

#include "nestedset/bounds_store.h"

namespace nestedset {

/// The table and column names of a tree table
struct TreeSchema {
    /// The table name
    std::string table_name = "nodes";
    /// The primary key column
    std::string key_column = "id";
    /// The left bound column
    std::string left_column = "_lft";
    /// The right bound column
    std::string right_column = "_rgt";
    /// The parent key column
    std::string parent_column = "parent_id";
    /// The payload column
    std::string name_column = "name";
    /// The soft-delete marker column
    std::string deleted_column = "deleted";
};

/// A tree table in a SQLite database
class SQLiteBoundsStore : public BoundsStore {
   protected:
    /// A prepared statement
    using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    /// The database handle
    sqlite3* db;
    /// Do we own the database handle?
    bool owns_db;
    /// The schema
    TreeSchema schema;
    /// The transaction nesting depth
    size_t transaction_depth = 0;
    /// Did the outermost level begin its own transaction?
    /// False if it joined a transaction of the connection owner with a savepoint.
    bool owns_transaction = false;

    /// Remember the current database error and translate the result code
    proto::StatusCode Fail(int rc);
    /// Prepare a statement
    std::pair<Statement, proto::StatusCode> Prepare(const std::string& sql);
    /// Execute a statement without results
    proto::StatusCode Execute(const std::string& sql);
    /// Step a statement that has no results, returns the number of changed rows
    std::pair<size_t, proto::StatusCode> StepDone(sqlite3_stmt* stmt);
    /// Quote a column name
    std::string Column(std::string_view name) const;
    /// Get the quoted table name
    std::string Table() const { return Column(schema.table_name); }
    /// Get the select list of a row
    std::string SelectList() const;
    /// Read a row from the current result
    NodeRow ReadRow(sqlite3_stmt* stmt) const;

   public:
    /// Constructor
    SQLiteBoundsStore(sqlite3* db, TreeSchema schema = {}, bool owns_db = false);
    /// Destructor
    ~SQLiteBoundsStore() override;
    /// Stores must not be copied
    SQLiteBoundsStore(const SQLiteBoundsStore& other) = delete;
    /// Stores must not be copy-assigned
    SQLiteBoundsStore& operator=(const SQLiteBoundsStore& other) = delete;

    /// Open a database file, ":memory:" opens a private in-memory database
    static std::pair<std::unique_ptr<SQLiteBoundsStore>, proto::StatusCode> Open(const std::string& path,
                                                                                 TreeSchema schema = {});

    /// Get the database handle
    sqlite3* GetHandle() const { return db; }
    /// Get the schema
    auto& GetSchema() const { return schema; }
    /// Create the tree table and its index if they do not exist
    proto::StatusCode CreateTable();

    /// BEGIN IMMEDIATE, or a savepoint if a transaction is active on the connection
    proto::StatusCode BeginTransaction() override;
    /// COMMIT, or release the innermost savepoint
    proto::StatusCode Commit() override;
    /// ROLLBACK, or roll back to the innermost savepoint
    proto::StatusCode Rollback() override;
    /// Get the transaction nesting depth
    size_t GetTransactionDepth() const override { return transaction_depth; }

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
