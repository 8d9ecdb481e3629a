#include "nestedset/sqlite_store.h"

#include <format>

using namespace nestedset;

static const char* comparisonOperator(BoundComparison comparison) {
    switch (comparison) {
        case BoundComparison::Less:
            return " < ";
        case BoundComparison::LessEqual:
            return " <= ";
        case BoundComparison::Greater:
            return " > ";
        case BoundComparison::GreaterEqual:
            return " >= ";
        case BoundComparison::Equal:
            return " = ";
    }
    return " = ";
}

SQLiteBoundsStore::SQLiteBoundsStore(sqlite3* db, TreeSchema schema, bool owns_db)
    : db(db), owns_db(owns_db), schema(std::move(schema)) {}

SQLiteBoundsStore::~SQLiteBoundsStore() {
    if (owns_db && db) {
        sqlite3_close_v2(db);
    }
}

std::pair<std::unique_ptr<SQLiteBoundsStore>, proto::StatusCode> SQLiteBoundsStore::Open(const std::string& path,
                                                                                         TreeSchema schema) {
    sqlite3* db = nullptr;
    auto rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    auto store = std::make_unique<SQLiteBoundsStore>(db, std::move(schema), true);
    if (rc != SQLITE_OK) {
        return {nullptr, store->Fail(rc)};
    }
    return {std::move(store), proto::StatusCode::OK};
}

proto::StatusCode SQLiteBoundsStore::Fail(int rc) {
    last_error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return proto::StatusCode::STORAGE_BUSY;
        case SQLITE_CONSTRAINT:
            return proto::StatusCode::STORAGE_CONSTRAINT_VIOLATION;
        default:
            return proto::StatusCode::STORAGE_ERROR;
    }
}

std::pair<SQLiteBoundsStore::Statement, proto::StatusCode> SQLiteBoundsStore::Prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    Statement owned{stmt, &sqlite3_finalize};
    if (rc != SQLITE_OK) {
        return {std::move(owned), Fail(rc)};
    }
    return {std::move(owned), proto::StatusCode::OK};
}

std::pair<size_t, proto::StatusCode> SQLiteBoundsStore::StepDone(sqlite3_stmt* stmt) {
    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return {0, Fail(rc)};
    }
    return {static_cast<size_t>(sqlite3_changes(db)), proto::StatusCode::OK};
}

proto::StatusCode SQLiteBoundsStore::Execute(const std::string& sql) {
    auto [stmt, status] = Prepare(sql);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    return StepDone(stmt.get()).second;
}

std::string SQLiteBoundsStore::Column(std::string_view name) const {
    std::string quoted{"\""};
    for (auto c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string SQLiteBoundsStore::SelectList() const {
    return std::format("{}, {}, {}, {}, {}, {}", Column(schema.key_column), Column(schema.left_column),
                       Column(schema.right_column), Column(schema.parent_column), Column(schema.name_column),
                       Column(schema.deleted_column));
}

NodeRow SQLiteBoundsStore::ReadRow(sqlite3_stmt* stmt) const {
    NodeRow row;
    row.node_id = sqlite3_column_int64(stmt, 0);
    row.left = sqlite3_column_int64(stmt, 1);
    row.right = sqlite3_column_int64(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        row.parent_id = sqlite3_column_int64(stmt, 3);
    }
    if (auto* text = sqlite3_column_text(stmt, 4)) {
        row.name = std::string{reinterpret_cast<const char*>(text),
                               static_cast<size_t>(sqlite3_column_bytes(stmt, 4))};
    }
    row.deleted = sqlite3_column_int(stmt, 5) != 0;
    return row;
}

proto::StatusCode SQLiteBoundsStore::CreateTable() {
    auto table = std::format(
        "CREATE TABLE IF NOT EXISTS {} ({} INTEGER PRIMARY KEY AUTOINCREMENT, {} INTEGER NOT NULL, {} INTEGER NOT "
        "NULL, {} INTEGER NULL, {} TEXT NOT NULL DEFAULT '', {} INTEGER NOT NULL DEFAULT 0)",
        Table(), Column(schema.key_column), Column(schema.left_column), Column(schema.right_column),
        Column(schema.parent_column), Column(schema.name_column), Column(schema.deleted_column));
    if (auto status = Execute(table); status != proto::StatusCode::OK) {
        return status;
    }
    // Bounds are shifted in place by bulk updates, a unique index would reject intermediate rows
    auto index = std::format("CREATE INDEX IF NOT EXISTS {} ON {} ({}, {}, {})", Column(schema.table_name + "_bounds"),
                             Table(), Column(schema.left_column), Column(schema.right_column),
                             Column(schema.parent_column));
    return Execute(index);
}

proto::StatusCode SQLiteBoundsStore::BeginTransaction() {
    // Join a transaction of the connection owner with a savepoint
    bool begin = transaction_depth == 0 && sqlite3_get_autocommit(db);
    auto sql = begin ? std::string{"BEGIN IMMEDIATE"} : std::format("SAVEPOINT nestedset_{}", transaction_depth);
    auto status = Execute(sql);
    if (status == proto::StatusCode::OK) {
        if (transaction_depth == 0) {
            owns_transaction = begin;
        }
        ++transaction_depth;
    }
    return status;
}

proto::StatusCode SQLiteBoundsStore::Commit() {
    if (transaction_depth == 0) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    auto sql = (transaction_depth == 1 && owns_transaction)
                   ? std::string{"COMMIT"}
                   : std::format("RELEASE nestedset_{}", transaction_depth - 1);
    auto status = Execute(sql);
    if (status == proto::StatusCode::OK) {
        --transaction_depth;
    }
    return status;
}

proto::StatusCode SQLiteBoundsStore::Rollback() {
    if (transaction_depth == 0) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    // SQLite rolls back on its own after some errors
    if (sqlite3_get_autocommit(db)) {
        transaction_depth = 0;
        return proto::StatusCode::OK;
    }
    if (transaction_depth == 1 && owns_transaction) {
        auto status = Execute("ROLLBACK");
        if (status == proto::StatusCode::OK) {
            transaction_depth = 0;
        }
        return status;
    }
    auto savepoint = std::format("nestedset_{}", transaction_depth - 1);
    if (auto status = Execute("ROLLBACK TO " + savepoint); status != proto::StatusCode::OK) {
        return status;
    }
    auto status = Execute("RELEASE " + savepoint);
    if (status == proto::StatusCode::OK) {
        --transaction_depth;
    }
    return status;
}

std::pair<Bound, proto::StatusCode> SQLiteBoundsStore::ReadMaxRight() {
    auto [stmt, status] =
        Prepare(std::format("SELECT COALESCE(MAX({}), 0) FROM {}", Column(schema.right_column), Table()));
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    auto rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        return {0, Fail(rc)};
    }
    return {sqlite3_column_int64(stmt.get(), 0), proto::StatusCode::OK};
}

std::pair<std::optional<NodeRow>, proto::StatusCode> SQLiteBoundsStore::ReadNode(NodeID node_id,
                                                                                 bool include_soft_deleted) {
    auto sql = std::format("SELECT {} FROM {} WHERE {} = ?1", SelectList(), Table(), Column(schema.key_column));
    if (!include_soft_deleted) {
        sql += std::format(" AND {} = 0", Column(schema.deleted_column));
    }
    auto [stmt, status] = Prepare(sql);
    if (status != proto::StatusCode::OK) {
        return {std::nullopt, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, node_id);
    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return {std::nullopt, proto::StatusCode::OK};
    }
    if (rc != SQLITE_ROW) {
        return {std::nullopt, Fail(rc)};
    }
    return {ReadRow(stmt.get()), proto::StatusCode::OK};
}

proto::StatusCode SQLiteBoundsStore::Scan(const NodeFilter& filter, std::vector<NodeRow>& out) {
    std::vector<std::string> conditions;
    std::vector<int64_t> params;
    for (auto& predicate : filter.bounds) {
        auto& column = predicate.column == BoundColumn::Left ? schema.left_column : schema.right_column;
        conditions.push_back(Column(column) + comparisonOperator(predicate.comparison) + "?");
        params.push_back(predicate.value);
    }
    if (filter.parent_id.has_value()) {
        if (filter.parent_id->has_value()) {
            conditions.push_back(Column(schema.parent_column) + " = ?");
            params.push_back(**filter.parent_id);
        } else {
            conditions.push_back(Column(schema.parent_column) + " IS NULL");
        }
    }
    if (filter.excluded_node_id.has_value()) {
        conditions.push_back(Column(schema.key_column) + " <> ?");
        params.push_back(*filter.excluded_node_id);
    }
    if (!filter.include_soft_deleted) {
        conditions.push_back(Column(schema.deleted_column) + " = 0");
    }

    auto sql = std::format("SELECT {} FROM {}", SelectList(), Table());
    for (size_t i = 0; i < conditions.size(); ++i) {
        sql += (i == 0) ? " WHERE " : " AND ";
        sql += conditions[i];
    }
    sql += std::format(" ORDER BY {} {}", Column(schema.left_column),
                       filter.order == NodeOrder::Default ? "ASC" : "DESC");
    if (filter.limit.has_value() || filter.offset > 0) {
        sql += " LIMIT ? OFFSET ?";
        params.push_back(filter.limit.has_value() ? static_cast<int64_t>(*filter.limit) : -1);
        params.push_back(static_cast<int64_t>(filter.offset));
    }

    auto [stmt, status] = Prepare(sql);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        sqlite3_bind_int64(stmt.get(), static_cast<int>(i + 1), params[i]);
    }
    while (true) {
        auto rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return Fail(rc);
        }
        out.push_back(ReadRow(stmt.get()));
    }
    return proto::StatusCode::OK;
}

std::pair<size_t, proto::StatusCode> SQLiteBoundsStore::ShiftBounds(BoundColumn column, Bound cut, Bound delta) {
    auto name = Column(column == BoundColumn::Left ? schema.left_column : schema.right_column);
    auto [stmt, status] = Prepare(std::format("UPDATE {} SET {} = {} + ?1 WHERE {} >= ?2", Table(), name, name, name));
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, delta);
    sqlite3_bind_int64(stmt.get(), 2, cut);
    return StepDone(stmt.get());
}

std::pair<size_t, proto::StatusCode> SQLiteBoundsStore::MoveBounds(const BoundsMove& move) {
    auto l = Column(schema.left_column);
    auto r = Column(schema.right_column);
    // ?1 ?2 subtree, ?3 ?4 affected range, ?5 subtree offset, ?6 offset in between
    auto sql = std::format(
        "UPDATE {0} SET "
        "{1} = CASE WHEN {1} BETWEEN ?1 AND ?2 THEN {1} + ?5 WHEN {1} BETWEEN ?3 AND ?4 THEN {1} + ?6 ELSE {1} END, "
        "{2} = CASE WHEN {2} BETWEEN ?1 AND ?2 THEN {2} + ?5 WHEN {2} BETWEEN ?3 AND ?4 THEN {2} + ?6 ELSE {2} END "
        "WHERE {1} BETWEEN ?3 AND ?4 OR {2} BETWEEN ?3 AND ?4",
        Table(), l, r);
    auto [stmt, status] = Prepare(sql);
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, move.left);
    sqlite3_bind_int64(stmt.get(), 2, move.right);
    sqlite3_bind_int64(stmt.get(), 3, move.range_begin);
    sqlite3_bind_int64(stmt.get(), 4, move.range_end);
    sqlite3_bind_int64(stmt.get(), 5, move.distance);
    sqlite3_bind_int64(stmt.get(), 6, move.shift);
    return StepDone(stmt.get());
}

std::pair<size_t, proto::StatusCode> SQLiteBoundsStore::DeleteRange(Bound left, Bound right) {
    std::vector<NodeRow> removed;
    if (row_deleted_listener) {
        NodeFilter filter;
        filter.include_soft_deleted = true;
        filter.Where(BoundColumn::Left, BoundComparison::GreaterEqual, left)
            .Where(BoundColumn::Left, BoundComparison::LessEqual, right);
        if (auto status = Scan(filter, removed); status != proto::StatusCode::OK) {
            return {0, status};
        }
    }
    auto [stmt, status] = Prepare(
        std::format("DELETE FROM {} WHERE {} BETWEEN ?1 AND ?2", Table(), Column(schema.left_column)));
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, left);
    sqlite3_bind_int64(stmt.get(), 2, right);
    auto deleted = StepDone(stmt.get());
    if (deleted.second == proto::StatusCode::OK) {
        for (auto& row : removed) {
            row_deleted_listener(row);
        }
    }
    return deleted;
}

std::pair<size_t, proto::StatusCode> SQLiteBoundsStore::DeleteRow(NodeID node_id) {
    auto [stmt, status] =
        Prepare(std::format("DELETE FROM {} WHERE {} = ?1", Table(), Column(schema.key_column)));
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, node_id);
    return StepDone(stmt.get());
}

std::pair<NodeID, proto::StatusCode> SQLiteBoundsStore::InsertRow(const NodeRow& row) {
    auto [stmt, status] = Prepare(std::format("INSERT INTO {} ({}, {}, {}, {}, {}) VALUES (?1, ?2, ?3, ?4, ?5)",
                                              Table(), Column(schema.left_column), Column(schema.right_column),
                                              Column(schema.parent_column), Column(schema.name_column),
                                              Column(schema.deleted_column)));
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    sqlite3_bind_int64(stmt.get(), 1, row.left);
    sqlite3_bind_int64(stmt.get(), 2, row.right);
    if (row.parent_id.has_value()) {
        sqlite3_bind_int64(stmt.get(), 3, *row.parent_id);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    sqlite3_bind_text(stmt.get(), 4, row.name.data(), static_cast<int>(row.name.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 5, row.deleted ? 1 : 0);
    auto inserted = StepDone(stmt.get());
    if (inserted.second != proto::StatusCode::OK) {
        return {0, inserted.second};
    }
    return {sqlite3_last_insert_rowid(db), proto::StatusCode::OK};
}

proto::StatusCode SQLiteBoundsStore::UpdateParent(NodeID node_id, std::optional<NodeID> parent_id) {
    auto [stmt, status] = Prepare(std::format("UPDATE {} SET {} = ?1 WHERE {} = ?2", Table(),
                                              Column(schema.parent_column), Column(schema.key_column)));
    if (status != proto::StatusCode::OK) {
        return status;
    }
    if (parent_id.has_value()) {
        sqlite3_bind_int64(stmt.get(), 1, *parent_id);
    } else {
        sqlite3_bind_null(stmt.get(), 1);
    }
    sqlite3_bind_int64(stmt.get(), 2, node_id);
    auto [changed, step_status] = StepDone(stmt.get());
    if (step_status != proto::StatusCode::OK) {
        return step_status;
    }
    return changed == 0 ? proto::StatusCode::NODE_NOT_FOUND : proto::StatusCode::OK;
}

proto::StatusCode SQLiteBoundsStore::UpdateName(NodeID node_id, std::string_view name) {
    auto [stmt, status] = Prepare(std::format("UPDATE {} SET {} = ?1 WHERE {} = ?2", Table(),
                                              Column(schema.name_column), Column(schema.key_column)));
    if (status != proto::StatusCode::OK) {
        return status;
    }
    sqlite3_bind_text(stmt.get(), 1, name.data(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, node_id);
    auto [changed, step_status] = StepDone(stmt.get());
    if (step_status != proto::StatusCode::OK) {
        return step_status;
    }
    return changed == 0 ? proto::StatusCode::NODE_NOT_FOUND : proto::StatusCode::OK;
}

proto::StatusCode SQLiteBoundsStore::MarkDeleted(NodeID node_id, bool deleted) {
    auto [stmt, status] = Prepare(std::format("UPDATE {} SET {} = ?1 WHERE {} = ?2", Table(),
                                              Column(schema.deleted_column), Column(schema.key_column)));
    if (status != proto::StatusCode::OK) {
        return status;
    }
    sqlite3_bind_int(stmt.get(), 1, deleted ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 2, node_id);
    auto [changed, step_status] = StepDone(stmt.get());
    if (step_status != proto::StatusCode::OK) {
        return step_status;
    }
    return changed == 0 ? proto::StatusCode::NODE_NOT_FOUND : proto::StatusCode::OK;
}
