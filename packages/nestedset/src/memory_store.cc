#include "nestedset/memory_store.h"

#include <algorithm>

using namespace nestedset;

void MemoryBoundsStore::RebuildIndex() {
    rows_by_id.clear();
    rows_by_id.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        rows_by_id.insert({rows[i].node_id, i});
    }
}

NodeRow* MemoryBoundsStore::FindRow(NodeID node_id) {
    auto iter = rows_by_id.find(node_id);
    if (iter == rows_by_id.end()) {
        return nullptr;
    }
    return &rows[iter->second];
}

void MemoryBoundsStore::InsertRaw(NodeRow row) {
    next_node_id = std::max(next_node_id, row.node_id + 1);
    rows_by_id.insert({row.node_id, rows.size()});
    rows.push_back(std::move(row));
}

proto::StatusCode MemoryBoundsStore::BeginTransaction() {
    snapshots.push_back(Snapshot{.rows = rows, .next_node_id = next_node_id});
    return proto::StatusCode::OK;
}

proto::StatusCode MemoryBoundsStore::Commit() {
    if (snapshots.empty()) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    snapshots.pop_back();
    return proto::StatusCode::OK;
}

proto::StatusCode MemoryBoundsStore::Rollback() {
    if (snapshots.empty()) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    auto& snapshot = snapshots.back();
    rows = std::move(snapshot.rows);
    next_node_id = snapshot.next_node_id;
    snapshots.pop_back();
    RebuildIndex();
    return proto::StatusCode::OK;
}

std::pair<Bound, proto::StatusCode> MemoryBoundsStore::ReadMaxRight() {
    Bound max_right = 0;
    for (auto& row : rows) {
        max_right = std::max(max_right, row.right);
    }
    return {max_right, proto::StatusCode::OK};
}

std::pair<std::optional<NodeRow>, proto::StatusCode> MemoryBoundsStore::ReadNode(NodeID node_id,
                                                                                 bool include_soft_deleted) {
    auto* row = FindRow(node_id);
    if (!row || (row->deleted && !include_soft_deleted)) {
        return {std::nullopt, proto::StatusCode::OK};
    }
    return {*row, proto::StatusCode::OK};
}

proto::StatusCode MemoryBoundsStore::Scan(const NodeFilter& filter, std::vector<NodeRow>& out) {
    std::vector<const NodeRow*> matches;
    for (auto& row : rows) {
        if (filter.Matches(row)) {
            matches.push_back(&row);
        }
    }
    if (filter.order == NodeOrder::Default) {
        std::sort(matches.begin(), matches.end(), [](auto* l, auto* r) { return l->left < r->left; });
    } else {
        std::sort(matches.begin(), matches.end(), [](auto* l, auto* r) { return l->left > r->left; });
    }
    auto begin = std::min(filter.offset, matches.size());
    auto end = matches.size();
    if (filter.limit.has_value()) {
        end = std::min(end, begin + *filter.limit);
    }
    for (auto i = begin; i < end; ++i) {
        out.push_back(*matches[i]);
    }
    return proto::StatusCode::OK;
}

std::pair<size_t, proto::StatusCode> MemoryBoundsStore::ShiftBounds(BoundColumn column, Bound cut, Bound delta) {
    size_t updated = 0;
    for (auto& row : rows) {
        auto& value = column == BoundColumn::Left ? row.left : row.right;
        if (value >= cut) {
            value += delta;
            ++updated;
        }
    }
    return {updated, proto::StatusCode::OK};
}

std::pair<size_t, proto::StatusCode> MemoryBoundsStore::MoveBounds(const BoundsMove& move) {
    size_t updated = 0;
    for (auto& row : rows) {
        auto left = move.Map(row.left);
        auto right = move.Map(row.right);
        if (left != row.left || right != row.right) {
            row.left = left;
            row.right = right;
            ++updated;
        }
    }
    return {updated, proto::StatusCode::OK};
}

std::pair<size_t, proto::StatusCode> MemoryBoundsStore::DeleteRange(Bound left, Bound right) {
    std::vector<NodeRow> removed;
    auto end = std::stable_partition(rows.begin(), rows.end(),
                                     [&](const NodeRow& row) { return row.left < left || row.left > right; });
    removed.insert(removed.end(), std::make_move_iterator(end), std::make_move_iterator(rows.end()));
    rows.erase(end, rows.end());
    RebuildIndex();
    if (row_deleted_listener) {
        for (auto& row : removed) {
            row_deleted_listener(row);
        }
    }
    return {removed.size(), proto::StatusCode::OK};
}

std::pair<size_t, proto::StatusCode> MemoryBoundsStore::DeleteRow(NodeID node_id) {
    auto iter = rows_by_id.find(node_id);
    if (iter == rows_by_id.end()) {
        return {0, proto::StatusCode::OK};
    }
    rows.erase(rows.begin() + iter->second);
    RebuildIndex();
    return {1, proto::StatusCode::OK};
}

std::pair<NodeID, proto::StatusCode> MemoryBoundsStore::InsertRow(const NodeRow& row) {
    auto node_id = next_node_id++;
    rows_by_id.insert({node_id, rows.size()});
    rows.push_back(row);
    rows.back().node_id = node_id;
    return {node_id, proto::StatusCode::OK};
}

proto::StatusCode MemoryBoundsStore::UpdateParent(NodeID node_id, std::optional<NodeID> parent_id) {
    auto* row = FindRow(node_id);
    if (!row) {
        return proto::StatusCode::NODE_NOT_FOUND;
    }
    row->parent_id = parent_id;
    return proto::StatusCode::OK;
}

proto::StatusCode MemoryBoundsStore::UpdateName(NodeID node_id, std::string_view name) {
    auto* row = FindRow(node_id);
    if (!row) {
        return proto::StatusCode::NODE_NOT_FOUND;
    }
    row->name = std::string{name};
    return proto::StatusCode::OK;
}

proto::StatusCode MemoryBoundsStore::MarkDeleted(NodeID node_id, bool deleted) {
    auto* row = FindRow(node_id);
    if (!row) {
        return proto::StatusCode::NODE_NOT_FOUND;
    }
    row->deleted = deleted;
    return proto::StatusCode::OK;
}
