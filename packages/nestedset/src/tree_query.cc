#include "nestedset/tree_query.h"

#include <algorithm>
#include <set>

#include "ankerl/unordered_dense.h"

using namespace nestedset;

flatbuffers::Offset<proto::TreeErrors> TreeErrors::Pack(flatbuffers::FlatBufferBuilder& builder) const {
    proto::TreeErrorsBuilder out{builder};
    out.add_oddness(oddness);
    out.add_duplicates(duplicates);
    out.add_wrong_parent(wrong_parent);
    out.add_missing_parent(missing_parent);
    out.add_gaps(gaps);
    return out.Finish();
}

TreeQuery::TreeQuery(BoundsStore& store, bool include_soft_deleted)
    : store(store), include_soft_deleted(include_soft_deleted) {}

NodeFilter TreeQuery::CreateFilter() const {
    NodeFilter filter;
    filter.include_soft_deleted = include_soft_deleted;
    return filter;
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::First(NodeFilter filter) {
    filter.limit = 1;
    std::vector<NodeRow> rows;
    if (auto status = store.Scan(filter, rows); status != proto::StatusCode::OK) {
        return {std::nullopt, status};
    }
    if (rows.empty()) {
        return {std::nullopt, proto::StatusCode::OK};
    }
    return {std::move(rows.front()), proto::StatusCode::OK};
}

proto::StatusCode TreeQuery::All(std::vector<NodeRow>& out, NodeOrder order) {
    auto filter = CreateFilter();
    filter.order = order;
    return store.Scan(filter, out);
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::Get(NodeID node_id) {
    return store.ReadNode(node_id, include_soft_deleted);
}

proto::StatusCode TreeQuery::Descendants(const Node& node, std::vector<NodeRow>& out, NodeOrder order) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Left, BoundComparison::Greater, node.GetLeft())
        .Where(BoundColumn::Left, BoundComparison::Less, node.GetRight());
    filter.order = order;
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::Ancestors(const Node& node, std::vector<NodeRow>& out) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Left, BoundComparison::Less, node.GetLeft())
        .Where(BoundColumn::Right, BoundComparison::Greater, node.GetRight());
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::Children(const Node& node, std::vector<NodeRow>& out) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.WhereParent(node.GetNodeId());
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::Roots(std::vector<NodeRow>& out) {
    auto filter = CreateFilter();
    filter.WhereParent(std::nullopt);
    return store.Scan(filter, out);
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::Root() {
    auto filter = CreateFilter();
    filter.WhereParent(std::nullopt);
    return First(std::move(filter));
}

proto::StatusCode TreeQuery::Siblings(const Node& node, std::vector<NodeRow>& out) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.WhereParent(node.GetParentId()).WhereNot(*node.GetNodeId());
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::NextSiblings(const Node& node, std::vector<NodeRow>& out, size_t offset,
                                          std::optional<size_t> limit) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Left, BoundComparison::Greater, node.GetRight()).WhereParent(node.GetParentId());
    filter.offset = offset;
    filter.limit = limit;
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::PrevSiblings(const Node& node, std::vector<NodeRow>& out, size_t offset,
                                          std::optional<size_t> limit) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Right, BoundComparison::Less, node.GetLeft()).WhereParent(node.GetParentId());
    filter.order = NodeOrder::Reversed;
    filter.offset = offset;
    filter.limit = limit;
    return store.Scan(filter, out);
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::NextSibling(const Node& node, size_t offset) {
    std::vector<NodeRow> rows;
    if (auto status = NextSiblings(node, rows, offset, 1); status != proto::StatusCode::OK) {
        return {std::nullopt, status};
    }
    if (rows.empty()) {
        return {std::nullopt, proto::StatusCode::OK};
    }
    return {std::move(rows.front()), proto::StatusCode::OK};
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::PrevSibling(const Node& node, size_t offset) {
    std::vector<NodeRow> rows;
    if (auto status = PrevSiblings(node, rows, offset, 1); status != proto::StatusCode::OK) {
        return {std::nullopt, status};
    }
    if (rows.empty()) {
        return {std::nullopt, proto::StatusCode::OK};
    }
    return {std::move(rows.front()), proto::StatusCode::OK};
}

proto::StatusCode TreeQuery::Next(const Node& node, std::vector<NodeRow>& out) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Left, BoundComparison::Greater, node.GetRight());
    return store.Scan(filter, out);
}

proto::StatusCode TreeQuery::Prev(const Node& node, std::vector<NodeRow>& out) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Right, BoundComparison::Less, node.GetLeft());
    filter.order = NodeOrder::Reversed;
    return store.Scan(filter, out);
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::GetNext(const Node& node) {
    if (!node.Exists()) {
        return {std::nullopt, proto::StatusCode::NODE_NOT_PERSISTED};
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Left, BoundComparison::Greater, node.GetRight());
    return First(std::move(filter));
}

std::pair<std::optional<NodeRow>, proto::StatusCode> TreeQuery::GetPrev(const Node& node) {
    if (!node.Exists()) {
        return {std::nullopt, proto::StatusCode::NODE_NOT_PERSISTED};
    }
    auto filter = CreateFilter();
    filter.Where(BoundColumn::Right, BoundComparison::Less, node.GetLeft());
    filter.order = NodeOrder::Reversed;
    return First(std::move(filter));
}

std::pair<TreeErrors, proto::StatusCode> TreeQuery::CountErrors() {
    TreeErrors errors;
    NodeFilter filter;
    filter.include_soft_deleted = true;
    std::vector<NodeRow> rows;
    if (auto status = store.Scan(filter, rows); status != proto::StatusCode::OK) {
        return {errors, status};
    }

    // Collect the bound values
    ankerl::unordered_dense::map<Bound, std::vector<NodeID>> rows_by_bound;
    ankerl::unordered_dense::set<NodeID> keys;
    Bound max_right = 0;
    for (auto& row : rows) {
        if (row.left >= row.right) {
            ++errors.oddness;
        }
        rows_by_bound[row.left].push_back(row.node_id);
        if (row.right != row.left) {
            rows_by_bound[row.right].push_back(row.node_id);
        }
        keys.insert(row.node_id);
        max_right = std::max(max_right, std::max(row.left, row.right));
    }

    // Count every pair of rows only once, even if they share both bounds
    std::set<std::pair<NodeID, NodeID>> duplicate_pairs;
    size_t used_values = 0;
    for (auto& [value, owners] : rows_by_bound) {
        if (value >= 1 && value <= max_right) {
            ++used_values;
        }
        for (size_t i = 0; i < owners.size(); ++i) {
            for (size_t j = i + 1; j < owners.size(); ++j) {
                duplicate_pairs.insert({std::min(owners[i], owners[j]), std::max(owners[i], owners[j])});
            }
        }
    }
    errors.duplicates = static_cast<uint32_t>(duplicate_pairs.size());
    errors.gaps = static_cast<uint32_t>(max_right - static_cast<Bound>(used_values));

    // Sweep the rows in left order and track the open intervals
    std::vector<const NodeRow*> open;
    for (auto& row : rows) {
        while (!open.empty() && open.back()->right < row.left) {
            open.pop_back();
        }
        const NodeRow* container = nullptr;
        for (auto iter = open.rbegin(); iter != open.rend(); ++iter) {
            if ((*iter)->left < row.left && (*iter)->right > row.right) {
                container = *iter;
                break;
            }
        }
        open.push_back(&row);

        if (row.parent_id.has_value() && !keys.contains(*row.parent_id)) {
            ++errors.missing_parent;
        } else if (row.parent_id.has_value()) {
            if (!container || container->node_id != *row.parent_id) {
                ++errors.wrong_parent;
            }
        } else if (container) {
            ++errors.wrong_parent;
        }
    }
    return {errors, proto::StatusCode::OK};
}
