#include "nestedset/tree.h"

using namespace nestedset;

Tree::Tree(BoundsStore& store, TreeOptions options) : store(store), session(), mutator(store, session) {
    session.soft_delete = options.soft_delete;
}

proto::StatusCode Tree::WriteRow(Node& node) {
    if (!node.Exists()) {
        auto [node_id, status] = store.InsertRow(node.ToRow());
        if (status != proto::StatusCode::OK) {
            return status;
        }
        node.node_id = node_id;
        return proto::StatusCode::OK;
    }
    // Bounds are owned by the bulk updates, only the parent and the payload are written
    if (node.moved) {
        if (auto status = store.UpdateParent(*node.node_id, node.parent_id); status != proto::StatusCode::OK) {
            return status;
        }
    }
    if (node.name_changed) {
        if (auto status = store.UpdateName(*node.node_id, node.name); status != proto::StatusCode::OK) {
            return status;
        }
    }
    return proto::StatusCode::OK;
}

void Tree::ResetDeleted(Node& node) {
    node.node_id.reset();
    node.parent_id.reset();
    node.left = 0;
    node.right = 0;
    node.moved = false;
    node.name_changed = false;
    node.pending.Set(mutation::MakeRoot{});
}

proto::StatusCode Tree::Save(Node& node) {
    auto node_id = node.node_id;
    auto left = node.left;
    auto right = node.right;
    auto parent_id = node.parent_id;
    auto fail = [&](proto::StatusCode status) {
        node.node_id = node_id;
        node.left = left;
        node.right = right;
        node.parent_id = parent_id;
        node.moved = false;
        return status;
    };

    // A node that is not persisted needs a position
    if (!node.Exists() && !node.pending.HasPending()) {
        node.pending.Set(mutation::MakeRoot{});
    }

    Transaction txn{store};
    if (txn.GetStatus() != proto::StatusCode::OK) {
        return txn.GetStatus();
    }
    if (auto [_, status] = node.pending.Dispatch(node, mutator); status != proto::StatusCode::OK) {
        return fail(status);
    }
    if (auto status = WriteRow(node); status != proto::StatusCode::OK) {
        return fail(status);
    }
    if (auto status = txn.Commit(); status != proto::StatusCode::OK) {
        return fail(status);
    }
    node.name_changed = false;
    return proto::StatusCode::OK;
}

std::pair<size_t, proto::StatusCode> Tree::Delete(Node& node) {
    if (!node.Exists()) {
        return {0, proto::StatusCode::NODE_NOT_PERSISTED};
    }
    // A descendant of a subtree that is being deleted, the bounds are handled by the subtree delete
    if (session.deleting) {
        auto deleted = store.DeleteRow(*node.node_id);
        if (deleted.second == proto::StatusCode::OK) {
            ResetDeleted(node);
        }
        return deleted;
    }
    if (session.soft_delete) {
        if (auto status = store.MarkDeleted(*node.node_id, true); status != proto::StatusCode::OK) {
            return {0, status};
        }
        node.deleted = true;
        return {1, proto::StatusCode::OK};
    }

    Transaction txn{store};
    if (txn.GetStatus() != proto::StatusCode::OK) {
        return {0, txn.GetStatus()};
    }
    auto [deleted, status] = mutator.DeleteSubtree(node);
    if (status != proto::StatusCode::OK) {
        return {0, status};
    }
    if (auto commit_status = txn.Commit(); commit_status != proto::StatusCode::OK) {
        return {0, commit_status};
    }
    ResetDeleted(node);
    return {deleted, proto::StatusCode::OK};
}

proto::StatusCode Tree::Restore(Node& node) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    if (auto status = store.MarkDeleted(*node.node_id, false); status != proto::StatusCode::OK) {
        return status;
    }
    node.deleted = false;
    return proto::StatusCode::OK;
}

proto::StatusCode Tree::Refresh(Node& node) { return mutator.Refresh(node); }

std::pair<std::unique_ptr<Node>, proto::StatusCode> Tree::Find(NodeID node_id, bool include_soft_deleted) {
    auto [row, status] = store.ReadNode(node_id, include_soft_deleted);
    if (status != proto::StatusCode::OK) {
        return {nullptr, status};
    }
    if (!row.has_value()) {
        return {nullptr, proto::StatusCode::NODE_NOT_FOUND};
    }
    return {std::make_unique<Node>(*row), proto::StatusCode::OK};
}

std::pair<std::unique_ptr<Node>, proto::StatusCode> Tree::Create(const NodeTemplate& node, Node* parent) {
    Transaction txn{store};
    if (txn.GetStatus() != proto::StatusCode::OK) {
        return {nullptr, txn.GetStatus()};
    }
    auto instance = std::make_unique<Node>(node.name);
    if (parent) {
        instance->AppendTo(*parent);
    }
    if (auto status = Save(*instance); status != proto::StatusCode::OK) {
        return {nullptr, status};
    }
    for (auto& child : node.children) {
        if (auto [_, status] = Create(child, instance.get()); status != proto::StatusCode::OK) {
            return {nullptr, status};
        }
    }
    if (auto status = txn.Commit(); status != proto::StatusCode::OK) {
        return {nullptr, status};
    }
    return {std::move(instance), proto::StatusCode::OK};
}

proto::StatusCode Tree::SaveAsRoot(Node& node) { return Save(node.MakeRoot()); }

proto::StatusCode Tree::Append(Node& parent, Node& child) { return Save(child.AppendTo(parent)); }

proto::StatusCode Tree::Prepend(Node& parent, Node& child) { return Save(child.PrependTo(parent)); }

proto::StatusCode Tree::InsertBefore(Node& node, Node& target) {
    if (auto status = Save(node.Before(target)); status != proto::StatusCode::OK) {
        return status;
    }
    return Refresh(target);
}

proto::StatusCode Tree::InsertAfter(Node& node, Node& target) {
    if (auto status = Save(node.After(target)); status != proto::StatusCode::OK) {
        return status;
    }
    return Refresh(target);
}

std::pair<bool, proto::StatusCode> Tree::Up(Node& node, size_t amount) {
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto [sibling, status] = Query().PrevSibling(node, amount > 0 ? amount - 1 : 0);
    if (status != proto::StatusCode::OK || !sibling.has_value()) {
        return {false, status};
    }
    Node target{*sibling};
    if (auto insert_status = InsertBefore(node, target); insert_status != proto::StatusCode::OK) {
        return {false, insert_status};
    }
    return {node.HasMoved(), proto::StatusCode::OK};
}

std::pair<bool, proto::StatusCode> Tree::Down(Node& node, size_t amount) {
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto [sibling, status] = Query().NextSibling(node, amount > 0 ? amount - 1 : 0);
    if (status != proto::StatusCode::OK || !sibling.has_value()) {
        return {false, status};
    }
    Node target{*sibling};
    if (auto insert_status = InsertAfter(node, target); insert_status != proto::StatusCode::OK) {
        return {false, insert_status};
    }
    return {node.HasMoved(), proto::StatusCode::OK};
}

proto::StatusCode Tree::SaveWithParent(Node& node, std::optional<NodeID> parent_id) {
    if (node.Exists() && node.parent_id == parent_id) {
        return Save(node);
    }
    if (!parent_id.has_value()) {
        return Save(node.MakeRoot());
    }
    auto [parent, status] = Find(*parent_id);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    return Save(node.AppendTo(*parent));
}

std::pair<flatbuffers::Offset<proto::Tree>, proto::StatusCode> Tree::Describe(flatbuffers::FlatBufferBuilder& builder) {
    std::vector<NodeRow> rows;
    if (auto status = Query().All(rows); status != proto::StatusCode::OK) {
        return {{}, status};
    }
    auto [errors, status] = CountErrors();
    if (status != proto::StatusCode::OK) {
        return {{}, status};
    }

    // Derive the depth from the open intervals
    std::vector<Bound> open;
    std::vector<flatbuffers::Offset<proto::Node>> nodes;
    nodes.reserve(rows.size());
    for (auto& row : rows) {
        while (!open.empty() && open.back() < row.left) {
            open.pop_back();
        }
        nodes.push_back(row.Pack(builder, static_cast<uint32_t>(open.size())));
        open.push_back(row.right);
    }
    auto nodes_ofs = builder.CreateVector(nodes);
    auto errors_ofs = errors.Pack(builder);
    proto::TreeBuilder out{builder};
    out.add_nodes(nodes_ofs);
    out.add_errors(errors_ofs);
    return {out.Finish(), proto::StatusCode::OK};
}
