#include "nestedset/tree_mutator.h"

using namespace nestedset;

namespace {

/// Marks a session as deleting a subtree while in scope
struct DeletingScope {
    TreeSession& session;
    explicit DeletingScope(TreeSession& session) : session(session) { session.deleting = true; }
    ~DeletingScope() { session.deleting = false; }
};

}  // namespace

TreeMutator::TreeMutator(BoundsStore& store, TreeSession& session) : store(store), session(session), gaps(store) {}

std::pair<bool, proto::StatusCode> TreeMutator::Apply(Node& node, const MutationIntent& intent) {
    std::pair<bool, proto::StatusCode> result;
    if (std::holds_alternative<mutation::MakeRoot>(intent)) {
        result = ApplyRoot(node);
    } else if (auto* append = std::get_if<mutation::AppendTo>(&intent)) {
        result = ApplyAppendOrPrepend(node, append->parent.get(), false);
    } else if (auto* prepend = std::get_if<mutation::PrependTo>(&intent)) {
        result = ApplyAppendOrPrepend(node, prepend->parent.get(), true);
    } else if (auto* before = std::get_if<mutation::Before>(&intent)) {
        result = ApplyBeforeOrAfter(node, before->sibling.get(), false);
    } else if (auto* after = std::get_if<mutation::After>(&intent)) {
        result = ApplyBeforeOrAfter(node, after->sibling.get(), true);
    } else {
        return {false, proto::StatusCode::MUTATION_TYPE_INVALID};
    }
    if (result.second == proto::StatusCode::OK) {
        ++session.actions_performed;
    }
    return result;
}

proto::StatusCode TreeMutator::Refresh(Node& node) {
    if (!node.Exists()) {
        return proto::StatusCode::NODE_NOT_PERSISTED;
    }
    auto [row, status] = store.ReadNode(*node.node_id, true);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    if (!row.has_value()) {
        return proto::StatusCode::NODE_NOT_FOUND;
    }
    node.AssignBounds(*row);
    return proto::StatusCode::OK;
}

std::pair<bool, proto::StatusCode> TreeMutator::ApplyRoot(Node& node) {
    if (!node.Exists()) {
        auto [max_right, status] = store.ReadMaxRight();
        if (status != proto::StatusCode::OK) {
            return {false, status};
        }
        node.left = max_right + 1;
        node.right = max_right + 2;
        node.parent_id.reset();
        return {true, proto::StatusCode::OK};
    }
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {false, status};
    }
    if (node.IsRoot()) {
        return {false, proto::StatusCode::OK};
    }
    auto [max_right, status] = store.ReadMaxRight();
    if (status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto moved = MoveNode(node, max_right + 1);
    if (moved.second == proto::StatusCode::OK && moved.first) {
        node.parent_id.reset();
    }
    return moved;
}

std::pair<bool, proto::StatusCode> TreeMutator::ApplyAppendOrPrepend(Node& node, Node& parent, bool prepend) {
    if (!parent.Exists()) {
        return {false, proto::StatusCode::PARENT_NOT_PERSISTED};
    }
    if (auto status = Refresh(parent); status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto position = prepend ? (parent.left + 1) : parent.right;
    auto inserted = InsertAt(node, position);
    if (inserted.second != proto::StatusCode::OK || !inserted.first) {
        return inserted;
    }
    node.parent_id = parent.node_id;
    if (auto status = Refresh(parent); status != proto::StatusCode::OK) {
        return {false, status};
    }
    return inserted;
}

std::pair<bool, proto::StatusCode> TreeMutator::ApplyBeforeOrAfter(Node& node, Node& sibling, bool after) {
    if (!sibling.Exists()) {
        return {false, proto::StatusCode::SIBLING_NOT_PERSISTED};
    }
    if (auto status = Refresh(sibling); status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto position = after ? (sibling.right + 1) : sibling.left;
    auto parent_id = sibling.parent_id;
    auto inserted = InsertAt(node, position);
    if (inserted.second != proto::StatusCode::OK || !inserted.first) {
        return inserted;
    }
    node.parent_id = parent_id;
    return inserted;
}

std::pair<bool, proto::StatusCode> TreeMutator::InsertAt(Node& node, Bound position) {
    if (node.Exists()) {
        return MoveNode(node, position);
    }
    auto status = InsertNode(node, position);
    return {status == proto::StatusCode::OK, status};
}

proto::StatusCode TreeMutator::InsertNode(Node& node, Bound position) {
    if (auto status = gaps.MakeGap(position, 2); status != proto::StatusCode::OK) {
        return status;
    }
    node.left = position;
    node.right = position + 1;
    return proto::StatusCode::OK;
}

std::pair<bool, proto::StatusCode> TreeMutator::MoveNode(Node& node, Bound position) {
    // The instance may hold stale bounds
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {false, status};
    }
    auto move = BoundsMove::Create(node.left, node.right, position);
    if (!move.has_value()) {
        return {false, proto::StatusCode::OK};
    }
    if (auto [_, status] = store.MoveBounds(*move); status != proto::StatusCode::OK) {
        return {false, status};
    }
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {false, status};
    }
    return {true, proto::StatusCode::OK};
}

std::pair<size_t, proto::StatusCode> TreeMutator::DeleteSubtree(Node& node) {
    if (auto status = Refresh(node); status != proto::StatusCode::OK) {
        return {0, status};
    }
    auto left = node.left;
    auto right = node.right;
    auto height = right - left + 1;

    size_t deleted = 0;
    {
        DeletingScope scope{session};
        auto [count, status] = store.DeleteRange(left, right);
        if (status != proto::StatusCode::OK) {
            return {0, status};
        }
        deleted = count;
    }
    if (auto gap_status = gaps.MakeGap(right + 1, -height); gap_status != proto::StatusCode::OK) {
        return {0, gap_status};
    }
    return {deleted, proto::StatusCode::OK};
}
