#include "nestedset/pending_action.h"

#include "nestedset/node.h"
#include "nestedset/tree_mutator.h"

using namespace nestedset;

namespace nestedset {

proto::MutationType GetMutationType(const MutationIntent& intent) {
    switch (intent.index()) {
        case 0:
            return proto::MutationType::ROOT;
        case 1:
            return proto::MutationType::APPEND_TO;
        case 2:
            return proto::MutationType::PREPEND_TO;
        case 3:
            return proto::MutationType::BEFORE;
        case 4:
            return proto::MutationType::AFTER;
        default:
            return proto::MutationType::NONE;
    }
}

}  // namespace nestedset

std::pair<bool, proto::StatusCode> PendingActionQueue::Dispatch(Node& node, TreeMutator& mutator) {
    node.moved = false;
    if (!pending.has_value()) {
        return {false, proto::StatusCode::OK};
    }
    auto intent = std::move(*pending);
    pending.reset();
    auto [moved, status] = mutator.Apply(node, intent);
    node.moved = moved && status == proto::StatusCode::OK;
    return {node.moved, status};
}
