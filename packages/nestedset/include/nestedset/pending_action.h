#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <variant>

#include "nestedset/proto/proto_generated.h"

namespace nestedset {

class Node;
class TreeMutator;

namespace mutation {

/// Make the node a root
struct MakeRoot {};
/// Insert the node as last child of a parent
struct AppendTo {
    /// The parent
    std::reference_wrapper<Node> parent;
};
/// Insert the node as first child of a parent
struct PrependTo {
    /// The parent
    std::reference_wrapper<Node> parent;
};
/// Insert the node right before a sibling
struct Before {
    /// The sibling
    std::reference_wrapper<Node> sibling;
};
/// Insert the node right after a sibling
struct After {
    /// The sibling
    std::reference_wrapper<Node> sibling;
};

}  // namespace mutation

/// A structural intent that is applied at the next save.
/// Intents refer to their target instances, a target must outlive the save that applies the intent.
using MutationIntent =
    std::variant<mutation::MakeRoot, mutation::AppendTo, mutation::PrependTo, mutation::Before, mutation::After>;

/// Get the mutation type of an intent
proto::MutationType GetMutationType(const MutationIntent& intent);

/// Buffers at most one pending intent of a node instance.
/// Setting a new intent replaces the previous one, there is no queueing.
class PendingActionQueue {
   protected:
    /// The pending intent (if any)
    std::optional<MutationIntent> pending;

   public:
    /// Constructor
    PendingActionQueue() = default;
    /// Constructor
    explicit PendingActionQueue(MutationIntent intent) : pending(std::move(intent)) {}

    /// Is there a pending intent?
    bool HasPending() const { return pending.has_value(); }
    /// Get the pending intent
    auto& GetPending() const { return pending; }
    /// Get the pending mutation type
    proto::MutationType GetPendingType() const {
        return pending.has_value() ? GetMutationType(*pending) : proto::MutationType::NONE;
    }
    /// Replace the pending intent
    void Set(MutationIntent intent) { pending = std::move(intent); }
    /// Drop the pending intent
    void Clear() { pending.reset(); }

    /// Dispatch the pending intent to the mutator.
    /// The intent is cleared before it runs, regardless of the outcome.
    /// Returns whether the bounds of the node changed.
    std::pair<bool, proto::StatusCode> Dispatch(Node& node, TreeMutator& mutator);
};

}  // namespace nestedset
