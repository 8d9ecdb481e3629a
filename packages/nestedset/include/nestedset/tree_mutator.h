#pragma once

#include <cstddef>
#include <utility>

#include "nestedset/bounds_store.h"
#include "nestedset/gap_allocator.h"
#include "nestedset/node.h"
#include "nestedset/pending_action.h"

namespace nestedset {

/// The per-tree session context
struct TreeSession {
    /// Do deletes only mark rows as deleted?
    bool soft_delete = false;
    /// Is a subtree delete running?
    /// Deletes of descendants that are triggered while the flag is set only remove their own row.
    bool deleting = false;
    /// The number of applied intents
    size_t actions_performed = 0;
};

/// Applies structural intents to the bounds of a node
class TreeMutator {
   protected:
    /// The store
    BoundsStore& store;
    /// The session
    TreeSession& session;
    /// The gap allocator
    GapAllocator gaps;

    /// Make a node a root
    std::pair<bool, proto::StatusCode> ApplyRoot(Node& node);
    /// Insert a node as first or last child of a parent
    std::pair<bool, proto::StatusCode> ApplyAppendOrPrepend(Node& node, Node& parent, bool prepend);
    /// Insert a node right before or after a sibling
    std::pair<bool, proto::StatusCode> ApplyBeforeOrAfter(Node& node, Node& sibling, bool after);
    /// Insert a fresh node or move a persisted one to a position
    std::pair<bool, proto::StatusCode> InsertAt(Node& node, Bound position);
    /// Open a gap of two and place a fresh node in it
    proto::StatusCode InsertNode(Node& node, Bound position);
    /// Move the subtree of a persisted node to a position
    std::pair<bool, proto::StatusCode> MoveNode(Node& node, Bound position);

   public:
    /// Constructor
    TreeMutator(BoundsStore& store, TreeSession& session);

    /// Get the session
    auto& GetSession() const { return session; }
    /// Apply an intent, returns whether the bounds of the node changed
    std::pair<bool, proto::StatusCode> Apply(Node& node, const MutationIntent& intent);
    /// Reload the bounds and the parent of a node from storage
    proto::StatusCode Refresh(Node& node);
    /// Delete the subtree of a node and close the gap, returns the number of deleted rows
    std::pair<size_t, proto::StatusCode> DeleteSubtree(Node& node);
};

}  // namespace nestedset
