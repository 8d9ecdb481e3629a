#pragma once

#include <flatbuffers/flatbuffer_builder.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nestedset/bounds_store.h"
#include "nestedset/node.h"
#include "nestedset/tree_mutator.h"
#include "nestedset/tree_query.h"

namespace nestedset {

/// The options of a tree
struct TreeOptions {
    /// Do deletes only mark rows as deleted?
    bool soft_delete = false;
};

/// A node with children that is created in one go
struct NodeTemplate {
    /// The name
    std::string name;
    /// The children in order
    std::vector<NodeTemplate> children;
};

/// A tree on top of a store.
///
/// Every save and delete runs in a single store transaction.
/// A save first dispatches the pending intent of the node and then writes the row of the node.
/// If anything fails, the transaction is rolled back and the bounds and the parent of the instance are restored.
class Tree {
   protected:
    /// The store
    BoundsStore& store;
    /// The session
    TreeSession session;
    /// The mutator
    TreeMutator mutator;

    /// Insert or update the row of a node
    proto::StatusCode WriteRow(Node& node);
    /// Reset a deleted node so that it can be created again
    void ResetDeleted(Node& node);

   public:
    /// Constructor
    explicit Tree(BoundsStore& store, TreeOptions options = {});
    /// Trees must not be copied
    Tree(const Tree& other) = delete;
    /// Trees must not be copy-assigned
    Tree& operator=(const Tree& other) = delete;

    /// Get the store
    auto& GetStore() const { return store; }
    /// Get the session
    auto& GetSession() const { return session; }

    /// Apply the pending intent of a node and write its row
    proto::StatusCode Save(Node& node);
    /// Delete a node with its subtree, returns the number of deleted rows
    std::pair<size_t, proto::StatusCode> Delete(Node& node);
    /// Restore a soft-deleted node
    proto::StatusCode Restore(Node& node);
    /// Reload the bounds and the parent of a node
    proto::StatusCode Refresh(Node& node);
    /// Load a node, soft-deleted nodes only if requested
    std::pair<std::unique_ptr<Node>, proto::StatusCode> Find(NodeID node_id, bool include_soft_deleted = false);
    /// Create a node with all its children, appended to a parent or as root
    std::pair<std::unique_ptr<Node>, proto::StatusCode> Create(const NodeTemplate& node, Node* parent = nullptr);

    /// Save a node as root
    proto::StatusCode SaveAsRoot(Node& node);
    /// Save a node as last child of a parent
    proto::StatusCode Append(Node& parent, Node& child);
    /// Save a node as first child of a parent
    proto::StatusCode Prepend(Node& parent, Node& child);
    /// Save a node right before a target and refresh the target
    proto::StatusCode InsertBefore(Node& node, Node& target);
    /// Save a node right after a target and refresh the target
    proto::StatusCode InsertAfter(Node& node, Node& target);
    /// Move a node before its n-th previous sibling, false if there is no such sibling
    std::pair<bool, proto::StatusCode> Up(Node& node, size_t amount = 1);
    /// Move a node after its n-th next sibling, false if there is no such sibling
    std::pair<bool, proto::StatusCode> Down(Node& node, size_t amount = 1);
    /// Reassign the parent by key and save.
    /// The node is appended to the parent, a null key makes it a root.
    proto::StatusCode SaveWithParent(Node& node, std::optional<NodeID> parent_id);

    /// Query the live nodes
    TreeQuery Query() { return TreeQuery{store, false}; }
    /// Query all nodes including soft-deleted ones
    TreeQuery ServiceQuery() { return TreeQuery{store, true}; }
    /// Count the consistency errors
    std::pair<TreeErrors, proto::StatusCode> CountErrors() { return ServiceQuery().CountErrors(); }
    /// Describe the live nodes and the consistency errors
    std::pair<flatbuffers::Offset<proto::Tree>, proto::StatusCode> Describe(flatbuffers::FlatBufferBuilder& builder);
};

}  // namespace nestedset
