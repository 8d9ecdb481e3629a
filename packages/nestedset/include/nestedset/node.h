#pragma once

#include <flatbuffers/buffer.h>
#include <flatbuffers/flatbuffer_builder.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "nestedset/pending_action.h"
#include "nestedset/proto/proto_generated.h"

namespace nestedset {

using NodeID = int64_t;
using Bound = int64_t;

constexpr NodeID PROTO_NULL_NODE_ID = std::numeric_limits<NodeID>::min();

/// A row of the tree table
struct NodeRow {
    /// The primary key
    NodeID node_id = 0;
    /// The left bound
    Bound left = 0;
    /// The right bound
    Bound right = 0;
    /// The parent key, null for roots
    std::optional<NodeID> parent_id;
    /// The payload
    std::string name;
    /// Is soft-deleted?
    bool deleted = false;

    /// Get the height
    Bound GetHeight() const { return right - left + 1; }
    /// Pack as FlatBuffer
    flatbuffers::Offset<proto::Node> Pack(flatbuffers::FlatBufferBuilder& builder, uint32_t depth = 0) const;
};

/// A node instance.
/// Structural changes are declared on the instance and applied by the tree at the next save.
class Node {
    friend class Tree;
    friend class TreeMutator;
    friend class PendingActionQueue;

   protected:
    /// The primary key, null if the node is not persisted
    std::optional<NodeID> node_id;
    /// The left bound
    Bound left = 0;
    /// The right bound
    Bound right = 0;
    /// The parent key
    std::optional<NodeID> parent_id;
    /// The payload
    std::string name;
    /// Was the name changed since the last save?
    bool name_changed = false;
    /// Is soft-deleted?
    bool deleted = false;
    /// Did the bounds change at the last save?
    bool moved = false;
    /// The pending structural intent
    PendingActionQueue pending;

    /// Take over the stored bounds and parent of a row
    void AssignBounds(const NodeRow& row);

   public:
    /// Constructor of a fresh node, becomes a root unless told otherwise
    explicit Node(std::string_view name = "");
    /// Constructor of a node loaded from storage
    explicit Node(const NodeRow& row);
    /// Nodes must not be copied, pending intents of other nodes may refer to this instance
    Node(const Node& other) = delete;
    /// Nodes must not be copy-assigned
    Node& operator=(const Node& other) = delete;
    /// Move constructor
    Node(Node&& other) = default;
    /// Move assignment
    Node& operator=(Node&& other) = default;

    /// Is persisted?
    bool Exists() const { return node_id.has_value(); }
    /// Get the primary key
    auto GetNodeId() const { return node_id; }
    /// Get the left bound
    Bound GetLeft() const { return left; }
    /// Get the right bound
    Bound GetRight() const { return right; }
    /// Get the parent key
    auto GetParentId() const { return parent_id; }
    /// Get the name
    std::string_view GetName() const { return name; }
    /// Is soft-deleted?
    bool IsDeleted() const { return deleted; }
    /// Is a root?
    bool IsRoot() const { return !parent_id.has_value(); }
    /// Did the bounds change at the last save?
    bool HasMoved() const { return moved; }
    /// Get the height (right - left + 1), 2 for nodes that are not persisted
    Bound GetHeight() const { return Exists() ? (right - left + 1) : 2; }
    /// Get the number of descendants
    Bound GetDescendantCount() const { return GetHeight() / 2 - 1; }
    /// Is a descendant of another node?
    bool IsDescendantOf(const Node& other) const { return left > other.left && left < other.right; }
    /// Get the pending actions
    auto& GetPendingActions() const { return pending; }

    /// Set the name
    void SetName(std::string_view value);
    /// Make the node a root at the next save
    Node& MakeRoot();
    /// Append the node to a parent at the next save.
    /// The intent refers to the parent instance, the parent must outlive the next save.
    Node& AppendTo(Node& parent);
    /// Prepend the node to a parent at the next save.
    /// The parent must outlive the next save.
    Node& PrependTo(Node& parent);
    /// Insert the node before a sibling at the next save.
    /// The sibling must outlive the next save.
    Node& Before(Node& sibling);
    /// Insert the node after a sibling at the next save.
    /// The sibling must outlive the next save.
    Node& After(Node& sibling);

    /// Get the row of the node
    NodeRow ToRow() const;
    /// Pack as FlatBuffer
    flatbuffers::Offset<proto::Node> Pack(flatbuffers::FlatBufferBuilder& builder) const;
};

}  // namespace nestedset
