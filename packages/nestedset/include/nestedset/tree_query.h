#pragma once

#include <flatbuffers/flatbuffer_builder.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "nestedset/bounds_store.h"
#include "nestedset/node.h"

namespace nestedset {

/// The consistency counters of a tree table
struct TreeErrors {
    /// Rows with left >= right
    uint32_t oddness = 0;
    /// Pairs of rows that share a bound value
    uint32_t duplicates = 0;
    /// Rows whose stored parent is not the nearest containing row
    uint32_t wrong_parent = 0;
    /// Rows whose stored parent does not exist
    uint32_t missing_parent = 0;
    /// Values in [1, max(right)] that no bound uses
    uint32_t gaps = 0;

    /// Get the total number of errors
    uint32_t GetTotal() const { return oddness + duplicates + wrong_parent + missing_parent + gaps; }
    /// Is the tree broken?
    bool IsBroken() const { return GetTotal() > 0; }
    /// Pack as FlatBuffer
    flatbuffers::Offset<proto::TreeErrors> Pack(flatbuffers::FlatBufferBuilder& builder) const;
};

/// Read-only queries on a tree table.
/// All queries are bound comparisons, results are ordered by the left bound unless stated otherwise.
class TreeQuery {
   protected:
    /// The store
    BoundsStore& store;
    /// Include soft-deleted rows?
    bool include_soft_deleted;

    /// Create a filter in the current scope
    NodeFilter CreateFilter() const;
    /// Fetch the first row of a filter
    std::pair<std::optional<NodeRow>, proto::StatusCode> First(NodeFilter filter);

   public:
    /// Constructor
    explicit TreeQuery(BoundsStore& store, bool include_soft_deleted = false);

    /// Include soft-deleted rows in all following queries
    TreeQuery& IncludeSoftDeleted(bool value = true) {
        include_soft_deleted = value;
        return *this;
    }
    /// Are soft-deleted rows included?
    bool IncludesSoftDeleted() const { return include_soft_deleted; }

    /// Read all rows
    proto::StatusCode All(std::vector<NodeRow>& out, NodeOrder order = NodeOrder::Default);
    /// Read a row
    std::pair<std::optional<NodeRow>, proto::StatusCode> Get(NodeID node_id);
    /// Read the descendants of a node
    proto::StatusCode Descendants(const Node& node, std::vector<NodeRow>& out, NodeOrder order = NodeOrder::Default);
    /// Read the ancestors of a node, root first
    proto::StatusCode Ancestors(const Node& node, std::vector<NodeRow>& out);
    /// Read the direct children of a node
    proto::StatusCode Children(const Node& node, std::vector<NodeRow>& out);
    /// Read all roots
    proto::StatusCode Roots(std::vector<NodeRow>& out);
    /// Read the first root
    std::pair<std::optional<NodeRow>, proto::StatusCode> Root();
    /// Read the siblings of a node
    proto::StatusCode Siblings(const Node& node, std::vector<NodeRow>& out);
    /// Read the siblings after a node, nearest first
    proto::StatusCode NextSiblings(const Node& node, std::vector<NodeRow>& out, size_t offset = 0,
                                   std::optional<size_t> limit = std::nullopt);
    /// Read the siblings before a node, nearest first
    proto::StatusCode PrevSiblings(const Node& node, std::vector<NodeRow>& out, size_t offset = 0,
                                   std::optional<size_t> limit = std::nullopt);
    /// Read the nearest sibling after a node
    std::pair<std::optional<NodeRow>, proto::StatusCode> NextSibling(const Node& node, size_t offset = 0);
    /// Read the nearest sibling before a node
    std::pair<std::optional<NodeRow>, proto::StatusCode> PrevSibling(const Node& node, size_t offset = 0);
    /// Read all rows after the subtree of a node
    proto::StatusCode Next(const Node& node, std::vector<NodeRow>& out);
    /// Read all rows before a node, nearest first
    proto::StatusCode Prev(const Node& node, std::vector<NodeRow>& out);
    /// Read the first row after the subtree of a node
    std::pair<std::optional<NodeRow>, proto::StatusCode> GetNext(const Node& node);
    /// Read the last row before a node
    std::pair<std::optional<NodeRow>, proto::StatusCode> GetPrev(const Node& node);

    /// Count the consistency errors of the table.
    /// Always scans soft-deleted rows as well.
    std::pair<TreeErrors, proto::StatusCode> CountErrors();
};

}  // namespace nestedset
