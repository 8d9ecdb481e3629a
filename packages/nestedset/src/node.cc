#include "nestedset/node.h"

using namespace nestedset;

flatbuffers::Offset<proto::Node> NodeRow::Pack(flatbuffers::FlatBufferBuilder& builder, uint32_t depth) const {
    auto name_ofs = builder.CreateString(name);
    proto::NodeBuilder out{builder};
    out.add_node_id(node_id);
    out.add_left(left);
    out.add_right(right);
    out.add_parent_id(parent_id.value_or(PROTO_NULL_NODE_ID));
    out.add_depth(depth);
    out.add_deleted(deleted);
    out.add_name(name_ofs);
    return out.Finish();
}

Node::Node(std::string_view name) : name(name), pending(mutation::MakeRoot{}) {}

Node::Node(const NodeRow& row)
    : node_id(row.node_id),
      left(row.left),
      right(row.right),
      parent_id(row.parent_id),
      name(row.name),
      deleted(row.deleted) {}

void Node::AssignBounds(const NodeRow& row) {
    left = row.left;
    right = row.right;
    parent_id = row.parent_id;
    deleted = row.deleted;
}

void Node::SetName(std::string_view value) {
    name = value;
    name_changed = true;
}

Node& Node::MakeRoot() {
    pending.Set(mutation::MakeRoot{});
    return *this;
}

Node& Node::AppendTo(Node& parent) {
    pending.Set(mutation::AppendTo{parent});
    return *this;
}

Node& Node::PrependTo(Node& parent) {
    pending.Set(mutation::PrependTo{parent});
    return *this;
}

Node& Node::Before(Node& sibling) {
    pending.Set(mutation::Before{sibling});
    return *this;
}

Node& Node::After(Node& sibling) {
    pending.Set(mutation::After{sibling});
    return *this;
}

NodeRow Node::ToRow() const {
    NodeRow row;
    row.node_id = node_id.value_or(0);
    row.left = left;
    row.right = right;
    row.parent_id = parent_id;
    row.name = name;
    row.deleted = deleted;
    return row;
}

flatbuffers::Offset<proto::Node> Node::Pack(flatbuffers::FlatBufferBuilder& builder) const {
    return ToRow().Pack(builder);
}
