#include "nestedset/tree.h"

#include <random>
#include <stdexcept>

#include "gtest/gtest.h"
#include "nestedset/memory_store.h"
#include "nestedset/proto/proto_generated.h"

using namespace nestedset;

namespace {

/// A row as name and bounds
struct Entry {
    std::string name;
    Bound left;
    Bound right;

    bool operator==(const Entry& other) const = default;
};

void PrintTo(const Entry& entry, std::ostream* os) {
    *os << entry.name << "(" << entry.left << "," << entry.right << ")";
}

using Entries = std::vector<Entry>;

/// Read all live rows in bound order
Entries readEntries(Tree& tree) {
    std::vector<NodeRow> rows;
    EXPECT_EQ(tree.Query().All(rows), proto::StatusCode::OK);
    Entries entries;
    for (auto& row : rows) {
        entries.push_back({row.name, row.left, row.right});
    }
    return entries;
}

/// Expect a consistent tree
void expectConsistent(Tree& tree) {
    auto [errors, status] = tree.CountErrors();
    ASSERT_EQ(status, proto::StatusCode::OK);
    ASSERT_EQ(errors.oddness, 0u);
    ASSERT_EQ(errors.duplicates, 0u);
    ASSERT_EQ(errors.wrong_parent, 0u);
    ASSERT_EQ(errors.missing_parent, 0u);
    ASSERT_EQ(errors.gaps, 0u);
}

/// A store that fails selected writes
struct FailingStore : public MemoryBoundsStore {
    bool fail_insert = false;
    bool fail_update = false;
    bool fail_read = false;

    std::pair<std::optional<NodeRow>, proto::StatusCode> ReadNode(NodeID node_id, bool include_soft_deleted) override {
        if (fail_read) {
            last_error = "database is locked";
            return {std::nullopt, proto::StatusCode::STORAGE_BUSY};
        }
        return MemoryBoundsStore::ReadNode(node_id, include_soft_deleted);
    }

    std::pair<NodeID, proto::StatusCode> InsertRow(const NodeRow& row) override {
        if (fail_insert) {
            last_error = "insert failed";
            return {0, proto::StatusCode::STORAGE_ERROR};
        }
        return MemoryBoundsStore::InsertRow(row);
    }
    proto::StatusCode UpdateParent(NodeID node_id, std::optional<NodeID> parent_id) override {
        if (fail_update) {
            last_error = "update failed";
            return proto::StatusCode::STORAGE_CONSTRAINT_VIOLATION;
        }
        return MemoryBoundsStore::UpdateParent(node_id, parent_id);
    }
};

TEST(TreeTest, AppendAndDelete) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node r{"R"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 2}}));

    Node x{"X"};
    ASSERT_EQ(tree.Append(r, x), proto::StatusCode::OK);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 4}, {"X", 2, 3}}));
    ASSERT_EQ(r.GetRight(), 4);

    Node y{"Y"};
    ASSERT_EQ(tree.Append(r, y), proto::StatusCode::OK);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 6}, {"X", 2, 3}, {"Y", 4, 5}}));

    auto [deleted, status] = tree.Delete(x);
    ASSERT_EQ(status, proto::StatusCode::OK);
    ASSERT_EQ(deleted, 1u);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 4}, {"Y", 2, 3}}));
    expectConsistent(tree);
}

TEST(TreeTest, RootAgainIsNoop) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node r{"R"};
    Node s{"S"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    ASSERT_EQ(tree.Save(s), proto::StatusCode::OK);
    ASSERT_EQ(tree.SaveAsRoot(r), proto::StatusCode::OK);
    ASSERT_FALSE(r.HasMoved());
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 2}, {"S", 3, 4}}));
}

TEST(TreeTest, DescendantsAfterAppend) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [p, p_status] = tree.Create({"P", {{"P1"}}});
    auto [q, q_status] = tree.Create({"Q", {{"Q1"}}});
    ASSERT_EQ(p_status, proto::StatusCode::OK);
    ASSERT_EQ(q_status, proto::StatusCode::OK);

    Node c{"C"};
    ASSERT_EQ(tree.Append(*p, c), proto::StatusCode::OK);
    std::vector<NodeRow> rows;
    ASSERT_EQ(tree.Query().Descendants(*p, rows), proto::StatusCode::OK);
    std::vector<std::string> names;
    for (auto& row : rows) {
        names.push_back(row.name);
    }
    ASSERT_EQ(names, (std::vector<std::string>{"P1", "C"}));
    ASSERT_TRUE(c.IsDescendantOf(*p));
    ASSERT_FALSE(c.IsDescendantOf(*q));
    expectConsistent(tree);
}

TEST(TreeTest, ChainMovedAfterRoot) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node a{"A"}, b{"B"}, c{"C"};
    ASSERT_EQ(tree.Save(a), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(a, b), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(b, c), proto::StatusCode::OK);

    ASSERT_EQ(tree.InsertAfter(c, a), proto::StatusCode::OK);
    ASSERT_TRUE(c.HasMoved());
    ASSERT_TRUE(c.IsRoot());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 4}, {"B", 2, 3}, {"C", 5, 6}}));
    ASSERT_EQ(a.GetRight(), 4);
    expectConsistent(tree);
}

TEST(TreeTest, ChainMovedBeforeSibling) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node a{"A"}, b{"B"}, c{"C"};
    ASSERT_EQ(tree.Save(a), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(a, b), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(b, c), proto::StatusCode::OK);

    ASSERT_EQ(tree.InsertBefore(c, b), proto::StatusCode::OK);
    ASSERT_EQ(c.GetParentId(), a.GetNodeId());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 6}, {"C", 2, 3}, {"B", 4, 5}}));
    ASSERT_FALSE(c.IsDescendantOf(b));
    ASSERT_EQ(b.GetLeft(), 4);
    expectConsistent(tree);
}

TEST(TreeTest, MoveIntoOwnSubtreeChangesNothing) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [a, status] = tree.Create({"A", {{"B", {{"C"}}}}});
    ASSERT_EQ(status, proto::StatusCode::OK);
    auto [b, b_status] = tree.Find(2);
    auto [c, c_status] = tree.Find(3);
    ASSERT_EQ(b_status, proto::StatusCode::OK);
    ASSERT_EQ(c_status, proto::StatusCode::OK);

    ASSERT_EQ(tree.Append(*c, *b), proto::StatusCode::OK);
    ASSERT_FALSE(b->HasMoved());
    ASSERT_EQ(b->GetParentId(), a->GetNodeId());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 6}, {"B", 2, 5}, {"C", 3, 4}}));
}

TEST(TreeTest, DeleteLowersBoundsByHeight) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [r, status] = tree.Create({"R", {{"A", {{"A1"}, {"A2"}}}, {"B"}}});
    ASSERT_EQ(status, proto::StatusCode::OK);
    auto [s, s_status] = tree.Create({"S"});
    ASSERT_EQ(s_status, proto::StatusCode::OK);
    auto before = readEntries(tree);
    ASSERT_EQ(before, (Entries{{"R", 1, 10}, {"A", 2, 7}, {"A1", 3, 4}, {"A2", 5, 6}, {"B", 8, 9}, {"S", 11, 12}}));

    auto [a, a_status] = tree.Find(2);
    ASSERT_EQ(a_status, proto::StatusCode::OK);
    auto height = a->GetHeight();
    auto right = a->GetRight();
    ASSERT_EQ(height, 6);
    ASSERT_EQ(a->GetDescendantCount(), 2);

    auto [deleted, delete_status] = tree.Delete(*a);
    ASSERT_EQ(delete_status, proto::StatusCode::OK);
    ASSERT_EQ(deleted, static_cast<size_t>(height / 2));

    Entries expected;
    for (auto& entry : before) {
        if (entry.left >= 2 && entry.left <= right) continue;
        expected.push_back({entry.name, entry.left > right ? entry.left - height : entry.left,
                            entry.right > right ? entry.right - height : entry.right});
    }
    ASSERT_EQ(readEntries(tree), expected);
    expectConsistent(tree);
}

TEST(TreeTest, DeleteResetsInstance) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node r{"R"};
    Node x{"X"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(r, x), proto::StatusCode::OK);
    ASSERT_EQ(tree.Delete(x).second, proto::StatusCode::OK);
    ASSERT_FALSE(x.Exists());
    ASSERT_EQ(x.GetPendingActions().GetPendingType(), proto::MutationType::ROOT);
    ASSERT_EQ(x.GetHeight(), 2);
    ASSERT_EQ(tree.Delete(x).second, proto::StatusCode::NODE_NOT_PERSISTED);

    ASSERT_EQ(tree.Save(x), proto::StatusCode::OK);
    ASSERT_TRUE(x.IsRoot());
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 2}, {"X", 3, 4}}));
}

TEST(TreeTest, DeletingGuard) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [r, status] = tree.Create({"R", {{"A", {{"B"}}}, {"C"}}});
    ASSERT_EQ(status, proto::StatusCode::OK);

    // Deletes from the listener only remove the row
    std::vector<proto::StatusCode> statuses;
    store.SetRowDeletedListener([&](const NodeRow& row) {
        ASSERT_TRUE(tree.GetSession().deleting);
        Node removed{row};
        statuses.push_back(tree.Delete(removed).second);
    });
    auto [a, a_status] = tree.Find(2);
    ASSERT_EQ(a_status, proto::StatusCode::OK);
    ASSERT_EQ(tree.Delete(*a).second, proto::StatusCode::OK);
    ASSERT_EQ(statuses, (std::vector<proto::StatusCode>{proto::StatusCode::OK, proto::StatusCode::OK}));
    ASSERT_FALSE(tree.GetSession().deleting);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 4}, {"C", 2, 3}}));
    expectConsistent(tree);
}

TEST(TreeTest, ThrowingListenerClearsGuard) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [r, status] = tree.Create({"R", {{"A", {{"B"}}}, {"C"}}});
    ASSERT_EQ(status, proto::StatusCode::OK);

    store.SetRowDeletedListener([](const NodeRow&) { throw std::runtime_error{"listener failed"}; });
    auto [a, a_status] = tree.Find(2);
    ASSERT_EQ(a_status, proto::StatusCode::OK);
    EXPECT_THROW(tree.Delete(*a), std::runtime_error);
    ASSERT_FALSE(tree.GetSession().deleting);
    ASSERT_EQ(store.GetTransactionDepth(), 0u);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 8}, {"A", 2, 5}, {"B", 3, 4}, {"C", 6, 7}}));

    // The next delete closes its gap again
    store.SetRowDeletedListener(nullptr);
    auto [c, c_status] = tree.Find(4);
    ASSERT_EQ(c_status, proto::StatusCode::OK);
    ASSERT_EQ(tree.Delete(*c), (std::pair<size_t, proto::StatusCode>{1, proto::StatusCode::OK}));
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 6}, {"A", 2, 5}, {"B", 3, 4}}));
    expectConsistent(tree);
}

TEST(TreeTest, SoftDelete) {
    MemoryBoundsStore store;
    Tree tree{store, TreeOptions{.soft_delete = true}};
    Node r{"R"}, x{"X"}, y{"Y"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(r, x), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(r, y), proto::StatusCode::OK);

    auto [deleted, status] = tree.Delete(x);
    ASSERT_EQ(status, proto::StatusCode::OK);
    ASSERT_EQ(deleted, 1u);
    ASSERT_TRUE(x.Exists());
    ASSERT_TRUE(x.IsDeleted());
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 6}, {"Y", 4, 5}}));
    ASSERT_EQ(tree.Find(*x.GetNodeId()).second, proto::StatusCode::NODE_NOT_FOUND);
    ASSERT_TRUE(tree.ServiceQuery().Get(*x.GetNodeId()).first.has_value());
    expectConsistent(tree);

    // New nodes are placed after soft-deleted ones
    Node z{"Z"};
    ASSERT_EQ(tree.Save(z), proto::StatusCode::OK);
    ASSERT_EQ(z.GetLeft(), 7);

    ASSERT_EQ(tree.Restore(x), proto::StatusCode::OK);
    ASSERT_FALSE(x.IsDeleted());
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 6}, {"X", 2, 3}, {"Y", 4, 5}, {"Z", 7, 8}}));
}

TEST(TreeTest, FindSoftDeleted) {
    FailingStore store;
    Tree tree{store, TreeOptions{.soft_delete = true}};
    Node r{"R"}, x{"X"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(r, x), proto::StatusCode::OK);
    ASSERT_EQ(tree.Delete(x).second, proto::StatusCode::OK);

    auto x_id = *x.GetNodeId();
    ASSERT_EQ(tree.Find(x_id).second, proto::StatusCode::NODE_NOT_FOUND);
    auto [found, status] = tree.Find(x_id, true);
    ASSERT_EQ(status, proto::StatusCode::OK);
    ASSERT_TRUE(found->IsDeleted());
    ASSERT_EQ(tree.Find(x_id + 100, true).second, proto::StatusCode::NODE_NOT_FOUND);

    // Read errors are reported as they are
    store.fail_read = true;
    auto [missing, read_status] = tree.Find(x_id, true);
    ASSERT_EQ(read_status, proto::StatusCode::STORAGE_BUSY);
    ASSERT_FALSE(missing);
    ASSERT_TRUE(IsStorageError(read_status));
    ASSERT_FALSE(IsStorageError(proto::StatusCode::NODE_NOT_FOUND));
}

TEST(TreeTest, FailedInsertRollsBack) {
    FailingStore store;
    Tree tree{store};
    Node r{"R"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);

    store.fail_insert = true;
    Node x{"X"};
    ASSERT_EQ(tree.Append(r, x), proto::StatusCode::STORAGE_ERROR);
    ASSERT_EQ(store.GetLastError(), "insert failed");
    ASSERT_FALSE(x.Exists());
    ASSERT_EQ(x.GetLeft(), 0);
    ASSERT_EQ(x.GetRight(), 0);
    ASSERT_FALSE(x.GetParentId().has_value());
    ASSERT_EQ(store.GetTransactionDepth(), 0);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 2}}));
}

TEST(TreeTest, FailedMoveRollsBack) {
    FailingStore store;
    Tree tree{store};
    Node a{"A"}, b{"B"}, c{"C"};
    ASSERT_EQ(tree.Save(a), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(a, b), proto::StatusCode::OK);
    ASSERT_EQ(tree.Append(b, c), proto::StatusCode::OK);

    store.fail_update = true;
    ASSERT_EQ(tree.InsertAfter(c, a), proto::StatusCode::STORAGE_CONSTRAINT_VIOLATION);
    ASSERT_FALSE(c.HasMoved());
    ASSERT_EQ(c.GetLeft(), 3);
    ASSERT_EQ(c.GetRight(), 4);
    ASSERT_EQ(c.GetParentId(), b.GetNodeId());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 6}, {"B", 2, 5}, {"C", 3, 4}}));
}

TEST(TreeTest, ReplacedIntent) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node a{"A"}, b{"B"}, n{"N"};
    ASSERT_EQ(tree.Save(a), proto::StatusCode::OK);
    ASSERT_EQ(tree.Save(b), proto::StatusCode::OK);
    n.AppendTo(a).AppendTo(b);
    ASSERT_EQ(tree.Save(n), proto::StatusCode::OK);
    ASSERT_EQ(n.GetParentId(), b.GetNodeId());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 2}, {"B", 3, 6}, {"N", 4, 5}}));
}

TEST(TreeTest, UpAndDown) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [r, status] = tree.Create({"R", {{"A"}, {"B"}, {"C"}}});
    ASSERT_EQ(status, proto::StatusCode::OK);
    auto [a, a_status] = tree.Find(2);
    auto [c, c_status] = tree.Find(4);
    ASSERT_EQ(a_status, proto::StatusCode::OK);
    ASSERT_EQ(c_status, proto::StatusCode::OK);

    auto up = tree.Up(*a);
    ASSERT_EQ(up.second, proto::StatusCode::OK);
    ASSERT_FALSE(up.first);

    up = tree.Up(*c, 2);
    ASSERT_EQ(up.second, proto::StatusCode::OK);
    ASSERT_TRUE(up.first);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 8}, {"C", 2, 3}, {"A", 4, 5}, {"B", 6, 7}}));

    auto down = tree.Down(*c, 3);
    ASSERT_EQ(down.second, proto::StatusCode::OK);
    ASSERT_FALSE(down.first);
    down = tree.Down(*c);
    ASSERT_TRUE(down.first);
    ASSERT_EQ(readEntries(tree), (Entries{{"R", 1, 8}, {"A", 2, 3}, {"C", 4, 5}, {"B", 6, 7}}));
    expectConsistent(tree);
}

TEST(TreeTest, SaveWithParent) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node a{"A"}, b{"B"}, n{"N"};
    ASSERT_EQ(tree.Save(a), proto::StatusCode::OK);
    ASSERT_EQ(tree.Save(b), proto::StatusCode::OK);
    ASSERT_EQ(tree.SaveWithParent(n, a.GetNodeId()), proto::StatusCode::OK);
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 4}, {"N", 2, 3}, {"B", 5, 6}}));

    ASSERT_EQ(tree.SaveWithParent(n, b.GetNodeId()), proto::StatusCode::OK);
    ASSERT_EQ(n.GetParentId(), b.GetNodeId());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 2}, {"B", 3, 6}, {"N", 4, 5}}));

    // Same parent, nothing moves
    ASSERT_EQ(tree.SaveWithParent(n, b.GetNodeId()), proto::StatusCode::OK);
    ASSERT_FALSE(n.HasMoved());

    ASSERT_EQ(tree.SaveWithParent(n, std::nullopt), proto::StatusCode::OK);
    ASSERT_TRUE(n.IsRoot());
    ASSERT_EQ(readEntries(tree), (Entries{{"A", 1, 2}, {"B", 3, 4}, {"N", 5, 6}}));

    ASSERT_EQ(tree.SaveWithParent(n, 42), proto::StatusCode::NODE_NOT_FOUND);
    expectConsistent(tree);
}

TEST(TreeTest, UpdateName) {
    MemoryBoundsStore store;
    Tree tree{store};
    Node r{"R"};
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    r.SetName("renamed");
    ASSERT_EQ(tree.Save(r), proto::StatusCode::OK);
    auto [found, status] = tree.Find(*r.GetNodeId());
    ASSERT_EQ(status, proto::StatusCode::OK);
    ASSERT_EQ(found->GetName(), "renamed");
}

TEST(TreeTest, Describe) {
    MemoryBoundsStore store;
    Tree tree{store};
    auto [r, status] = tree.Create({"R", {{"A", {{"A1"}}}, {"B"}}});
    ASSERT_EQ(status, proto::StatusCode::OK);

    flatbuffers::FlatBufferBuilder fb;
    auto [description, describe_status] = tree.Describe(fb);
    ASSERT_EQ(describe_status, proto::StatusCode::OK);
    fb.Finish(description);
    auto* described = flatbuffers::GetRoot<proto::Tree>(fb.GetBufferPointer());
    ASSERT_EQ(described->nodes()->size(), 4u);
    std::vector<uint32_t> depths;
    for (auto* node : *described->nodes()) {
        depths.push_back(node->depth());
    }
    ASSERT_EQ(depths, (std::vector<uint32_t>{0, 1, 2, 1}));
    ASSERT_EQ(described->nodes()->Get(0)->parent_id(), PROTO_NULL_NODE_ID);
    ASSERT_EQ(described->nodes()->Get(1)->parent_id(), 1);
    ASSERT_EQ(described->nodes()->Get(2)->name()->str(), "A1");
    ASSERT_EQ(described->errors()->gaps(), 0u);
}

TEST(TreeTest, RandomSequences) {
    for (unsigned seed = 1; seed <= 8; ++seed) {
        MemoryBoundsStore store;
        Tree tree{store};
        std::mt19937 rng{seed};
        std::vector<NodeID> live;
        size_t next_name = 0;

        auto pick = [&]() { return live[std::uniform_int_distribution<size_t>{0, live.size() - 1}(rng)]; };
        for (size_t step = 0; step < 150; ++step) {
            auto op = live.empty() ? 0 : std::uniform_int_distribution<int>{0, 9}(rng);
            auto kind = std::uniform_int_distribution<int>{0, 4}(rng);
            std::unique_ptr<Node> target;
            if (!live.empty() && kind > 0) {
                target = tree.Find(pick()).first;
                ASSERT_NE(target, nullptr);
            }
            auto declare = [&](Node& node) {
                if (!target) {
                    node.MakeRoot();
                    return;
                }
                switch (kind) {
                    case 1:
                        node.AppendTo(*target);
                        break;
                    case 2:
                        node.PrependTo(*target);
                        break;
                    case 3:
                        node.Before(*target);
                        break;
                    default:
                        node.After(*target);
                        break;
                }
            };

            if (op < 5) {
                Node node{std::to_string(next_name++)};
                declare(node);
                ASSERT_EQ(tree.Save(node), proto::StatusCode::OK) << "seed=" << seed << " step=" << step;
            } else if (op < 8) {
                auto [node, status] = tree.Find(pick());
                ASSERT_EQ(status, proto::StatusCode::OK);
                declare(*node);
                ASSERT_EQ(tree.Save(*node), proto::StatusCode::OK) << "seed=" << seed << " step=" << step;
            } else {
                auto [node, status] = tree.Find(pick());
                ASSERT_EQ(status, proto::StatusCode::OK);
                ASSERT_EQ(tree.Delete(*node).second, proto::StatusCode::OK) << "seed=" << seed << " step=" << step;
            }

            expectConsistent(tree);
            if (::testing::Test::HasFatalFailure()) {
                FAIL() << "seed=" << seed << " step=" << step;
            }

            std::vector<NodeRow> rows;
            ASSERT_EQ(tree.Query().All(rows), proto::StatusCode::OK);
            live.clear();
            for (auto& row : rows) {
                live.push_back(row.node_id);
            }
        }
    }
}

TEST(TreeTest, NodeHelpers) {
    Node fresh{"n"};
    ASSERT_FALSE(fresh.Exists());
    ASSERT_EQ(fresh.GetHeight(), 2);
    ASSERT_EQ(fresh.GetDescendantCount(), 0);
    ASSERT_TRUE(fresh.IsRoot());

    NodeRow row;
    row.node_id = 1;
    row.left = 1;
    row.right = 8;
    Node loaded{row};
    ASSERT_EQ(loaded.GetHeight(), 8);
    ASSERT_EQ(loaded.GetDescendantCount(), 3);
}

}  // namespace
