#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "gflags/gflags.h"
#include "nestedset/proto/proto_generated.h"
#include "nestedset/sqlite_store.h"
#include "nestedset/tree.h"

using namespace nestedset;

DEFINE_string(db, "tree.db", "SQLite database file");
DEFINE_string(table, "nodes", "Tree table");
DEFINE_bool(soft_delete, false, "Only mark deleted nodes");
DEFINE_string(op, "show", "Operation: show, check, insert, move, delete, restore, up, down");
DEFINE_string(name, "", "Name of an inserted node");
DEFINE_int64(node, 0, "Node key");
DEFINE_string(type, "root", "Position of an inserted or moved node: root, append, prepend, before, after");
DEFINE_int64(target, 0, "Key of the parent or sibling");
DEFINE_uint32(amount, 1, "Number of siblings to skip for up and down");

/// Print a status error
static int fail(std::string_view what, proto::StatusCode status, BoundsStore& store) {
    std::cout << "ERROR " << what << ": " << proto::EnumNameStatusCode(status) << std::endl;
    if (IsStorageError(status) && !store.GetLastError().empty()) {
        std::cout << "  " << store.GetLastError() << std::endl;
    }
    return 1;
}

/// Print a node
static void print(const Node& node) {
    std::cout << *node.GetNodeId() << " " << node.GetName() << " [" << node.GetLeft() << ", " << node.GetRight()
              << "]" << (node.HasMoved() ? " moved" : "") << std::endl;
}

/// Print all live nodes indented by depth
static int show(Tree& tree) {
    std::vector<NodeRow> rows;
    if (auto status = tree.Query().All(rows); status != proto::StatusCode::OK) {
        return fail("show", status, tree.GetStore());
    }
    std::vector<Bound> open;
    for (auto& row : rows) {
        while (!open.empty() && open.back() < row.left) {
            open.pop_back();
        }
        std::cout << std::string(open.size() * 2, ' ') << row.node_id << " " << row.name << " [" << row.left << ", "
                  << row.right << "]" << std::endl;
        open.push_back(row.right);
    }
    return 0;
}

/// Print the consistency errors
static int check(Tree& tree) {
    auto [errors, status] = tree.CountErrors();
    if (status != proto::StatusCode::OK) {
        return fail("check", status, tree.GetStore());
    }
    std::cout << "oddness=" << errors.oddness << " duplicates=" << errors.duplicates
              << " wrong_parent=" << errors.wrong_parent << " missing_parent=" << errors.missing_parent
              << " gaps=" << errors.gaps << std::endl;
    return errors.IsBroken() ? 2 : 0;
}

/// Declare the position of a node
static proto::StatusCode declare(Tree& tree, Node& node, std::unique_ptr<Node>& target) {
    if (FLAGS_type == "root") {
        node.MakeRoot();
        return proto::StatusCode::OK;
    }
    auto [loaded, status] = tree.Find(FLAGS_target);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    target = std::move(loaded);
    if (FLAGS_type == "append") {
        node.AppendTo(*target);
    } else if (FLAGS_type == "prepend") {
        node.PrependTo(*target);
    } else if (FLAGS_type == "before") {
        node.Before(*target);
    } else if (FLAGS_type == "after") {
        node.After(*target);
    } else {
        return proto::StatusCode::MUTATION_TYPE_INVALID;
    }
    return proto::StatusCode::OK;
}

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Usage: ./treectl --db <file> --op <operation> [--node <key>] [--type <position>]");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    TreeSchema schema;
    schema.table_name = FLAGS_table;
    auto [store, status] = SQLiteBoundsStore::Open(FLAGS_db, schema);
    if (status != proto::StatusCode::OK) {
        std::cout << "ERROR failed to open database: " << FLAGS_db << std::endl;
        return 1;
    }
    if (auto table_status = store->CreateTable(); table_status != proto::StatusCode::OK) {
        return fail("create table", table_status, *store);
    }
    Tree tree{*store, TreeOptions{.soft_delete = FLAGS_soft_delete}};

    std::string_view op = FLAGS_op;
    if (op == "show") {
        return show(tree);
    } else if (op == "check") {
        return check(tree);
    } else if (op == "insert") {
        Node node{FLAGS_name};
        std::unique_ptr<Node> target;
        if (auto declare_status = declare(tree, node, target); declare_status != proto::StatusCode::OK) {
            return fail("insert", declare_status, *store);
        }
        if (auto save_status = tree.Save(node); save_status != proto::StatusCode::OK) {
            return fail("insert", save_status, *store);
        }
        print(node);
        return 0;
    } else if (op == "move") {
        auto [node, find_status] = tree.Find(FLAGS_node);
        if (find_status != proto::StatusCode::OK) {
            return fail("move", find_status, *store);
        }
        std::unique_ptr<Node> target;
        if (auto declare_status = declare(tree, *node, target); declare_status != proto::StatusCode::OK) {
            return fail("move", declare_status, *store);
        }
        if (auto save_status = tree.Save(*node); save_status != proto::StatusCode::OK) {
            return fail("move", save_status, *store);
        }
        print(*node);
        return 0;
    } else if (op == "delete") {
        auto [node, find_status] = tree.Find(FLAGS_node);
        if (find_status != proto::StatusCode::OK) {
            return fail("delete", find_status, *store);
        }
        auto [deleted, delete_status] = tree.Delete(*node);
        if (delete_status != proto::StatusCode::OK) {
            return fail("delete", delete_status, *store);
        }
        std::cout << "deleted " << deleted << std::endl;
        return 0;
    } else if (op == "restore") {
        auto [node, find_status] = tree.Find(FLAGS_node, true);
        if (find_status != proto::StatusCode::OK) {
            return fail("restore", find_status, *store);
        }
        if (auto restore_status = tree.Restore(*node); restore_status != proto::StatusCode::OK) {
            return fail("restore", restore_status, *store);
        }
        print(*node);
        return 0;
    } else if (op == "up" || op == "down") {
        auto [node, find_status] = tree.Find(FLAGS_node);
        if (find_status != proto::StatusCode::OK) {
            return fail(op, find_status, *store);
        }
        auto [moved, move_status] = op == "up" ? tree.Up(*node, FLAGS_amount) : tree.Down(*node, FLAGS_amount);
        if (move_status != proto::StatusCode::OK) {
            return fail(op, move_status, *store);
        }
        print(*node);
        return moved ? 0 : 2;
    }
    std::cout << "ERROR unknown operation: " << op << std::endl;
    return 1;
}
