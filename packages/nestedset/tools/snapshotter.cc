#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "gflags/gflags.h"
#include "nestedset/memory_store.h"
#include "nestedset/proto/proto_generated.h"
#include "nestedset/testing/mutation_snapshot_test.h"
#include "nestedset/tree.h"
#include "pugixml.hpp"

using namespace nestedset;
using namespace nestedset::testing;

DEFINE_string(source_dir, "", "Source directory");

static void generate_mutation_snapshots(const std::filesystem::path& source_dir) {
    auto snapshot_dir = source_dir / "snapshots" / "mutations";
    for (auto& p : std::filesystem::directory_iterator(snapshot_dir)) {
        auto filename = p.path().filename().filename().string();

        // Is template file file
        auto out = p.path();
        if (out.extension() != ".xml") continue;
        out.replace_extension();
        if (out.extension() != ".tpl") continue;
        out.replace_extension(".xml");

        // Open input stream
        std::ifstream in(p.path(), std::ios::in | std::ios::binary);
        if (!in) {
            std::cout << "[" << filename << "] failed to read file" << std::endl;
            continue;
        }

        // Parse xml document
        pugi::xml_document doc;
        doc.load(in);
        auto root = doc.child("mutation-snapshots");

        bool failed = false;
        for (auto test : root.children()) {
            auto name = test.attribute("name").as_string();
            std::cout << "  TEST " << name << std::endl;

            MemoryBoundsStore store;
            Tree tree{store, TreeOptions{.soft_delete = test.attribute("soft-delete").as_bool(false)}};
            if (auto status = MutationSnapshotTest::ApplySteps(tree, test.child("steps"));
                status != proto::StatusCode::OK) {
                std::cout << "  ERROR " << proto::EnumNameStatusCode(status) << std::endl;
                failed = true;
                break;
            }

            /// Write output
            test.remove_child("expected");
            auto expected = test.append_child("expected");
            if (auto status = MutationSnapshotTest::EncodeTree(expected, tree); status != proto::StatusCode::OK) {
                std::cout << "  ERROR " << proto::EnumNameStatusCode(status) << std::endl;
                failed = true;
                break;
            }
        }
        if (failed) {
            continue;
        }

        // Write xml document
        std::cout << "FILE " << out << std::endl;
        std::ofstream outs;
        outs.open(out, std::ofstream::out | std::ofstream::trunc);
        doc.save(outs, "    ", pugi::format_default | pugi::format_no_declaration);
    }
}

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Usage: ./snapshotter --source_dir <dir>");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    if (!std::filesystem::exists(FLAGS_source_dir)) {
        std::cout << "Invalid source directory: " << FLAGS_source_dir << std::endl;
        return 1;
    }
    auto source_dir = std::filesystem::path{FLAGS_source_dir};
    generate_mutation_snapshots(source_dir);
    return 0;
}
