#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "nestedset/bounds_store.h"
#include "nestedset/tree.h"
#include "nestedset/version.h"

namespace console {
/// Log a text to the console
void log(std::string_view text);
}  // namespace console

namespace nestedset {

/// A tree together with the store it owns
struct TreeHandle {
    /// The store
    std::unique_ptr<BoundsStore> store;
    /// The tree
    Tree tree;

    /// Constructor
    TreeHandle(std::unique_ptr<BoundsStore> store, TreeOptions options)
        : store(std::move(store)), tree(*this->store, options) {}
};

}  // namespace nestedset

/// Get the nestedset version
extern "C" nestedset::NestedSetVersion* nestedset_version();

/// A managed FFI result container
struct FFIResult {
    uint32_t status_code;
    uint32_t data_length;
    const void* data_ptr;
    void* owner_ptr;
    void (*owner_deleter)(void*);

    template <typename T> T* CastOwnerPtr() { return static_cast<T*>(owner_ptr); }
};
/// Delete a result
extern "C" void nestedset_result_delete(FFIResult* result);

/// Create a tree in process memory
extern "C" FFIResult* nestedset_tree_new(bool soft_delete);
/// Open a tree in a SQLite database, the table is created if it does not exist
extern "C" FFIResult* nestedset_tree_open(const char* path_ptr, size_t path_length, bool soft_delete);
/// Insert a new node, the target is ignored for roots
extern "C" FFIResult* nestedset_tree_insert_node(nestedset::TreeHandle* tree, const char* name_ptr,
                                                 size_t name_length, uint8_t mutation_type, int64_t target_id);
/// Move an existing node, the target is ignored for roots
extern "C" FFIResult* nestedset_tree_move_node(nestedset::TreeHandle* tree, int64_t node_id, uint8_t mutation_type,
                                               int64_t target_id);
/// Delete a node
extern "C" FFIResult* nestedset_tree_delete_node(nestedset::TreeHandle* tree, int64_t node_id);
/// Restore a soft-deleted node
extern "C" FFIResult* nestedset_tree_restore_node(nestedset::TreeHandle* tree, int64_t node_id);
/// Describe a tree
extern "C" FFIResult* nestedset_tree_describe(nestedset::TreeHandle* tree);
/// Count the consistency errors of a tree
extern "C" FFIResult* nestedset_tree_count_errors(nestedset::TreeHandle* tree);
