#include "nestedset/api.h"

#include <flatbuffers/detached_buffer.h>
#include <flatbuffers/flatbuffer_builder.h>

#include <iostream>
#include <string>

#include "flatbuffers/flatbuffers.h"
#include "nestedset/memory_store.h"
#include "nestedset/proto/proto_generated.h"
#include "nestedset/sqlite_store.h"
#include "nestedset/tree.h"
#include "nestedset/version.h"

using namespace nestedset;

/// Log to console
extern void log(const char* text, size_t textLength) { std::cout << std::string_view{text, textLength} << std::endl; }

namespace console {
/// Log a std::string
void log(std::string text) { return ::log(text.data(), text.size()); }
/// Log a string_view
void log(std::string_view text) { return ::log(text.data(), text.size()); }
}  // namespace console

static FFIResult* packOK() {
    auto result = std::make_unique<FFIResult>();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = nullptr;
    result->data_length = 0;
    result->owner_ptr = nullptr;
    result->owner_deleter = [](void*) {};
    return result.release();
}

template <typename T> static FFIResult* packPtr(std::unique_ptr<T> ptr) {
    auto result = std::make_unique<FFIResult>();
    auto raw_ptr = ptr.release();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = nullptr;
    result->data_length = 0;
    result->owner_ptr = raw_ptr;
    result->owner_deleter = [](void* p) { delete reinterpret_cast<T*>(p); };
    return result.release();
}

static FFIResult* packBuffer(std::unique_ptr<flatbuffers::DetachedBuffer> detached) {
    auto result = std::make_unique<FFIResult>();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = detached->data();
    result->data_length = detached->size();
    result->owner_ptr = detached.release();
    result->owner_deleter = [](void* buffer) { delete reinterpret_cast<flatbuffers::DetachedBuffer*>(buffer); };
    return result.release();
}

static FFIResult* packError(proto::StatusCode status) {
    std::string_view message;
    switch (status) {
        case proto::StatusCode::NODE_NOT_PERSISTED:
            message = "Node is not persisted";
            break;
        case proto::StatusCode::NODE_NOT_FOUND:
            message = "Node does not exist";
            break;
        case proto::StatusCode::PARENT_NOT_PERSISTED:
            message = "Parent node is not persisted";
            break;
        case proto::StatusCode::SIBLING_NOT_PERSISTED:
            message = "Sibling node is not persisted";
            break;
        case proto::StatusCode::GAP_SIZE_ODD:
            message = "Gap size must be even";
            break;
        case proto::StatusCode::MUTATION_TYPE_INVALID:
            message = "Invalid mutation type";
            break;
        case proto::StatusCode::TRANSACTION_NOT_ACTIVE:
            message = "Transaction is not active";
            break;
        case proto::StatusCode::STORAGE_ERROR:
            message = "Storage error";
            break;
        case proto::StatusCode::STORAGE_BUSY:
            message = "Storage is busy";
            break;
        case proto::StatusCode::STORAGE_CONSTRAINT_VIOLATION:
            message = "Storage constraint violation";
            break;
        case proto::StatusCode::OK:
            message = "";
            break;
    }
    auto result = new FFIResult();
    result->status_code = static_cast<uint32_t>(status);
    result->data_ptr = static_cast<const void*>(message.data());
    result->data_length = message.size();
    result->owner_ptr = nullptr;
    result->owner_deleter = [](void*) {};
    return result;
}

/// Pack an error and log the message of the store if the store failed
static FFIResult* packStoreError(TreeHandle& handle, proto::StatusCode status) {
    if (IsStorageError(status) && !handle.store->GetLastError().empty()) {
        console::log(handle.store->GetLastError());
    }
    return packError(status);
}

/// Pack a mutation result
static FFIResult* packMutation(const Node& node) {
    flatbuffers::FlatBufferBuilder fb;
    auto node_ofs = node.Pack(fb);
    proto::MutationResultBuilder result{fb};
    result.add_node(node_ofs);
    result.add_moved(node.HasMoved());
    fb.Finish(result.Finish());
    return packBuffer(std::make_unique<flatbuffers::DetachedBuffer>(fb.Release()));
}

/// Save a node with an intent
static proto::StatusCode saveWithIntent(TreeHandle& handle, Node& node, uint8_t mutation_type, NodeID target_id) {
    auto type = static_cast<proto::MutationType>(mutation_type);
    if (type == proto::MutationType::ROOT) {
        return handle.tree.SaveAsRoot(node);
    }
    if (type != proto::MutationType::APPEND_TO && type != proto::MutationType::PREPEND_TO &&
        type != proto::MutationType::BEFORE && type != proto::MutationType::AFTER) {
        return proto::StatusCode::MUTATION_TYPE_INVALID;
    }
    auto [target, status] = handle.tree.Find(target_id);
    if (status != proto::StatusCode::OK) {
        return status;
    }
    switch (type) {
        case proto::MutationType::APPEND_TO:
            return handle.tree.Append(*target, node);
        case proto::MutationType::PREPEND_TO:
            return handle.tree.Prepend(*target, node);
        case proto::MutationType::BEFORE:
            return handle.tree.InsertBefore(node, *target);
        case proto::MutationType::AFTER:
            return handle.tree.InsertAfter(node, *target);
        default:
            return proto::StatusCode::MUTATION_TYPE_INVALID;
    }
}

/// Get the nestedset version
extern "C" NestedSetVersion* nestedset_version() { return &nestedset::VERSION; }

/// Delete a result
extern "C" void nestedset_result_delete(FFIResult* result) {
    result->owner_deleter(result->owner_ptr);
    result->owner_ptr = nullptr;
    result->owner_deleter = nullptr;
    delete result;
}

/// Create a tree in process memory
extern "C" FFIResult* nestedset_tree_new(bool soft_delete) {
    auto store = std::make_unique<MemoryBoundsStore>();
    return packPtr(std::make_unique<TreeHandle>(std::move(store), TreeOptions{.soft_delete = soft_delete}));
}

/// Open a tree in a SQLite database
extern "C" FFIResult* nestedset_tree_open(const char* path_ptr, size_t path_length, bool soft_delete) {
    std::string path{path_ptr, path_length};
    auto [store, status] = SQLiteBoundsStore::Open(path);
    if (status != proto::StatusCode::OK) {
        console::log("Failed to open database: " + path);
        return packError(status);
    }
    if (auto table_status = store->CreateTable(); table_status != proto::StatusCode::OK) {
        console::log(store->GetLastError());
        return packError(table_status);
    }
    return packPtr(std::make_unique<TreeHandle>(std::move(store), TreeOptions{.soft_delete = soft_delete}));
}

/// Insert a new node
extern "C" FFIResult* nestedset_tree_insert_node(TreeHandle* tree, const char* name_ptr, size_t name_length,
                                                 uint8_t mutation_type, int64_t target_id) {
    Node node{std::string_view{name_ptr, name_length}};
    if (auto status = saveWithIntent(*tree, node, mutation_type, target_id); status != proto::StatusCode::OK) {
        return packStoreError(*tree, status);
    }
    return packMutation(node);
}

/// Move an existing node
extern "C" FFIResult* nestedset_tree_move_node(TreeHandle* tree, int64_t node_id, uint8_t mutation_type,
                                               int64_t target_id) {
    auto [node, status] = tree->tree.Find(node_id);
    if (status != proto::StatusCode::OK) {
        return packError(status);
    }
    if (auto save_status = saveWithIntent(*tree, *node, mutation_type, target_id);
        save_status != proto::StatusCode::OK) {
        return packStoreError(*tree, save_status);
    }
    return packMutation(*node);
}

/// Delete a node
extern "C" FFIResult* nestedset_tree_delete_node(TreeHandle* tree, int64_t node_id) {
    auto [node, status] = tree->tree.Find(node_id);
    if (status != proto::StatusCode::OK) {
        return packError(status);
    }
    if (auto [_, delete_status] = tree->tree.Delete(*node); delete_status != proto::StatusCode::OK) {
        return packStoreError(*tree, delete_status);
    }
    return packOK();
}

/// Restore a soft-deleted node
extern "C" FFIResult* nestedset_tree_restore_node(TreeHandle* tree, int64_t node_id) {
    auto [node, status] = tree->tree.Find(node_id, true);
    if (status != proto::StatusCode::OK) {
        return packError(status);
    }
    if (auto restore_status = tree->tree.Restore(*node); restore_status != proto::StatusCode::OK) {
        return packStoreError(*tree, restore_status);
    }
    return packOK();
}

/// Describe a tree
extern "C" FFIResult* nestedset_tree_describe(TreeHandle* tree) {
    flatbuffers::FlatBufferBuilder fb;
    auto [description, status] = tree->tree.Describe(fb);
    if (status != proto::StatusCode::OK) {
        return packStoreError(*tree, status);
    }
    fb.Finish(description);
    return packBuffer(std::make_unique<flatbuffers::DetachedBuffer>(fb.Release()));
}

/// Count the consistency errors of a tree
extern "C" FFIResult* nestedset_tree_count_errors(TreeHandle* tree) {
    auto [errors, status] = tree->tree.CountErrors();
    if (status != proto::StatusCode::OK) {
        return packStoreError(*tree, status);
    }
    flatbuffers::FlatBufferBuilder fb;
    fb.Finish(errors.Pack(fb));
    return packBuffer(std::make_unique<flatbuffers::DetachedBuffer>(fb.Release()));
}
