#include "nestedset/bounds_store.h"

using namespace nestedset;

bool IsStorageError(proto::StatusCode status) {
    switch (status) {
        case proto::StatusCode::STORAGE_ERROR:
        case proto::StatusCode::STORAGE_BUSY:
        case proto::StatusCode::STORAGE_CONSTRAINT_VIOLATION:
            return true;
        default:
            return false;
    }
}

bool BoundPredicate::Matches(const NodeRow& row) const {
    auto v = column == BoundColumn::Left ? row.left : row.right;
    switch (comparison) {
        case BoundComparison::Less:
            return v < value;
        case BoundComparison::LessEqual:
            return v <= value;
        case BoundComparison::Greater:
            return v > value;
        case BoundComparison::GreaterEqual:
            return v >= value;
        case BoundComparison::Equal:
            return v == value;
    }
    return false;
}

bool NodeFilter::Matches(const NodeRow& row) const {
    if (row.deleted && !include_soft_deleted) {
        return false;
    }
    if (excluded_node_id.has_value() && row.node_id == *excluded_node_id) {
        return false;
    }
    if (parent_id.has_value() && row.parent_id != *parent_id) {
        return false;
    }
    for (auto& predicate : bounds) {
        if (!predicate.Matches(row)) {
            return false;
        }
    }
    return true;
}

std::optional<BoundsMove> BoundsMove::Create(Bound left, Bound right, Bound position) {
    // Inside the own subtree or already there
    if (position >= left && position <= right + 1) {
        return std::nullopt;
    }
    Bound height = right - left + 1;
    if (position > right) {
        return BoundsMove{
            .left = left,
            .right = right,
            .position = position,
            .range_begin = left,
            .range_end = position - 1,
            .distance = position - right - 1,
            .shift = -height,
        };
    } else {
        return BoundsMove{
            .left = left,
            .right = right,
            .position = position,
            .range_begin = position,
            .range_end = right,
            .distance = position - left,
            .shift = height,
        };
    }
}

Transaction::Transaction(BoundsStore& store) : store(store), begin_status(store.BeginTransaction()), finished(false) {
    finished = begin_status != proto::StatusCode::OK;
}

Transaction::~Transaction() {
    if (!finished) {
        store.Rollback();
    }
}

proto::StatusCode Transaction::Commit() {
    if (finished) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    finished = true;
    auto status = store.Commit();
    if (status != proto::StatusCode::OK) {
        store.Rollback();
    }
    return status;
}

proto::StatusCode Transaction::Rollback() {
    if (finished) {
        return proto::StatusCode::TRANSACTION_NOT_ACTIVE;
    }
    finished = true;
    return store.Rollback();
}
