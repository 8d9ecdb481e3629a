#include "nestedset/gap_allocator.h"

using namespace nestedset;

proto::StatusCode GapAllocator::MakeGap(Bound cut, Bound size) {
    if (size == 0) {
        return proto::StatusCode::OK;
    }
    if (size % 2 != 0) {
        return proto::StatusCode::GAP_SIZE_ODD;
    }
    if (auto [_, status] = store.ShiftBounds(BoundColumn::Left, cut, size); status != proto::StatusCode::OK) {
        return status;
    }
    return store.ShiftBounds(BoundColumn::Right, cut, size).second;
}
