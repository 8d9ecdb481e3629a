#pragma once

#include "nestedset/bounds_store.h"

namespace nestedset {

/// Opens and closes gaps in the bound sequence.
///
/// A gap of size s at cut c shifts every left and every right bound >= c by s.
/// The two columns are shifted independently since a node may straddle the cut.
/// Negative sizes close a gap.
class GapAllocator {
   protected:
    /// The store
    BoundsStore& store;

   public:
    /// Constructor
    explicit GapAllocator(BoundsStore& store) : store(store) {}

    /// Open (size > 0) or close (size < 0) a gap at a cut
    proto::StatusCode MakeGap(Bound cut, Bound size);
};

}  // namespace nestedset
