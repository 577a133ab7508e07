#pragma once

namespace strata {

struct LayoutContext;

namespace algorithms {

/// Splits edges that span several levels into one-level segments
///
/// Each intermediate level receives a routing node named
/// `dummy_<edgeId>_<i>`. The edge records its routing nodes from the
/// lower-level endpoint to the higher one, and the long arc is replaced in
/// the adjacency by the chain through them.
class DummyNodeInsertion {
public:
    /// @return Number of routing nodes added
    static int insert(LayoutContext& ctx);
};

}  // namespace algorithms
}  // namespace strata
