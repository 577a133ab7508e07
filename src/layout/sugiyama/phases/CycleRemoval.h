#pragma once

#include "strata/layout/api/ICycleRemoval.h"

namespace strata {
namespace algorithms {

/// DFS-based cycle removal algorithm
///
/// Walks the adjacency depth-first from every node in insertion order and
/// flips each arc that points back into the current DFS path. The walk is
/// iterative so deep chains do not exhaust the call stack.
class DfsCycleRemoval : public ICycleRemoval {
public:
    DfsCycleRemoval() = default;

    const char* algorithmName() const override { return "DFS"; }

    CycleRemovalResult removeCycles(LayoutContext& ctx) const override;

    bool hasCycles(const LayoutContext& ctx) const override;

private:
    /// Flip arc from -> to and every edge record with that orientation
    void reverseArc(LayoutContext& ctx, NodeId from, NodeId to,
                    CycleRemovalResult& result) const;
};

}  // namespace algorithms
}  // namespace strata
