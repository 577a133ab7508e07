#pragma once

#include "../../core/Types.h"

#include <vector>

namespace strata {

struct LayoutContext;

/// Result of cycle removal operation
struct CycleRemovalResult {
    std::vector<EdgeId> reversedEdges;  ///< Edge records that were flipped
    int reversedArcs = 0;               ///< Back arcs found in the adjacency
    bool isAcyclic = false;             ///< Whether the working graph is now acyclic
};

/// Abstract interface for cycle removal algorithms
///
/// Implementations flip edges in place (LayoutEdge::reversed) so that the
/// adjacency of the context becomes acyclic.
///
/// Use this interface to swap cycle removal algorithms without
/// modifying SugiyamaLayout or other dependent code.
class ICycleRemoval {
public:
    virtual ~ICycleRemoval() = default;

    /// Reverse back edges until the context's adjacency is acyclic
    virtual CycleRemovalResult removeCycles(LayoutContext& ctx) const = 0;

    /// Check if the context's adjacency has cycles (does not modify it)
    virtual bool hasCycles(const LayoutContext& ctx) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
