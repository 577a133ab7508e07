#pragma once

#include "../config/LayoutEnums.h"

namespace strata {

struct LayoutContext;

/// Result of crossing minimization operation
struct CrossingMinimizationResult {
    int initialCrossings = 0;  ///< Crossings of the insertion order
    int crossingCount = 0;     ///< Crossings of the order left in the context
    int bestIteration = -1;    ///< Sweep that produced the kept order (-1 = initial)
};

/// Abstract interface for crossing minimization algorithms
///
/// Implementations reorder LayoutContext::levels and keep LayoutNode::order
/// consistent with the position of each node in its level.
///
/// Use this interface to swap crossing minimization algorithms without
/// modifying SugiyamaLayout or other dependent code.
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// Minimize crossings
    /// @param ctx Working graph with levels and dummy nodes in place
    /// @param strategy Neighbor statistic used to rank nodes
    /// @param iterations Number of sweeps
    virtual CrossingMinimizationResult minimize(
        LayoutContext& ctx,
        CrossingMinimization strategy,
        int iterations) const = 0;

    /// Count crossings between two levels
    /// @param upperLevel Key of the level holding arc sources
    /// @param lowerLevel Key of the level holding arc targets
    virtual int countCrossings(
        const LayoutContext& ctx,
        int upperLevel,
        int lowerLevel) const = 0;

    /// Count crossings between every pair of consecutive levels
    virtual int countTotalCrossings(const LayoutContext& ctx) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
