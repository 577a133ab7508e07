#pragma once

#include "strata/layout/api/ICrossingMinimization.h"
#include "strata/core/Types.h"

#include <vector>

namespace strata {

struct Level;

namespace algorithms {

/// Layer-sweep crossing minimization
///
/// Alternates downward sweeps (each level follows its parents in the level
/// above) and upward sweeps (each level follows its children in the level
/// below). Nodes are ranked by the barycenter or median of their neighbors'
/// orders; the ordering with the fewest crossings seen is kept.
class LayerSweepCrossingMinimization : public ICrossingMinimization {
public:
    LayerSweepCrossingMinimization() = default;

    const char* algorithmName() const override { return "LayerSweep"; }

    CrossingMinimizationResult minimize(
        LayoutContext& ctx,
        CrossingMinimization strategy,
        int iterations) const override;

    int countCrossings(
        const LayoutContext& ctx,
        int upperLevel,
        int lowerLevel) const override;

    int countTotalCrossings(const LayoutContext& ctx) const override;

private:
    void sweep(LayoutContext& ctx, CrossingMinimization strategy, bool downward) const;

    void orderLevel(LayoutContext& ctx, Level& level, const Level& fixed,
                    CrossingMinimization strategy, bool useParents) const;

    std::vector<int> captureOrder(const LayoutContext& ctx) const;
    void restoreOrder(LayoutContext& ctx, const std::vector<int>& order) const;
};

}  // namespace algorithms
}  // namespace strata
