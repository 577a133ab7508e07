#pragma once

#include "strata/layout/api/ICoordinateAssignment.h"
#include "strata/core/Types.h"

#include <memory>

namespace strata {

struct Level;
struct LayoutNode;

namespace algorithms {

/// Simple coordinate assignment algorithm
///
/// Levels are spaced levelSeparation apart along the primary axis (in
/// reverse key order for BT and RL). Inside a level nodes are centered
/// around 0 and spaced nodeSeparation apart on the cross axis.
class SimpleCoordinateAssignment : public ICoordinateAssignment {
public:
    SimpleCoordinateAssignment() = default;

    const char* algorithmName() const override { return "Simple"; }

    void assign(LayoutContext& ctx, const LayoutOptions& options) const override;

protected:
    static float crossCoordinate(const LayoutNode& node, bool horizontal);
    static void setCrossCoordinate(LayoutNode& node, bool horizontal, float value);
};

/// Brandes-Köpf style coordinate assignment (better edge straightness)
///
/// Starts from the simple placement, then repeatedly moves each node to the
/// mean cross coordinate of its parents (top-down) and of its children
/// (bottom-up) without crowding its level neighbors. With `compact`, sparse
/// levels are pulled together and the drawing is re-centered.
class BrandesKopfCoordinateAssignment : public SimpleCoordinateAssignment {
public:
    const char* algorithmName() const override { return "BrandesKopf"; }

    void assign(LayoutContext& ctx, const LayoutOptions& options) const override;

private:
    void alignToNeighbors(LayoutContext& ctx, const LayoutOptions& options,
                          bool alignToParents) const;

    /// Whether the node at `index` of `level` may move by `delta`
    bool canShift(const LayoutContext& ctx, const Level& level, size_t index,
                  float delta, const LayoutOptions& options) const;

    void compactLayout(LayoutContext& ctx, const LayoutOptions& options) const;
    void centerLayout(LayoutContext& ctx, bool horizontal) const;
};

/// Alias kept for the "tight" selector
class TightCoordinateAssignment : public BrandesKopfCoordinateAssignment {
public:
    const char* algorithmName() const override { return "Tight"; }
};

/// Strategy instance for a coordinate selector
std::unique_ptr<ICoordinateAssignment> makeCoordinateAssignment(CoordinateAssignment algorithm);

/// Final placement adjustments applied after any coordinate strategy
class CoordinatePostProcess {
public:
    /// Translate so the minimum x and y over all nodes equal `margin`
    static void applyMargin(LayoutContext& ctx, float margin);

    /// Snap every coordinate to the nearest multiple of `gridSize`, then
    /// shift by whole grid cells if snapping pulled the minimum below `margin`
    static void alignToGrid(LayoutContext& ctx, float gridSize, float margin);
};

}  // namespace algorithms
}  // namespace strata
