#pragma once

namespace strata {

struct LayoutContext;

/// Routes edges as polylines through their dummy nodes
///
/// Control points are the source position, the routing node positions in
/// the edge's order, and the target position. No smoothing is applied.
class EdgeRouting {
public:
    /// Fill LayoutEdge::controlPoints for every edge of the context
    static void route(LayoutContext& ctx);

    /// Sum of segment lengths over all routed edges
    static float totalLength(const LayoutContext& ctx);
};

}  // namespace strata
