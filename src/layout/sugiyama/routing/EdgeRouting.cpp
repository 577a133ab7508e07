#include "EdgeRouting.h"
#include "strata/layout/LayoutContext.h"

namespace strata {

void EdgeRouting::route(LayoutContext& ctx) {
    for (LayoutEdge& edge : ctx.edges) {
        edge.controlPoints.clear();
        edge.controlPoints.reserve(edge.dummyNodes.size() + 2);

        edge.controlPoints.push_back(ctx.nodes[edge.source].position);
        for (NodeId dummy : edge.dummyNodes) {
            edge.controlPoints.push_back(ctx.nodes[dummy].position);
        }
        edge.controlPoints.push_back(ctx.nodes[edge.target].position);
    }
}

float EdgeRouting::totalLength(const LayoutContext& ctx) {
    float total = 0.0f;
    for (const LayoutEdge& edge : ctx.edges) {
        for (size_t i = 1; i < edge.controlPoints.size(); ++i) {
            total += edge.controlPoints[i - 1].distanceTo(edge.controlPoints[i]);
        }
    }
    return total;
}

}  // namespace strata
