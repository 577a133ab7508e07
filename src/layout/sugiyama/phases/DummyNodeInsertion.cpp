#include "DummyNodeInsertion.h"
#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace strata {
namespace algorithms {

int DummyNodeInsertion::insert(LayoutContext& ctx) {
    int dummyCount = 0;

    for (size_t e = 0; e < ctx.edges.size(); ++e) {
        NodeId source = ctx.edges[e].source;
        NodeId target = ctx.edges[e].target;
        int sourceLevel = ctx.nodes[source].level;
        int targetLevel = ctx.nodes[target].level;

        int span = std::abs(targetLevel - sourceLevel);
        if (span <= 1) {
            continue;
        }

        const std::string edgeId = ctx.edges[e].id;
        int minLevel = std::min(sourceLevel, targetLevel);

        std::vector<NodeId> dummies;
        dummies.reserve(static_cast<size_t>(span - 1));
        for (int i = 1; i < span; ++i) {
            std::string dummyId = "dummy_" + edgeId + "_" + std::to_string(i);
            dummies.push_back(ctx.addDummyNode(dummyId, minLevel + i, edgeId));
            ++dummyCount;
        }

        // Chain follows the edge direction; the list stays lower level first
        ctx.removeArc(source, target);
        NodeId previous = source;
        if (sourceLevel < targetLevel) {
            for (NodeId dummy : dummies) {
                ctx.addArc(previous, dummy);
                previous = dummy;
            }
        } else {
            for (auto it = dummies.rbegin(); it != dummies.rend(); ++it) {
                ctx.addArc(previous, *it);
                previous = *it;
            }
        }
        ctx.addArc(previous, target);

        ctx.edges[e].dummyNodes = std::move(dummies);
    }

    if (dummyCount > 0) {
        LOG_DEBUG("Inserted {} dummy nodes", dummyCount);
    }
    return dummyCount;
}

}  // namespace algorithms
}  // namespace strata
