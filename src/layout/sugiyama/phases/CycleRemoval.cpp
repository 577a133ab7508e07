#include "CycleRemoval.h"
#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <utility>
#include <vector>

namespace strata {
namespace algorithms {

namespace {

struct Frame {
    NodeId node;
    size_t next = 0;  // index of the next child to examine
};

}  // namespace

CycleRemovalResult DfsCycleRemoval::removeCycles(LayoutContext& ctx) const {
    CycleRemovalResult result;

    const size_t n = ctx.nodeCount();
    std::vector<bool> visited(n, false);
    std::vector<bool> inStack(n, false);
    std::vector<Frame> stack;

    for (NodeId start = 0; start < n; ++start) {
        if (visited[start]) {
            continue;
        }

        visited[start] = true;
        inStack[start] = true;
        stack.push_back({start, 0});

        while (!stack.empty()) {
            Frame& frame = stack.back();
            const auto& children = ctx.adjacency[frame.node];

            if (frame.next >= children.size()) {
                inStack[frame.node] = false;
                stack.pop_back();
                continue;
            }

            NodeId child = children[frame.next];

            if (inStack[child]) {
                // Back arc. Reversing removes it from this child list, so the
                // same index now holds the following child.
                reverseArc(ctx, frame.node, child, result);
                continue;
            }

            ++frame.next;
            if (!visited[child]) {
                visited[child] = true;
                inStack[child] = true;
                stack.push_back({child, 0});
            }
        }
    }

    result.isAcyclic = true;

    if (result.reversedArcs > 0) {
        LOG_DEBUG("Reversed {} arcs ({} edges) to break cycles",
                  result.reversedArcs, result.reversedEdges.size());
    }
    return result;
}

void DfsCycleRemoval::reverseArc(LayoutContext& ctx, NodeId from, NodeId to,
                                 CycleRemovalResult& result) const {
    ctx.removeArc(from, to);
    ctx.addArc(to, from);
    ++result.reversedArcs;

    for (EdgeId i = 0; i < ctx.edges.size(); ++i) {
        LayoutEdge& edge = ctx.edges[i];
        if (edge.source == from && edge.target == to) {
            std::swap(edge.source, edge.target);
            edge.reversed = true;
            result.reversedEdges.push_back(i);
            LOG_TRACE("Edge '{}' reversed ({} -> {})", edge.id,
                      ctx.nodes[edge.source].id, ctx.nodes[edge.target].id);
        }
    }
}

bool DfsCycleRemoval::hasCycles(const LayoutContext& ctx) const {
    enum class NodeState { White, Gray, Black };

    const size_t n = ctx.nodeCount();
    std::vector<NodeState> state(n, NodeState::White);
    std::vector<Frame> stack;

    for (NodeId start = 0; start < n; ++start) {
        if (state[start] != NodeState::White) {
            continue;
        }

        state[start] = NodeState::Gray;
        stack.push_back({start, 0});

        while (!stack.empty()) {
            Frame& frame = stack.back();
            const auto& children = ctx.adjacency[frame.node];

            if (frame.next >= children.size()) {
                state[frame.node] = NodeState::Black;
                stack.pop_back();
                continue;
            }

            NodeId child = children[frame.next++];
            if (state[child] == NodeState::Gray) {
                return true;
            }
            if (state[child] == NodeState::White) {
                state[child] = NodeState::Gray;
                stack.push_back({child, 0});
            }
        }
    }
    return false;
}

}  // namespace algorithms
}  // namespace strata
