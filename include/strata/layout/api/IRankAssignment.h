#pragma once

#include "../config/LayoutOptions.h"

namespace strata {

struct LayoutContext;

/// Abstract interface for rank (level) assignment algorithms
///
/// Implementations set LayoutNode::level for every node of an acyclic
/// context and group the nodes into LayoutContext::levels.
///
/// Use this interface to swap rank assignment algorithms without
/// modifying SugiyamaLayout or other dependent code.
class IRankAssignment {
public:
    virtual ~IRankAssignment() = default;

    /// Assign a level >= 0 to every node and rebuild the levels
    /// @param ctx Working graph, already acyclic
    /// @param options Layout options (root nodes, iteration caps)
    virtual void assignRanks(LayoutContext& ctx, const LayoutOptions& options) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
