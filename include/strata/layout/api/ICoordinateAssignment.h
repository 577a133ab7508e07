#pragma once

#include "../config/LayoutOptions.h"

namespace strata {

struct LayoutContext;

/// Abstract interface for coordinate assignment algorithms
///
/// Implementations write LayoutNode::position for every node (dummy nodes
/// included) and Level::coordinate for every level. Margin and grid
/// alignment are applied afterwards by SugiyamaLayout.
///
/// Use this interface to swap coordinate assignment algorithms without
/// modifying SugiyamaLayout or other dependent code.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    /// Assign coordinates based on level ordering
    /// @param ctx Working graph with final level orders
    /// @param options Layout options (direction, spacing, compaction)
    virtual void assign(LayoutContext& ctx, const LayoutOptions& options) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
