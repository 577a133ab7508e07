#pragma once

#include "../config/LayoutOptions.h"
#include "../config/LayoutResult.h"

namespace strata {

class GraphData;

/// Abstract interface for graph layout algorithms
///
/// All layout algorithms should implement this interface to enable
/// polymorphic usage and easy swapping of layout strategies.
class ILayout {
public:
    virtual ~ILayout() = default;

    /// Set layout options
    virtual void setOptions(const LayoutOptions& options) = 0;

    /// Get current layout options
    virtual const LayoutOptions& options() const = 0;

    /// Compute a layout. Never throws for malformed graphs.
    virtual LayoutResult layout(const GraphData& graph) const = 0;
};

}  // namespace strata
