#pragma once

#include "api/ILayout.h"
#include "config/LayoutEnums.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <memory>

namespace strata {

// Interfaces
class GraphData;
class ICycleRemoval;
class IRankAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;
struct LayoutContext;

/// Sugiyama-style hierarchical graph layout algorithm
///
/// Implements the classic layered graph drawing approach:
/// 1. Cycle Removal - Make graph acyclic by reversing edges
/// 2. Rank Assignment - Assign nodes to levels
/// 3. Dummy Node Insertion - Split edges spanning several levels
/// 4. Crossing Minimization - Reorder nodes within levels
/// 5. Coordinate Assignment - Compute final x,y positions
/// 6. Edge Routing - Polylines through the dummy nodes
///
/// All intermediate state lives in a LayoutContext created per call, so
/// layout() is const and one instance can serve any number of graphs.
class SugiyamaLayout : public ILayout {
public:
    SugiyamaLayout();
    explicit SugiyamaLayout(const LayoutOptions& options);
    explicit SugiyamaLayout(LayoutPreset preset);
    ~SugiyamaLayout() override;

    // Non-copyable, movable
    SugiyamaLayout(const SugiyamaLayout&) = delete;
    SugiyamaLayout& operator=(const SugiyamaLayout&) = delete;
    SugiyamaLayout(SugiyamaLayout&&) noexcept;
    SugiyamaLayout& operator=(SugiyamaLayout&&) noexcept;

    /// Set layout options
    void setOptions(const LayoutOptions& options) override;
    const LayoutOptions& options() const override { return options_; }

    // Shortcuts for frequently tuned options
    Direction direction() const { return options_.direction; }
    SugiyamaLayout& setDirection(Direction direction);

    float levelSeparation() const { return options_.levelSeparation; }
    SugiyamaLayout& setLevelSeparation(float separation);

    float nodeSeparation() const { return options_.nodeSeparation; }
    SugiyamaLayout& setNodeSeparation(float separation);

    RankingAlgorithm rankingAlgorithm() const { return options_.rankingAlgorithm; }
    SugiyamaLayout& setRankingAlgorithm(RankingAlgorithm algorithm);

    CrossingMinimization crossingMinimization() const { return options_.crossingMinimization; }
    SugiyamaLayout& setCrossingMinimization(CrossingMinimization strategy);

    /// Perform layout. Malformed edges are dropped; never throws for bad input.
    LayoutResult layout(const GraphData& graph) const override;

    /// Algorithm injection (for swapping implementations)
    /// nullptr keeps the current implementation. Rank and coordinate
    /// strategies follow the options until one is injected.
    void setCycleRemoval(std::shared_ptr<ICycleRemoval> impl);
    void setRankAssignment(std::shared_ptr<IRankAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl);

private:
    LayoutOptions options_;

    // Algorithm implementations
    std::shared_ptr<ICycleRemoval> cycleRemoval_;
    std::shared_ptr<IRankAssignment> rankAssignment_;                // nullptr = from options
    std::shared_ptr<ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<ICoordinateAssignment> coordinateAssignment_;    // nullptr = from options

    void assignCoordinates(LayoutContext& ctx) const;

    LayoutResult buildResult(const LayoutContext& ctx, int reversedEdges,
                             int dummyNodes, int crossings) const;
};

}  // namespace strata
