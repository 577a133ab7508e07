#pragma once

#include "LayoutEnums.h"

#include <string>
#include <vector>

namespace strata {

/// Options for controlling layout behavior
/// All distances are in output units (pixels for most renderers)
struct LayoutOptions {
    // General layout direction
    Direction direction = Direction::TopToBottom;

    // Spacing
    float levelSeparation = 100.0f;   // Distance between adjacent levels
    float nodeSeparation = 50.0f;     // Distance between neighbors within a level
    float subtreeSeparation = 80.0f;  // Accepted for compatibility; no strategy reads it

    // Nodes forced to rank 0. Ids that are not in the graph are ignored.
    // Empty = detect roots from in-degree.
    std::vector<std::string> rootNodes;

    // Algorithm settings
    RankingAlgorithm rankingAlgorithm = RankingAlgorithm::LongestPath;
    CrossingMinimization crossingMinimization = CrossingMinimization::Barycenter;
    CoordinateAssignment coordinateAssignment = CoordinateAssignment::BrandesKopf;

    // Crossing minimization sweeps (even = downward, odd = upward)
    int crossingIterations = 24;

    // Iteration caps of the iterative refinements
    int tightTreeMaxIterations = 100;  // Rank tightening passes
    int alignmentIterations = 8;       // Parent/child alignment rounds

    // Grid alignment of final coordinates
    bool alignToGrid = false;
    float gridSize = 10.0f;

    // Pull sparse levels together after alignment
    bool compact = true;

    // Minimum x and y of the finished layout
    float margin = 50.0f;

    /// Options of a named preset; fields the preset does not mention keep defaults
    static LayoutOptions fromPreset(LayoutPreset preset);

    // Builder pattern for convenient configuration
    LayoutOptions& setDirection(Direction d) { direction = d; return *this; }
    LayoutOptions& setLevelSeparation(float s) { levelSeparation = s; return *this; }
    LayoutOptions& setNodeSeparation(float s) { nodeSeparation = s; return *this; }
    LayoutOptions& setSubtreeSeparation(float s) { subtreeSeparation = s; return *this; }
    LayoutOptions& setRootNodes(std::vector<std::string> roots) {
        rootNodes = std::move(roots);
        return *this;
    }
    LayoutOptions& setRankingAlgorithm(RankingAlgorithm a) { rankingAlgorithm = a; return *this; }
    LayoutOptions& setCrossingMinimization(CrossingMinimization c) {
        crossingMinimization = c;
        return *this;
    }
    LayoutOptions& setCoordinateAssignment(CoordinateAssignment c) {
        coordinateAssignment = c;
        return *this;
    }
    LayoutOptions& setCrossingIterations(int n) { crossingIterations = n; return *this; }
    LayoutOptions& setTightTreeMaxIterations(int n) { tightTreeMaxIterations = n; return *this; }
    LayoutOptions& setAlignmentIterations(int n) { alignmentIterations = n; return *this; }
    LayoutOptions& setGrid(bool enabled, float size) {
        alignToGrid = enabled;
        gridSize = size;
        return *this;
    }
    LayoutOptions& setCompact(bool enabled) { compact = enabled; return *this; }
    LayoutOptions& setMargin(float m) { margin = m; return *this; }
};

}  // namespace strata
