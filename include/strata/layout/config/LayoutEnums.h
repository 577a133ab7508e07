#pragma once

namespace strata {

/// Direction of hierarchical layout
enum class Direction {
    TopToBottom,   // "TB": roots at top, levels grow downward
    BottomToTop,   // "BT": roots at bottom
    LeftToRight,   // "LR": roots at left
    RightToLeft    // "RL": roots at right
};

/// Rank (level) assignment strategy
enum class RankingAlgorithm {
    LongestPath,     // BFS from roots, rank = longest distance
    TightTree,       // Longest path followed by median tightening
    NetworkSimplex   // Currently the same as TightTree
};

/// Crossing minimization strategy
enum class CrossingMinimization {
    Barycenter,  // Mean order of neighbors
    Median,      // Median order of neighbors
    None         // Keep insertion order
};

/// Coordinate assignment strategy
enum class CoordinateAssignment {
    Simple,       // Evenly spaced, centered levels
    BrandesKopf,  // Simple followed by neighbor alignment and compaction
    Tight         // Currently the same as BrandesKopf
};

/// Named option sets for common graph shapes
enum class LayoutPreset {
    Default,
    Tree,
    Dag,
    Compact,
    Wide
};

/// True for LR and RL, where levels run along the x axis
inline bool isHorizontal(Direction direction) {
    return direction == Direction::LeftToRight || direction == Direction::RightToLeft;
}

/// True for BT and RL, where level 0 is placed last along the primary axis
inline bool isReversed(Direction direction) {
    return direction == Direction::BottomToTop || direction == Direction::RightToLeft;
}

}  // namespace strata
