#pragma once

#include "../../core/Types.h"

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

/// Positioned node in the layout result
struct NodeLayout {
    std::string id;
    Point position;   // Node center
    int level = 0;    // Rank in the hierarchy
    int order = 0;    // Position within the level
};

/// Routed edge in the layout result
///
/// `source`/`target` are the layout direction: for a reversed edge they are
/// swapped relative to the input.
struct EdgeLayout {
    std::string id;
    std::string source;
    std::string target;
    std::string label;
    std::any userData;

    bool reversed = false;                 // Flipped to break a cycle
    std::vector<std::string> dummyNodes;   // Routing nodes, lower level first
    std::vector<Point> controlPoints;      // source -> dummies -> target

    /// Sum of segment lengths of the polyline
    float length() const {
        float total = 0.0f;
        for (size_t i = 1; i < controlPoints.size(); ++i) {
            total += controlPoints[i - 1].distanceTo(controlPoints[i]);
        }
        return total;
    }
};

/// Axis-aligned bounds over every laid out node, routing nodes included
struct LayoutBounds {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 0.0f;
    float maxY = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect toRect() const { return {minX, minY, width, height}; }
};

/// Summary numbers of one layout run
struct LayoutStats {
    int crossings = 0;
    int dummyNodes = 0;
    int reversedEdges = 0;
    float totalEdgeLength = 0.0f;
};

/// Complete layout result for a graph
class LayoutResult {
public:
    LayoutResult() = default;

    // Node layout operations
    void setNodeLayout(const NodeLayout& layout);
    const NodeLayout* getNodeLayout(const std::string& id) const;
    bool hasNodeLayout(const std::string& id) const;

    /// Position of a node; throws std::out_of_range for unknown ids
    const Point& position(const std::string& id) const;

    // Edge layout operations (kept in ingestion order)
    void addEdgeLayout(EdgeLayout layout);
    const EdgeLayout* getEdgeLayout(const std::string& id) const;
    bool hasEdgeLayout(const std::string& id) const;

    // Iteration
    const std::unordered_map<std::string, NodeLayout>& nodeLayouts() const { return nodeLayouts_; }
    const std::vector<EdgeLayout>& edgeLayouts() const { return edgeLayouts_; }

    /// Node id -> position, routing nodes excluded
    std::unordered_map<std::string, Point> positions() const;

    // Bounds and statistics
    void setBounds(const LayoutBounds& bounds) { bounds_ = bounds; }
    const LayoutBounds& bounds() const { return bounds_; }

    void setStats(const LayoutStats& stats) { stats_ = stats; }
    const LayoutStats& stats() const { return stats_; }

    // Level information
    void setLevelCount(int count) { levelCount_ = count; }
    int levelCount() const { return levelCount_; }

    /// Ids of the published nodes on a level, ordered by `order`
    std::vector<std::string> nodesInLevel(int level) const;

    size_t nodeCount() const { return nodeLayouts_.size(); }
    size_t edgeCount() const { return edgeLayouts_.size(); }

    void clear();

    // Serialization (JSON format)
    std::string toJson() const;
    static LayoutResult fromJson(const std::string& json);

private:
    std::unordered_map<std::string, NodeLayout> nodeLayouts_;
    std::vector<EdgeLayout> edgeLayouts_;
    std::unordered_map<std::string, size_t> edgeIndex_;
    LayoutBounds bounds_;
    LayoutStats stats_;
    int levelCount_ = 0;
};

}  // namespace strata
