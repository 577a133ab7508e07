#include "strata/layout/util/LayoutSerializer.h"
#include "strata/layout/config/LayoutOptions.h"
#include "strata/layout/config/LayoutResult.h"
#include "strata/core/GraphData.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

using json = nlohmann::json;

namespace strata {

namespace {

json pointToJson(const Point& p) {
    return {{"x", p.x}, {"y", p.y}};
}

Point pointFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>()};
}

EdgeEndpoint endpointFromJson(const json& j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    NodeData node(j.at("id").get<std::string>());
    node.label = j.value("label", "");
    return node;
}

}  // namespace

// =============================================================================
// Enum names
// =============================================================================

std::string LayoutSerializer::directionToString(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom: return "TB";
        case Direction::BottomToTop: return "BT";
        case Direction::LeftToRight: return "LR";
        case Direction::RightToLeft: return "RL";
    }
    return "TB";
}

Direction LayoutSerializer::stringToDirection(const std::string& str) {
    if (str == "TB") return Direction::TopToBottom;
    if (str == "BT") return Direction::BottomToTop;
    if (str == "LR") return Direction::LeftToRight;
    if (str == "RL") return Direction::RightToLeft;
    return Direction::TopToBottom;
}

std::string LayoutSerializer::rankingToString(RankingAlgorithm algorithm) {
    switch (algorithm) {
        case RankingAlgorithm::LongestPath: return "longest-path";
        case RankingAlgorithm::TightTree: return "tight-tree";
        case RankingAlgorithm::NetworkSimplex: return "network-simplex";
    }
    return "longest-path";
}

RankingAlgorithm LayoutSerializer::stringToRanking(const std::string& str) {
    if (str == "tight-tree") return RankingAlgorithm::TightTree;
    if (str == "network-simplex") return RankingAlgorithm::NetworkSimplex;
    return RankingAlgorithm::LongestPath;
}

std::string LayoutSerializer::crossingToString(CrossingMinimization strategy) {
    switch (strategy) {
        case CrossingMinimization::Barycenter: return "barycenter";
        case CrossingMinimization::Median: return "median";
        case CrossingMinimization::None: return "none";
    }
    return "barycenter";
}

CrossingMinimization LayoutSerializer::stringToCrossing(const std::string& str) {
    if (str == "median") return CrossingMinimization::Median;
    if (str == "none") return CrossingMinimization::None;
    return CrossingMinimization::Barycenter;
}

std::string LayoutSerializer::coordinateToString(CoordinateAssignment algorithm) {
    switch (algorithm) {
        case CoordinateAssignment::Simple: return "simple";
        case CoordinateAssignment::BrandesKopf: return "brandes-kopf";
        case CoordinateAssignment::Tight: return "tight";
    }
    return "brandes-kopf";
}

CoordinateAssignment LayoutSerializer::stringToCoordinate(const std::string& str) {
    if (str == "simple") return CoordinateAssignment::Simple;
    if (str == "tight") return CoordinateAssignment::Tight;
    return CoordinateAssignment::BrandesKopf;
}

bool LayoutSerializer::stringToPreset(const std::string& str, LayoutPreset& preset) {
    if (str == "default") { preset = LayoutPreset::Default; return true; }
    if (str == "tree") { preset = LayoutPreset::Tree; return true; }
    if (str == "dag") { preset = LayoutPreset::Dag; return true; }
    if (str == "compact") { preset = LayoutPreset::Compact; return true; }
    if (str == "wide") { preset = LayoutPreset::Wide; return true; }
    return false;
}

// =============================================================================
// GraphData
// =============================================================================

GraphData LayoutSerializer::graphFromJson(const std::string& jsonStr) {
    GraphData graph;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("nodes")) {
            for (const auto& n : j["nodes"]) {
                graph.addNode(n.at("id").get<std::string>(), n.value("label", ""));
            }
        }

        if (j.contains("edges")) {
            for (const auto& e : j["edges"]) {
                EdgeData edge(e.at("id").get<std::string>(),
                              endpointFromJson(e.at("source")),
                              endpointFromJson(e.at("target")),
                              e.value("label", ""));
                graph.addEdge(edge);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse graph JSON: ") + e.what());
    }

    return graph;
}

// =============================================================================
// LayoutOptions
// =============================================================================

std::string LayoutSerializer::toJson(const LayoutOptions& options) {
    json j;
    j["direction"] = directionToString(options.direction);
    j["levelSeparation"] = options.levelSeparation;
    j["nodeSeparation"] = options.nodeSeparation;
    j["subtreeSeparation"] = options.subtreeSeparation;
    j["rootNodes"] = options.rootNodes;
    j["rankingAlgorithm"] = rankingToString(options.rankingAlgorithm);
    j["crossingMinimization"] = crossingToString(options.crossingMinimization);
    j["coordinateAssignment"] = coordinateToString(options.coordinateAssignment);
    j["crossingIterations"] = options.crossingIterations;
    j["tightTreeMaxIterations"] = options.tightTreeMaxIterations;
    j["alignmentIterations"] = options.alignmentIterations;
    j["alignToGrid"] = options.alignToGrid;
    j["gridSize"] = options.gridSize;
    j["compact"] = options.compact;
    j["margin"] = options.margin;
    return j.dump(2);
}

LayoutOptions LayoutSerializer::optionsFromJson(const std::string& jsonStr) {
    LayoutOptions options;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("direction")) {
            options.direction = stringToDirection(j["direction"].get<std::string>());
        }
        options.levelSeparation = j.value("levelSeparation", options.levelSeparation);
        options.nodeSeparation = j.value("nodeSeparation", options.nodeSeparation);
        options.subtreeSeparation = j.value("subtreeSeparation", options.subtreeSeparation);
        if (j.contains("rootNodes")) {
            options.rootNodes = j["rootNodes"].get<std::vector<std::string>>();
        }
        if (j.contains("rankingAlgorithm")) {
            options.rankingAlgorithm = stringToRanking(j["rankingAlgorithm"].get<std::string>());
        }
        if (j.contains("crossingMinimization")) {
            options.crossingMinimization =
                stringToCrossing(j["crossingMinimization"].get<std::string>());
        }
        if (j.contains("coordinateAssignment")) {
            options.coordinateAssignment =
                stringToCoordinate(j["coordinateAssignment"].get<std::string>());
        }
        options.crossingIterations = j.value("crossingIterations", options.crossingIterations);
        options.tightTreeMaxIterations =
            j.value("tightTreeMaxIterations", options.tightTreeMaxIterations);
        options.alignmentIterations = j.value("alignmentIterations", options.alignmentIterations);
        options.alignToGrid = j.value("alignToGrid", options.alignToGrid);
        options.gridSize = j.value("gridSize", options.gridSize);
        options.compact = j.value("compact", options.compact);
        options.margin = j.value("margin", options.margin);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse LayoutOptions JSON: ") + e.what());
    }

    return options;
}

// =============================================================================
// LayoutResult
// =============================================================================

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["version"] = 1;

    // Nodes by level, then order, then id
    std::vector<const NodeLayout*> sorted;
    sorted.reserve(result.nodeCount());
    for (const auto& [id, layout] : result.nodeLayouts()) {
        sorted.push_back(&layout);
    }
    std::sort(sorted.begin(), sorted.end(), [](const NodeLayout* a, const NodeLayout* b) {
        return std::tie(a->level, a->order, a->id) < std::tie(b->level, b->order, b->id);
    });

    json nodes = json::array();
    for (const NodeLayout* layout : sorted) {
        nodes.push_back({
            {"id", layout->id},
            {"position", pointToJson(layout->position)},
            {"level", layout->level},
            {"order", layout->order}
        });
    }
    j["nodes"] = nodes;

    // Edges
    json edges = json::array();
    for (const auto& layout : result.edgeLayouts()) {
        json points = json::array();
        for (const auto& p : layout.controlPoints) {
            points.push_back(pointToJson(p));
        }
        edges.push_back({
            {"id", layout.id},
            {"source", layout.source},
            {"target", layout.target},
            {"label", layout.label},
            {"reversed", layout.reversed},
            {"dummyNodes", layout.dummyNodes},
            {"controlPoints", points}
        });
    }
    j["edges"] = edges;

    const LayoutBounds& b = result.bounds();
    j["bounds"] = {
        {"minX", b.minX}, {"minY", b.minY},
        {"maxX", b.maxX}, {"maxY", b.maxY},
        {"width", b.width}, {"height", b.height}
    };

    const LayoutStats& s = result.stats();
    j["stats"] = {
        {"crossings", s.crossings},
        {"dummyNodes", s.dummyNodes},
        {"reversedEdges", s.reversedEdges},
        {"totalEdgeLength", s.totalEdgeLength}
    };

    j["levelCount"] = result.levelCount();

    return j.dump(2);
}

LayoutResult LayoutSerializer::layoutResultFromJson(const std::string& jsonStr) {
    LayoutResult result;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("nodes")) {
            for (const auto& n : j["nodes"]) {
                NodeLayout layout;
                layout.id = n.at("id").get<std::string>();
                layout.position = pointFromJson(n.at("position"));
                layout.level = n.value("level", 0);
                layout.order = n.value("order", 0);
                result.setNodeLayout(layout);
            }
        }

        if (j.contains("edges")) {
            for (const auto& e : j["edges"]) {
                EdgeLayout layout;
                layout.id = e.at("id").get<std::string>();
                layout.source = e.at("source").get<std::string>();
                layout.target = e.at("target").get<std::string>();
                layout.label = e.value("label", "");
                layout.reversed = e.value("reversed", false);
                if (e.contains("dummyNodes")) {
                    layout.dummyNodes = e["dummyNodes"].get<std::vector<std::string>>();
                }
                if (e.contains("controlPoints")) {
                    for (const auto& p : e["controlPoints"]) {
                        layout.controlPoints.push_back(pointFromJson(p));
                    }
                }
                result.addEdgeLayout(std::move(layout));
            }
        }

        if (j.contains("bounds")) {
            const auto& b = j["bounds"];
            LayoutBounds bounds;
            bounds.minX = b.value("minX", 0.0f);
            bounds.minY = b.value("minY", 0.0f);
            bounds.maxX = b.value("maxX", 0.0f);
            bounds.maxY = b.value("maxY", 0.0f);
            bounds.width = b.value("width", 0.0f);
            bounds.height = b.value("height", 0.0f);
            result.setBounds(bounds);
        }

        if (j.contains("stats")) {
            const auto& s = j["stats"];
            LayoutStats stats;
            stats.crossings = s.value("crossings", 0);
            stats.dummyNodes = s.value("dummyNodes", 0);
            stats.reversedEdges = s.value("reversedEdges", 0);
            stats.totalEdgeLength = s.value("totalEdgeLength", 0.0f);
            result.setStats(stats);
        }

        result.setLevelCount(j.value("levelCount", 0));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse LayoutResult JSON: ") + e.what());
    }

    return result;
}

bool LayoutSerializer::saveToFile(const LayoutResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(result);
    return true;
}

bool LayoutSerializer::loadFromFile(LayoutResult& result, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    result = layoutResultFromJson(buffer.str());
    return true;
}

}  // namespace strata
