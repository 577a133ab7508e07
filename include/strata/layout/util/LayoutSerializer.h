#pragma once

#include "../config/LayoutEnums.h"
#include <string>

namespace strata {

// Forward declarations
class GraphData;
class LayoutResult;
struct LayoutOptions;

/// Handles JSON serialization and file I/O for graphs, options and results
class LayoutSerializer {
public:
    // === GraphData ===

    /// Parse `{"nodes": [{"id", "label"?}], "edges": [{"id", "source", "target", "label"?}]}`
    /// Edge endpoints may be a node id string or an object with an "id" field.
    /// @throws std::runtime_error if parsing fails
    static GraphData graphFromJson(const std::string& json);

    // === LayoutOptions ===

    /// Serialize options to JSON string
    static std::string toJson(const LayoutOptions& options);

    /// Parse options; missing keys keep their defaults and unknown enum
    /// names fall back to the default value
    /// @throws std::runtime_error if parsing fails
    static LayoutOptions optionsFromJson(const std::string& json);

    // === LayoutResult ===

    /// Serialize layout result to JSON string
    /// @param result The LayoutResult to serialize
    /// @return JSON string representation
    static std::string toJson(const LayoutResult& result);

    /// Deserialize JSON string to layout result
    /// @param json JSON string to parse
    /// @return Parsed LayoutResult
    /// @throws std::runtime_error if parsing fails
    static LayoutResult layoutResultFromJson(const std::string& json);

    /// Save layout result to file
    /// @return true if save succeeded
    static bool saveToFile(const LayoutResult& result, const std::string& path);

    /// Load layout result from file
    /// @return false if the file cannot be opened
    /// @throws std::runtime_error if the content cannot be parsed
    static bool loadFromFile(LayoutResult& result, const std::string& path);

    // === Enum names ===

    static std::string directionToString(Direction direction);
    static Direction stringToDirection(const std::string& str);

    static std::string rankingToString(RankingAlgorithm algorithm);
    static RankingAlgorithm stringToRanking(const std::string& str);

    static std::string crossingToString(CrossingMinimization strategy);
    static CrossingMinimization stringToCrossing(const std::string& str);

    static std::string coordinateToString(CoordinateAssignment algorithm);
    static CoordinateAssignment stringToCoordinate(const std::string& str);

    /// "default", "tree", "dag", "compact", "wide"
    /// @return false for unknown names
    static bool stringToPreset(const std::string& str, LayoutPreset& preset);
};

}  // namespace strata
