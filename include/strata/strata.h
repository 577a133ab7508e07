#pragma once

/// @file strata.h
/// @brief Main header for the strata layered graph layout library
///
/// strata places the nodes of a directed graph on levels so that edges
/// mostly point the same way, orders each level to reduce crossings, and
/// routes edges as polylines.
///
/// Example usage:
/// @code
/// #include <strata/strata.h>
///
/// strata::GraphData graph;
/// graph.addNode("a");
/// graph.addNode("b");
/// graph.addEdge("a->b", "a", "b");
///
/// strata::SugiyamaLayout layout(strata::LayoutPreset::Tree);
/// auto result = layout.layout(graph);
/// auto pos = result.position("b");
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/GraphData.h"

// Layout module - Layout algorithms and results
#include "layout/config/LayoutEnums.h"
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutResult.h"
#include "layout/api/ILayout.h"
#include "layout/SugiyamaLayout.h"
#include "layout/util/LayoutSerializer.h"

#include <string>

namespace strata {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace strata
