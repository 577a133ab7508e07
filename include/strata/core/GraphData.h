#pragma once

#include <any>
#include <string>
#include <variant>
#include <vector>

namespace strata {

/// Input node. Only `id` takes part in layout; the rest is carried for renderers.
struct NodeData {
    std::string id;
    std::string label;
    std::any userData;

    NodeData() = default;
    explicit NodeData(std::string nodeId) : id(std::move(nodeId)) {}
    NodeData(std::string nodeId, std::string lbl)
        : id(std::move(nodeId)), label(std::move(lbl)) {}
};

/// An edge endpoint given either as a node id or as an already resolved node
using EdgeEndpoint = std::variant<std::string, NodeData>;

/// Id named by an endpoint, whichever form it was given in
const std::string& endpointId(const EdgeEndpoint& endpoint);

/// Input edge. Endpoints are not validated here; the layout drops edges whose
/// endpoints are unknown or identical.
struct EdgeData {
    std::string id;
    EdgeEndpoint source;
    EdgeEndpoint target;
    std::string label;
    std::any userData;

    EdgeData() = default;
    EdgeData(std::string edgeId, EdgeEndpoint src, EdgeEndpoint tgt)
        : id(std::move(edgeId)), source(std::move(src)), target(std::move(tgt)) {}
    EdgeData(std::string edgeId, EdgeEndpoint src, EdgeEndpoint tgt, std::string lbl)
        : id(std::move(edgeId)), source(std::move(src)), target(std::move(tgt)),
          label(std::move(lbl)) {}
};

/// Raw graph handed to a layout. Accepts anything, including dangling edges,
/// self-loops and duplicate ids.
class GraphData {
public:
    GraphData() = default;

    // Node operations
    const NodeData& addNode(const std::string& id);
    const NodeData& addNode(const std::string& id, const std::string& label);
    const NodeData& addNode(const NodeData& data);

    // Edge operations
    const EdgeData& addEdge(const std::string& id, EdgeEndpoint source, EdgeEndpoint target);
    const EdgeData& addEdge(const std::string& id, EdgeEndpoint source, EdgeEndpoint target,
                            const std::string& label);
    const EdgeData& addEdge(const EdgeData& data);

    const std::vector<NodeData>& nodes() const { return nodes_; }
    const std::vector<EdgeData>& edges() const { return edges_; }

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    void clear();

private:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
};

}  // namespace strata
