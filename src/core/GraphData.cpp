#include "strata/core/GraphData.h"

namespace strata {

const std::string& endpointId(const EdgeEndpoint& endpoint) {
    if (const auto* id = std::get_if<std::string>(&endpoint)) {
        return *id;
    }
    return std::get<NodeData>(endpoint).id;
}

const NodeData& GraphData::addNode(const std::string& id) {
    return addNode(NodeData{id});
}

const NodeData& GraphData::addNode(const std::string& id, const std::string& label) {
    return addNode(NodeData{id, label});
}

const NodeData& GraphData::addNode(const NodeData& data) {
    nodes_.push_back(data);
    return nodes_.back();
}

const EdgeData& GraphData::addEdge(const std::string& id, EdgeEndpoint source,
                                   EdgeEndpoint target) {
    return addEdge(EdgeData{id, std::move(source), std::move(target)});
}

const EdgeData& GraphData::addEdge(const std::string& id, EdgeEndpoint source,
                                   EdgeEndpoint target, const std::string& label) {
    return addEdge(EdgeData{id, std::move(source), std::move(target), label});
}

const EdgeData& GraphData::addEdge(const EdgeData& data) {
    edges_.push_back(data);
    return edges_.back();
}

void GraphData::clear() {
    nodes_.clear();
    edges_.clear();
}

}  // namespace strata
