#include "strata/layout/config/LayoutResult.h"
#include "strata/layout/util/LayoutSerializer.h"

#include <algorithm>
#include <stdexcept>

namespace strata {

void LayoutResult::setNodeLayout(const NodeLayout& layout) {
    nodeLayouts_[layout.id] = layout;
}

const NodeLayout* LayoutResult::getNodeLayout(const std::string& id) const {
    auto it = nodeLayouts_.find(id);
    return it != nodeLayouts_.end() ? &it->second : nullptr;
}

bool LayoutResult::hasNodeLayout(const std::string& id) const {
    return nodeLayouts_.count(id) > 0;
}

const Point& LayoutResult::position(const std::string& id) const {
    auto it = nodeLayouts_.find(id);
    if (it == nodeLayouts_.end()) {
        throw std::out_of_range("No layout for node: " + id);
    }
    return it->second.position;
}

void LayoutResult::addEdgeLayout(EdgeLayout layout) {
    auto it = edgeIndex_.find(layout.id);
    if (it != edgeIndex_.end()) {
        edgeLayouts_[it->second] = std::move(layout);
        return;
    }
    edgeIndex_[layout.id] = edgeLayouts_.size();
    edgeLayouts_.push_back(std::move(layout));
}

const EdgeLayout* LayoutResult::getEdgeLayout(const std::string& id) const {
    auto it = edgeIndex_.find(id);
    return it != edgeIndex_.end() ? &edgeLayouts_[it->second] : nullptr;
}

bool LayoutResult::hasEdgeLayout(const std::string& id) const {
    return edgeIndex_.count(id) > 0;
}

std::unordered_map<std::string, Point> LayoutResult::positions() const {
    std::unordered_map<std::string, Point> result;
    result.reserve(nodeLayouts_.size());
    for (const auto& [id, layout] : nodeLayouts_) {
        result.emplace(id, layout.position);
    }
    return result;
}

std::vector<std::string> LayoutResult::nodesInLevel(int level) const {
    std::vector<const NodeLayout*> inLevel;
    for (const auto& [id, layout] : nodeLayouts_) {
        if (layout.level == level) {
            inLevel.push_back(&layout);
        }
    }
    std::sort(inLevel.begin(), inLevel.end(),
              [](const NodeLayout* a, const NodeLayout* b) { return a->order < b->order; });

    std::vector<std::string> ids;
    ids.reserve(inLevel.size());
    for (const NodeLayout* layout : inLevel) {
        ids.push_back(layout->id);
    }
    return ids;
}

void LayoutResult::clear() {
    nodeLayouts_.clear();
    edgeLayouts_.clear();
    edgeIndex_.clear();
    bounds_ = LayoutBounds{};
    stats_ = LayoutStats{};
    levelCount_ = 0;
}

std::string LayoutResult::toJson() const {
    return LayoutSerializer::toJson(*this);
}

LayoutResult LayoutResult::fromJson(const std::string& json) {
    return LayoutSerializer::layoutResultFromJson(json);
}

}  // namespace strata
