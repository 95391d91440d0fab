/**
 * @file node_registry.cpp
 * @brief Реализация реестра узлов
 */

#include "node_registry.hpp"

#include <algorithm>

namespace loadmesh::balancer {

void NodeRegistry::upsert(Node node) {
    node.health_score = std::clamp(node.health_score, 0.0, 100.0);

    std::unique_lock lock(mutex_);
    auto id = node.id;
    nodes_.insert_or_assign(std::move(id), std::move(node));
}

bool NodeRegistry::remove(const std::string& node_id) {
    std::unique_lock lock(mutex_);
    return nodes_.erase(node_id) > 0;
}

bool NodeRegistry::apply_health(
    const std::string& node_id,
    NodeStatus status,
    double health_score,
    const ResourceSnapshot& resources
) {
    std::unique_lock lock(mutex_);

    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }

    it->second.status = status;
    it->second.health_score = std::clamp(health_score, 0.0, 100.0);
    it->second.resources = resources;
    return true;
}

std::optional<Node> NodeRegistry::get(const std::string& node_id) const {
    std::shared_lock lock(mutex_);

    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Node> NodeRegistry::snapshot() const {
    std::shared_lock lock(mutex_);

    std::vector<Node> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }
    return result;
}

std::size_t NodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

} // namespace loadmesh::balancer
