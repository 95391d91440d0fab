/**
 * @file weight_model.cpp
 * @brief Реализация весовой модели
 */

#include "weight_model.hpp"

#include <algorithm>
#include <cmath>

namespace loadmesh::balancer {

namespace {

/// @brief Ограничить значение диапазоном [0, 1], NaN считается нулём
double clamp01(double value) noexcept {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

WeightFactors compute_factors(
    const Node& node,
    uint64_t connections,
    const BalancerConfig& config
) noexcept {
    WeightFactors f;
    f.health = clamp01(node.health_score / 100.0);
    f.cpu_headroom = clamp01(1.0 - node.resources.cpu_usage_pct / 100.0);
    f.memory_headroom = clamp01(1.0 - node.resources.memory_usage_pct / 100.0);

    if (config.max_latency_ms > 0.0) {
        f.network_headroom = clamp01(1.0 - node.resources.network_latency_ms / config.max_latency_ms);
    }
    if (config.max_connections > 0) {
        f.load_headroom = clamp01(
            1.0 - static_cast<double>(connections) / static_cast<double>(config.max_connections)
        );
    }
    return f;
}

double compute_weight(
    const Node& node,
    uint64_t connections,
    const BalancerConfig& config
) noexcept {
    const auto f = compute_factors(node, connections, config);
    const auto& k = config.weights;

    double weight =
        f.health * k.health +
        f.cpu_headroom * k.cpu +
        f.memory_headroom * k.memory +
        f.network_headroom * k.network +
        f.load_headroom * k.load;

    return std::max(0.0, weight);
}

} // namespace loadmesh::balancer
