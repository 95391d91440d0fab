/**
 * @file node.hpp
 * @brief Узел (backend) и его снимок ресурсов
 */

#pragma once

#include <string>
#include <string_view>

namespace loadmesh::balancer {

// =============================================================================
// Статус узла
// =============================================================================

/**
 * @brief Статус узла
 */
enum class NodeStatus {
    Active,     ///< Узел принимает запросы
    Degraded,   ///< Узел отвечает, но не проходит порог здоровья
    Failed      ///< Узел недоступен, нагрузка перераспределена
};

/**
 * @brief Преобразовать статус в строку
 */
[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Active:   return "active";
        case NodeStatus::Degraded: return "degraded";
        case NodeStatus::Failed:   return "failed";
        default: return "unknown";
    }
}

// =============================================================================
// Узел
// =============================================================================

/**
 * @brief Снимок ресурсов узла
 */
struct ResourceSnapshot {
    double cpu_usage_pct = 0.0;        ///< Загрузка CPU (0-100)
    double memory_usage_pct = 0.0;     ///< Использование памяти (0-100)
    double network_latency_ms = 0.0;   ///< Сетевая задержка (мс)
};

/**
 * @brief Узел, на который распределяются запросы
 */
struct Node {
    /// @brief Уникальный идентификатор
    std::string id;

    /// @brief Адрес для HTTP проверки (например, "http://10.0.0.1:8080")
    std::string endpoint;

    /// @brief Текущий статус
    NodeStatus status = NodeStatus::Active;

    /// @brief Оценка здоровья (0-100)
    double health_score = 100.0;

    /// @brief Последний известный снимок ресурсов
    ResourceSnapshot resources;
};

} // namespace loadmesh::balancer
