/**
 * @file node_probe.hpp
 * @brief Интерфейс проверки здоровья узла
 */

#pragma once

#include "../core/types.hpp"
#include "../balancer/node.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace loadmesh::monitoring {

/**
 * @brief Метрики, сообщаемые узлом при проверке
 */
struct NodeMetrics {
    double cpu_usage_pct = 0.0;
    double memory_usage_pct = 0.0;
    double network_latency_ms = 0.0;
    uint64_t request_count = 0;
    uint64_t error_count = 0;
    double uptime_s = 0.0;

    /// @brief Доля ошибок (0 если запросов не было)
    [[nodiscard]] double error_rate() const noexcept {
        return request_count > 0
            ? static_cast<double>(error_count) / static_cast<double>(request_count)
            : 0.0;
    }
};

/**
 * @brief Состояние зависимости узла
 */
struct DependencyStatus {
    std::string id;
    bool healthy = true;
};

/**
 * @brief Ответ проверки здоровья
 */
struct ProbeReport {
    /// @brief Узел сообщил, что здоров
    bool healthy = true;

    NodeMetrics metrics;

    std::vector<DependencyStatus> dependencies;
};

/**
 * @brief Проверка здоровья узла
 *
 * Реализация может блокироваться: монитор вызывает её в отдельном
 * потоке и ограничивает ожидание дедлайном. Один объект используется
 * параллельно для разных узлов.
 */
class INodeProbe {
public:
    virtual ~INodeProbe() = default;

    /**
     * @brief Проверить узел
     *
     * @return Отчёт или ErrorCode::ProbeFailure / HttpRequestFailed
     */
    virtual Result<ProbeReport> probe(const balancer::Node& node) = 0;
};

} // namespace loadmesh::monitoring
