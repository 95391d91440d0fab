/**
 * @file weight_model.hpp
 * @brief Весовая модель узлов
 *
 * Вес узла объединяет пять нормированных факторов:
 * - здоровье (health_score / 100)
 * - запас CPU (1 - cpu / 100)
 * - запас памяти (1 - memory / 100)
 * - запас сети (1 - latency / max_latency_ms)
 * - запас по нагрузке (1 - connections / max_connections)
 *
 * Каждый фактор ограничен диапазоном [0, 1], итоговый вес не меньше нуля.
 */

#pragma once

#include "balancer_config.hpp"
#include "node.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace loadmesh::balancer {

/**
 * @brief Нормированные факторы веса (для объяснения выбора)
 */
struct WeightFactors {
    double health = 0.0;
    double cpu_headroom = 0.0;
    double memory_headroom = 0.0;
    double network_headroom = 0.0;
    double load_headroom = 0.0;
};

/**
 * @brief Вычислить нормированные факторы узла
 *
 * @param node Снимок узла
 * @param connections Текущее число активных соединений
 * @param config Конфигурация нормировки
 */
[[nodiscard]] WeightFactors compute_factors(
    const Node& node,
    uint64_t connections,
    const BalancerConfig& config
) noexcept;

/**
 * @brief Вычислить вес узла
 *
 * Чистая функция от снимка узла и числа соединений.
 */
[[nodiscard]] double compute_weight(
    const Node& node,
    uint64_t connections,
    const BalancerConfig& config
) noexcept;

/**
 * @brief Неизменяемая таблица весов
 *
 * При пересчёте создаётся новая таблица и подменяется целиком,
 * читатели никогда не видят частично обновлённый набор.
 */
using WeightMap = std::unordered_map<std::string, double>;
using WeightMapPtr = std::shared_ptr<const WeightMap>;

} // namespace loadmesh::balancer
