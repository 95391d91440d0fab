/**
 * @file balancer_config.hpp
 * @brief Конфигурация балансировщика и весовой модели
 */

#pragma once

#include "../core/constants.hpp"

#include <cstdint>

namespace loadmesh::balancer {

/**
 * @brief Коэффициенты весовой модели
 *
 * Сумма коэффициентов по умолчанию равна 1.0, поэтому вес узла
 * лежит в диапазоне [0, 1].
 */
struct WeightCoefficients {
    double health = constants::WEIGHT_HEALTH;
    double cpu = constants::WEIGHT_CPU;
    double memory = constants::WEIGHT_MEMORY;
    double network = constants::WEIGHT_NETWORK;
    double load = constants::WEIGHT_LOAD;
};

/**
 * @brief Конфигурация балансировщика
 */
struct BalancerConfig {
    /// @brief Узлы с health score не выше порога не выбираются
    double eligibility_threshold = constants::DEFAULT_ELIGIBILITY_THRESHOLD;

    /// @brief Seed генератора (0 = std::random_device)
    uint64_t random_seed = 0;

    /// @brief Нормировка нагрузки: при таком числе соединений запас равен нулю
    uint64_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;

    /// @brief Нормировка задержки (мс)
    double max_latency_ms = constants::DEFAULT_MAX_LATENCY_MS;

    /// @brief Коэффициенты весовой модели
    WeightCoefficients weights;
};

} // namespace loadmesh::balancer
