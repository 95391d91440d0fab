/**
 * @file config.hpp
 * @brief Конфигурация LoadMesh
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (loadmesh.toml):
 * @code
 * [balancer]
 * eligibility_threshold = 50.0
 * random_seed = 0
 *
 * [balancer.weights]
 * health = 0.30
 * cpu = 0.25
 *
 * [monitoring]
 * check_interval_ms = 30000
 * timeout_ms = 5000
 * retry_attempts = 3
 *
 * [monitoring.alert_thresholds]
 * latency = 2000.0
 * cpu = 80.0
 *
 * [performance]
 * interval_ms = 5000
 *
 * [logging]
 * level = "info"
 *
 * [[nodes]]
 * id = "node-a"
 * endpoint = "http://10.0.0.1:8080"
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "../balancer/balancer_config.hpp"
#include "../balancer/node.hpp"
#include "../monitoring/monitoring_config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadmesh {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень: error, warn, info, debug
    std::string level = "info";

    /// @brief Цветной вывод
    bool color = true;

    /// @brief Интервал строки статуса демона (мс, 0 = отключено)
    uint32_t status_interval_ms = 10000;
};

/**
 * @brief Узел из статического инвентаря
 */
struct NodeConfig {
    std::string id;
    std::string endpoint;
};

/**
 * @brief Полная конфигурация LoadMesh
 */
struct Config {
    balancer::BalancerConfig balancer;
    monitoring::HealthMonitorConfig health;
    monitoring::AlertingConfig alerting;
    monitoring::PerformanceConfig performance;
    LoggingConfig logging;
    std::vector<NodeConfig> nodes;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./loadmesh.toml
     * 3. /etc/loadmesh/loadmesh.toml
     * 4. ~/.config/loadmesh/loadmesh.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Диапазоны порогов (проценты, доли, задержки)
     * - Ненулевые интервалы, таймауты и размеры истории
     * - Неотрицательные весовые коэффициенты
     * - Уникальные непустые id узлов
     * - Уровень логирования
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace loadmesh
