/**
 * @file monitoring_config.hpp
 * @brief Конфигурация мониторинга здоровья, производительности и алертов
 */

#pragma once

#include "../core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace loadmesh::monitoring {

// =============================================================================
// Health Monitor
// =============================================================================

/**
 * @brief Пороги алертов по результатам проверки здоровья
 */
struct AlertThresholds {
    /// @brief Время ответа узла (мс)
    double latency_ms = constants::DEFAULT_ALERT_LATENCY_MS;

    /// @brief Доля ошибок узла (0-1)
    double error_rate = constants::DEFAULT_ALERT_ERROR_RATE;

    /// @brief Загрузка CPU (%)
    double cpu_pct = constants::DEFAULT_ALERT_CPU_PCT;

    /// @brief Использование памяти (%)
    double memory_pct = constants::DEFAULT_ALERT_MEMORY_PCT;
};

/**
 * @brief Конфигурация цикла проверки здоровья
 */
struct HealthMonitorConfig {
    /// @brief Интервал между циклами (мс)
    uint32_t check_interval_ms = constants::DEFAULT_CHECK_INTERVAL_MS;

    /// @brief Дедлайн одной проверки узла, включая повторы (мс)
    uint32_t timeout_ms = constants::DEFAULT_PROBE_TIMEOUT_MS;

    /// @brief Число попыток при ошибке проверки
    uint32_t retry_attempts = constants::DEFAULT_RETRY_ATTEMPTS;

    /// @brief Глубина истории проверок на узел
    std::size_t history_size = constants::DEFAULT_HEALTH_HISTORY_SIZE;

    /// @brief Сколько последних проверок учитывается в health score
    std::size_t score_window = constants::DEFAULT_SCORE_WINDOW;

    /// @brief Health score, ниже или равный которому узел считается отказавшим
    double unhealthy_threshold = constants::DEFAULT_ELIGIBILITY_THRESHOLD;

    /// @brief Публиковать алерты
    bool alerting_enabled = true;

    AlertThresholds alert_thresholds;
};

// =============================================================================
// Alert Manager
// =============================================================================

struct AlertingConfig {
    /// @brief Максимальное количество хранимых алертов
    std::size_t max_alerts = constants::DEFAULT_ALERT_HISTORY_SIZE;

    /// @brief URL для отправки алертов (пусто = отключено)
    std::string webhook_url;

    /// @brief Таймаут webhook запроса (мс)
    uint32_t webhook_timeout_ms = constants::DEFAULT_PROBE_TIMEOUT_MS;
};

// =============================================================================
// Performance Monitor
// =============================================================================

/**
 * @brief Пороги производительности
 */
struct PerformanceThresholds {
    double p50_ms = constants::DEFAULT_P50_MS;
    double p95_ms = constants::DEFAULT_P95_MS;
    double p99_ms = constants::DEFAULT_P99_MS;
    double min_requests_per_second = constants::DEFAULT_MIN_RPS;
    double min_bytes_per_second = constants::DEFAULT_MIN_BYTES_PER_SECOND;
    double max_error_rate = constants::DEFAULT_MAX_ERROR_RATE;
    double min_availability = constants::DEFAULT_MIN_AVAILABILITY;
};

/**
 * @brief Конфигурация сбора метрик производительности
 */
struct PerformanceConfig {
    /// @brief Включить периодический сбор
    bool enabled = true;

    /// @brief Интервал периодического сбора (мс)
    uint32_t interval_ms = constants::DEFAULT_PERF_INTERVAL_MS;

    /// @brief Окно агрегации collect() (мс)
    uint32_t window_ms = constants::DEFAULT_PERF_WINDOW_MS;

    /// @brief Ширина интервала исторической агрегации (мс)
    uint32_t bucket_ms = constants::DEFAULT_PERF_BUCKET_MS;

    /// @brief Время хранения записей (мс)
    uint64_t retention_period_ms = constants::DEFAULT_RETENTION_PERIOD_MS;

    /// @brief Публиковать алерты о нарушении порогов
    bool alerting_enabled = true;

    PerformanceThresholds thresholds;
};

} // namespace loadmesh::monitoring
