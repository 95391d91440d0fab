/**
 * @file performance_monitor.hpp
 * @brief Сбор метрик производительности операций
 *
 * Записи задержки, пропускной способности и ошибок агрегируются
 * по скользящему окну:
 * - Перцентили p50 / p95 / p99 (nearest rank)
 * - Запросы и байты в секунду
 * - Доля ошибок и доступность
 *
 * Нарушения порогов превращаются в алерты.
 */

#pragma once

#include "../core/types.hpp"
#include "alert_manager.hpp"
#include "monitoring_config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loadmesh::monitoring {

// =============================================================================
// Записи
// =============================================================================

struct LatencyRecord {
    std::string operation;
    double latency_ms = 0.0;
    TimePoint timestamp{};
};

struct ThroughputRecord {
    std::string operation;
    uint64_t request_count = 0;
    uint64_t bytes = 0;
    double duration_ms = 0.0;
    TimePoint timestamp{};
};

struct ErrorRecord {
    std::string operation;
    std::string message;
    TimePoint timestamp{};
};

// =============================================================================
// Агрегированные метрики
// =============================================================================

struct LatencyPercentiles {
    double p50 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

struct ThroughputMetrics {
    double requests_per_second = 0.0;
    double bytes_per_second = 0.0;
};

/**
 * @brief Метрики за интервал
 */
struct PerformanceMetrics {
    LatencyPercentiles latency;
    ThroughputMetrics throughput;

    /// @brief errors / (latency samples + errors), 0 без данных
    double error_rate = 0.0;

    /// @brief latency samples / (latency samples + errors), 1.0 без данных
    double availability = 1.0;

    /// @brief Число записей задержки в интервале
    std::size_t latency_samples = 0;

    /// @brief Число ошибок в интервале
    std::size_t error_count = 0;

    /// @brief Начало интервала (для истории) или момент сбора
    TimePoint timestamp{};
};

/**
 * @brief Результат проверки метрик по порогам
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> violations;

    /// @brief Алерты (ещё не опубликованы, id = 0)
    std::vector<Alert> alerts;
};

/**
 * @brief Результат сбора с проверкой порогов
 */
struct CollectionReport {
    PerformanceMetrics metrics;
    std::vector<Alert> alerts;
    TimePoint timestamp{};
    double collection_duration_ms = 0.0;
};

// =============================================================================
// Функции агрегации
// =============================================================================

/**
 * @brief Перцентиль методом nearest rank: sorted[ceil(p/100 * n) - 1]
 *
 * @param values Выборка (порядок не важен)
 * @param percentile Перцентиль (0-100)
 * @return Значение перцентиля или 0 для пустой выборки
 */
[[nodiscard]] double nearest_rank_percentile(std::vector<double> values, double percentile);

/**
 * @brief Проверить метрики по порогам
 *
 * Чистая функция: алерты не публикуются.
 */
[[nodiscard]] ValidationResult validate_performance(
    const PerformanceMetrics& metrics,
    const PerformanceThresholds& thresholds
);

// =============================================================================
// Performance Monitor
// =============================================================================

class PerformanceMonitor {
public:
    PerformanceMonitor(
        const PerformanceConfig& config,
        AlertManager& alerts,
        ClockFn clock = system_clock_fn()
    );

    ~PerformanceMonitor();

    // Запрещаем копирование
    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    // =========================================================================
    // Запись наблюдений
    // =========================================================================

    void record_latency(const std::string& operation, double latency_ms);

    void record_throughput(
        const std::string& operation,
        uint64_t request_count,
        uint64_t bytes,
        double duration_ms
    );

    void record_error(const std::string& operation, const std::string& message);

    // =========================================================================
    // Агрегация
    // =========================================================================

    /**
     * @brief Метрики всех операций за окно window_ms
     */
    [[nodiscard]] PerformanceMetrics collect() const;

    /**
     * @brief Метрики одной операции за окно window_ms
     */
    [[nodiscard]] PerformanceMetrics collect_for(const std::string& operation) const;

    /**
     * @brief Собрать метрики и проверить пороги
     *
     * Если алерты включены, нарушения публикуются в AlertManager.
     */
    CollectionReport collect_with_alerting();

    /**
     * @brief Метрики по интервалам, выровненным по эпохе
     *
     * Один элемент на каждый интервал от интервала start
     * до интервала end включительно.
     *
     * @param bucket Ширина интервала (по умолчанию bucket_ms)
     */
    [[nodiscard]] std::vector<PerformanceMetrics> historical(
        TimePoint start,
        TimePoint end,
        std::optional<std::chrono::milliseconds> bucket = std::nullopt
    ) const;

    /**
     * @brief Удалить записи старше retention_period_ms
     *
     * @return Количество удалённых записей
     */
    std::size_t cleanup_old_records();

    // =========================================================================
    // Периодический сбор
    // =========================================================================

    /**
     * @brief Запустить периодический сбор (если enabled)
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    [[nodiscard]] PerformanceConfig config() const;

    void update_config(const PerformanceConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadmesh::monitoring
