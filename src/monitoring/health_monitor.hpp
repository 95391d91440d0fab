/**
 * @file health_monitor.hpp
 * @brief Периодическая проверка здоровья узлов
 *
 * Цикл проверки:
 * - Параллельный опрос всех узлов с дедлайном и повторами
 * - История результатов и health score по последним проверкам
 * - Статус узла (active / degraded / failed) записывается в реестр
 * - Алерты по порогам задержки, ресурсов и доли ошибок
 * - Переход узла в failed сообщается подписчику (failover)
 */

#pragma once

#include "../core/types.hpp"
#include "../balancer/node.hpp"
#include "../balancer/node_registry.hpp"
#include "alert_manager.hpp"
#include "monitoring_config.hpp"
#include "node_probe.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadmesh::monitoring {

// =============================================================================
// Результаты проверки
// =============================================================================

/**
 * @brief Итог одной проверки
 */
enum class CheckStatus {
    Active,     ///< Узел ответил и здоров
    Error       ///< Таймаут, ошибка проверки или узел нездоров
};

[[nodiscard]] constexpr std::string_view to_string(CheckStatus status) noexcept {
    switch (status) {
        case CheckStatus::Active: return "active";
        case CheckStatus::Error:  return "error";
        default: return "unknown";
    }
}

/**
 * @brief Результат проверки здоровья узла
 */
struct HealthCheckResult {
    std::string node_id;

    CheckStatus status = CheckStatus::Error;

    /// @brief Время ответа (мс), для таймаута равно дедлайну
    double response_time_ms = 0.0;

    NodeMetrics metrics;

    std::vector<DependencyStatus> dependencies;

    /// @brief Ошибка проверки (ProbeTimeout / ProbeFailure)
    std::optional<Error> error;

    TimePoint checked_at{};
};

/**
 * @brief Сводная статистика последнего цикла
 */
struct HealthStats {
    std::size_t total_nodes = 0;
    std::size_t active_nodes = 0;
    std::size_t degraded_nodes = 0;
    std::size_t failed_nodes = 0;

    /// @brief Среднее по узлам времени ответа последних проверок (мс)
    double average_response_time_ms = 0.0;

    /// @brief Доля активных узлов (%), 0 для пустого набора
    double overall_health_score = 0.0;

    TimePoint last_update{};
};

// =============================================================================
// Callbacks
// =============================================================================

/// @brief Источник списка узлов для проверки
using NodeInventoryProvider = std::function<std::vector<balancer::Node>()>;

/// @brief Узел перешёл в состояние failed
using NodeFailedCallback = std::function<void(const std::string& node_id)>;

/// @brief Цикл проверки завершён
using CycleCallback = std::function<void(const HealthStats&)>;

// =============================================================================
// Health Monitor
// =============================================================================

class HealthMonitor {
public:
    HealthMonitor(
        const HealthMonitorConfig& config,
        std::shared_ptr<INodeProbe> probe,
        balancer::NodeRegistry& registry,
        AlertManager& alerts,
        ClockFn clock = system_clock_fn()
    );

    ~HealthMonitor();

    // Запрещаем копирование
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // =========================================================================
    // Управление
    // =========================================================================

    /**
     * @brief Запустить периодическую проверку
     *
     * Первый цикл выполняется сразу. Повторный вызов во время работы
     * только пишет предупреждение.
     *
     * @param provider Источник узлов (по умолчанию снимок реестра)
     */
    void start(NodeInventoryProvider provider = {});

    /**
     * @brief Остановить (текущий цикл завершается, ожидание прерывается)
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Выполнить один цикл проверки синхронно
     */
    HealthStats run_cycle();

    // =========================================================================
    // Подписки
    // =========================================================================

    void on_node_failed(NodeFailedCallback callback);

    void on_cycle_complete(CycleCallback callback);

    // =========================================================================
    // Состояние
    // =========================================================================

    /**
     * @brief Последние проверки узла (от старых к новым)
     */
    [[nodiscard]] std::vector<HealthCheckResult> health_history(
        const std::string& node_id,
        std::size_t limit = 20
    ) const;

    /**
     * @brief Статистика последнего цикла
     */
    [[nodiscard]] HealthStats current_stats() const;

    [[nodiscard]] HealthMonitorConfig config() const;

    /**
     * @brief Обновить конфигурацию (действует со следующего цикла)
     */
    void update_config(const HealthMonitorConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadmesh::monitoring
