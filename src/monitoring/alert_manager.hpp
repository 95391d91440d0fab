/**
 * @file alert_manager.hpp
 * @brief Управление алертами мониторинга
 *
 * Категории алертов:
 * - Latency: время ответа или перцентили задержки
 * - Throughput: запросы или байты в секунду
 * - ErrorRate: доля ошибок
 * - Availability: недоступность узла или сервиса
 * - Resource: CPU и память узла
 *
 * Уровни: Warning, Error, Critical.
 */

#pragma once

#include "../core/types.hpp"
#include "monitoring_config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace loadmesh::monitoring {

// =============================================================================
// Категории и уровни
// =============================================================================

/**
 * @brief Категория алерта
 */
enum class AlertCategory {
    Latency,
    Throughput,
    ErrorRate,
    Availability,
    Resource
};

[[nodiscard]] constexpr std::string_view to_string(AlertCategory category) noexcept {
    switch (category) {
        case AlertCategory::Latency:      return "latency";
        case AlertCategory::Throughput:   return "throughput";
        case AlertCategory::ErrorRate:    return "error_rate";
        case AlertCategory::Availability: return "availability";
        case AlertCategory::Resource:     return "resource";
        default: return "unknown";
    }
}

/**
 * @brief Уровень алерта
 */
enum class AlertSeverity {
    Warning,    ///< Требует внимания
    Error,      ///< Деградация
    Critical    ///< Отказ
};

[[nodiscard]] constexpr std::string_view to_string(AlertSeverity severity) noexcept {
    switch (severity) {
        case AlertSeverity::Warning:  return "warning";
        case AlertSeverity::Error:    return "error";
        case AlertSeverity::Critical: return "critical";
        default: return "unknown";
    }
}

// =============================================================================
// Структура алерта
// =============================================================================

struct Alert {
    /// @brief ID, назначается при публикации (0 = не опубликован)
    uint64_t id = 0;

    AlertCategory category = AlertCategory::Availability;

    AlertSeverity severity = AlertSeverity::Warning;

    /// @brief Узел (пусто для алертов производительности)
    std::string node_id;

    /// @brief Нарушенный порог
    double threshold = 0.0;

    /// @brief Наблюдаемое значение
    double observed_value = 0.0;

    std::string message;

    TimePoint timestamp{};
};

// =============================================================================
// Alert Manager
// =============================================================================

/**
 * @brief Callback для обработки алертов
 */
using AlertCallback = std::function<void(const Alert&)>;

/**
 * @brief Менеджер алертов
 *
 * Хранит ограниченную историю (старые вытесняются первыми)
 * и синхронно оповещает подписчиков.
 */
class AlertManager {
public:
    explicit AlertManager(const AlertingConfig& config, ClockFn clock = system_clock_fn());

    ~AlertManager();

    // Запрещаем копирование
    AlertManager(const AlertManager&) = delete;
    AlertManager& operator=(const AlertManager&) = delete;

    // =========================================================================
    // Публикация
    // =========================================================================

    /**
     * @brief Опубликовать алерт
     *
     * Назначает ID (и время, если не задано), сохраняет в истории,
     * пишет в лог и вызывает подписчиков. Исключение подписчика
     * логируется и не прерывает доставку остальным.
     *
     * @return ID алерта
     */
    uint64_t publish(Alert alert);

    /**
     * @brief Подписаться на новые алерты
     */
    void on_alert(AlertCallback callback);

    // =========================================================================
    // Получение алертов
    // =========================================================================

    /**
     * @brief Последние алерты (от старых к новым)
     */
    [[nodiscard]] std::vector<Alert> recent_alerts(std::size_t limit = 50) const;

    [[nodiscard]] std::vector<Alert> alerts_by_category(AlertCategory category) const;

    [[nodiscard]] std::vector<Alert> alerts_by_severity(AlertSeverity severity) const;

    /**
     * @brief Количество алертов в истории по уровням
     */
    struct AlertCounts {
        std::size_t warning = 0;
        std::size_t error = 0;
        std::size_t critical = 0;
        std::size_t total = 0;
    };

    [[nodiscard]] AlertCounts counts() const;

    // =========================================================================
    // Очистка
    // =========================================================================

    void clear();

    /**
     * @brief Удалить алерты старше указанного возраста
     *
     * @return Количество удалённых алертов
     */
    std::size_t cleanup_old(std::chrono::milliseconds max_age);

    /**
     * @brief Изменить размер истории (лишние старые алерты вытесняются)
     */
    void set_max_alerts(std::size_t max_alerts);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadmesh::monitoring
