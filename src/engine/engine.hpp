/**
 * @file engine.hpp
 * @brief Движок распределения нагрузки
 *
 * Владеет реестром узлов, балансировщиком, менеджером алертов
 * и мониторами. Связывает их в цикл обратной связи:
 * - Цикл проверки здоровья обновляет реестр и пересчитывает веса
 * - Переход узла в failed запускает failover
 * - Завершение запроса записывает задержку или ошибку в метрики
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../balancer/load_balancer.hpp"
#include "../balancer/node_registry.hpp"
#include "../monitoring/alert_manager.hpp"
#include "../monitoring/health_monitor.hpp"
#include "../monitoring/node_probe.hpp"
#include "../monitoring/performance_monitor.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace loadmesh {

/**
 * @brief Итог обработанного запроса
 */
struct RequestOutcome {
    std::string node_id;
    std::string operation;
    double latency_ms = 0.0;
    bool success = true;
    uint64_t bytes = 0;

    /// @brief Сообщение об ошибке (если success = false)
    std::string error_message;
};

class Engine {
public:
    /**
     * @brief Создать движок
     *
     * Проверяет конфигурацию и регистрирует узлы из [[nodes]].
     *
     * @param config Конфигурация
     * @param probe Проверка здоровья узлов
     * @param clock Источник времени для метрик и алертов
     * @return Движок или ошибка валидации конфигурации
     */
    [[nodiscard]] static Result<std::unique_ptr<Engine>> create(
        const Config& config,
        std::shared_ptr<monitoring::INodeProbe> probe,
        ClockFn clock = system_clock_fn()
    );

    ~Engine();

    // Запрещаем копирование
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // =========================================================================
    // Узлы
    // =========================================================================

    /**
     * @brief Добавить или заменить узел и пересчитать веса
     */
    void register_node(const balancer::Node& node);

    /**
     * @brief Удалить узел из реестра и из учёта балансировщика
     */
    bool remove_node(const std::string& node_id);

    // =========================================================================
    // Запросы
    // =========================================================================

    /**
     * @brief Выбрать узел для запроса среди узлов реестра
     */
    [[nodiscard]] Result<balancer::Node> distribute(const balancer::RequestContext& request);

    /**
     * @brief Сообщить об итоге запроса
     *
     * Освобождает соединение и записывает задержку, объём
     * или ошибку в метрики производительности.
     */
    void complete(const RequestOutcome& outcome);

    /**
     * @brief Пересчитать веса по текущему реестру (без отказавших узлов)
     */
    void refresh_weights();

    // =========================================================================
    // Управление
    // =========================================================================

    /**
     * @brief Запустить мониторинг здоровья и производительности
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    // =========================================================================
    // Компоненты
    // =========================================================================

    [[nodiscard]] balancer::NodeRegistry& registry() noexcept;
    [[nodiscard]] balancer::LoadBalancer& balancer() noexcept;
    [[nodiscard]] monitoring::AlertManager& alerts() noexcept;
    [[nodiscard]] monitoring::HealthMonitor& health() noexcept;
    [[nodiscard]] monitoring::PerformanceMonitor& performance() noexcept;

    [[nodiscard]] const Config& config() const noexcept;

private:
    Engine(const Config& config, std::shared_ptr<monitoring::INodeProbe> probe, ClockFn clock);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadmesh
