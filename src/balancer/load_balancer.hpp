/**
 * @file load_balancer.hpp
 * @brief Распределение запросов между узлами
 *
 * Выбор узла:
 * - Фильтр: статус active и health score выше порога
 * - Взвешенная случайная выборка по весовой модели
 * - Round-robin, если суммарный вес равен нулю
 *
 * Failover: соединения отказавшего узла равномерно (с округлением вверх)
 * добавляются оставшимся узлам.
 */

#pragma once

#include "../core/types.hpp"
#include "balancer_config.hpp"
#include "node.hpp"
#include "weight_model.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loadmesh::balancer {

// =============================================================================
// Типы запросов и результатов
// =============================================================================

/**
 * @brief Контекст распределяемого запроса
 */
struct RequestContext {
    std::string request_id;   ///< Идентификатор запроса (для журнала)
    std::string operation;    ///< Имя операции
};

/**
 * @brief Результат перераспределения нагрузки отказавшего узла
 */
struct FailoverResult {
    /// @brief Перераспределение выполнено
    bool success = false;

    /// @brief Сколько соединений добавлено оставшимся узлам
    uint64_t redistributed_count = 0;

    /// @brief Оставшиеся узлы
    std::vector<std::string> active_nodes;

    /// @brief Число соединений на узел после перераспределения
    std::map<std::string, uint64_t> load_distribution;

    /// @brief Средняя сетевая задержка оставшихся узлов (мс)
    double average_latency_ms = 0.0;

    /// @brief Причина неудачи (FailoverExhausted)
    std::optional<Error> error;
};

/**
 * @brief Статистика распределения соединений
 */
struct BalancerStats {
    uint64_t total_connections = 0;
    std::size_t node_count = 0;
    double average_connections_per_node = 0.0;
    double load_stddev = 0.0;   ///< Стандартное отклонение числа соединений
};

// =============================================================================
// Load Balancer
// =============================================================================

/**
 * @brief Балансировщик нагрузки
 *
 * Все методы потокобезопасны. Счётчики соединений атомарны,
 * таблица весов подменяется целиком при пересчёте.
 */
class LoadBalancer {
public:
    explicit LoadBalancer(const BalancerConfig& config);

    ~LoadBalancer();

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    // =========================================================================
    // Выбор узла
    // =========================================================================

    /**
     * @brief Выбрать узел для запроса
     *
     * Увеличивает счётчик соединений выбранного узла. Вызывающий код
     * должен сообщить о завершении через complete().
     *
     * @param request Контекст запроса
     * @param candidates Узлы-кандидаты
     * @return Выбранный узел или ErrorCode::NoAvailableNodes
     */
    [[nodiscard]] Result<Node> distribute(
        const RequestContext& request,
        const std::vector<Node>& candidates
    );

    /**
     * @brief Сообщить о завершении запроса (уменьшает счётчик, не ниже нуля)
     */
    void complete(const std::string& node_id);

    // =========================================================================
    // Весовая модель
    // =========================================================================

    /**
     * @brief Пересчитать веса для набора узлов
     *
     * Узлы, которых нет в наборе, удаляются из таблицы весов
     * и из учёта соединений.
     */
    void update_weights(const std::vector<Node>& nodes);

    /**
     * @brief Последний вычисленный вес узла (0 если узел не отслеживается)
     */
    [[nodiscard]] double weight_of(const std::string& node_id) const;

    /**
     * @brief Текущая таблица весов
     */
    [[nodiscard]] WeightMapPtr weights() const;

    // =========================================================================
    // Failover
    // =========================================================================

    /**
     * @brief Перераспределить нагрузку отказавшего узла
     *
     * Если узлов не осталось, возвращает результат с success=false.
     */
    [[nodiscard]] FailoverResult handle_failure(const std::string& failed_node_id);

    // =========================================================================
    // Состояние
    // =========================================================================

    /**
     * @brief Доля соединений по узлам в процентах
     *
     * Пустая таблица, если соединений нет.
     */
    [[nodiscard]] std::map<std::string, double> load_distribution() const;

    /**
     * @brief Текущее число соединений узла
     */
    [[nodiscard]] uint64_t connections(const std::string& node_id) const;

    /**
     * @brief Сбросить все счётчики соединений
     */
    void reset_connections();

    [[nodiscard]] BalancerStats statistics() const;

    [[nodiscard]] BalancerConfig config() const;

    /**
     * @brief Обновить конфигурацию (действует со следующего выбора)
     */
    void set_config(const BalancerConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loadmesh::balancer
