/**
 * @file node_registry.hpp
 * @brief Реестр известных узлов
 *
 * Владеет текущим набором узлов. Внешние источники инвентаря
 * добавляют и удаляют узлы, цикл проверки здоровья обновляет
 * статус, оценку и ресурсы.
 */

#pragma once

#include "node.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace loadmesh::balancer {

/**
 * @brief Потокобезопасный реестр узлов
 */
class NodeRegistry {
public:
    NodeRegistry() = default;

    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    /**
     * @brief Добавить узел или заменить существующий
     */
    void upsert(Node node);

    /**
     * @brief Удалить узел
     *
     * @return true если узел был в реестре
     */
    bool remove(const std::string& node_id);

    /**
     * @brief Обновить состояние узла по результату проверки здоровья
     *
     * @return false если узел уже удалён из реестра
     */
    bool apply_health(
        const std::string& node_id,
        NodeStatus status,
        double health_score,
        const ResourceSnapshot& resources
    );

    [[nodiscard]] std::optional<Node> get(const std::string& node_id) const;

    /**
     * @brief Снимок всех узлов (упорядочен по id)
     */
    [[nodiscard]] std::vector<Node> snapshot() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Node> nodes_;
};

} // namespace loadmesh::balancer
