/**
 * @file http_probe.hpp
 * @brief Проверка здоровья узла по HTTP
 *
 * GET <endpoint>/health:
 * - 2xx: узел здоров (если тело не сообщает обратное)
 * - другой статус: узел нездоров
 * - ошибка соединения или таймаут: ошибка проверки
 *
 * Из JSON тела читаются необязательные поля healthy, status,
 * cpu_usage, memory_usage, request_count, error_count, uptime.
 */

#pragma once

#include "node_probe.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace loadmesh::monitoring {

class HttpNodeProbe : public INodeProbe {
public:
    /**
     * @param timeout_ms Таймаут одного HTTP запроса
     */
    explicit HttpNodeProbe(uint32_t timeout_ms);

    Result<ProbeReport> probe(const balancer::Node& node) override;

    /**
     * @brief Разобрать ответ /health
     *
     * @param status HTTP статус
     * @param body Тело ответа
     * @param fallback Ресурсы узла, если тело их не содержит
     */
    [[nodiscard]] static ProbeReport parse_health(
        long status,
        std::string_view body,
        const balancer::ResourceSnapshot& fallback
    );

    /**
     * @brief URL проверки для endpoint узла
     */
    [[nodiscard]] static std::string health_url(std::string_view endpoint);

private:
    uint32_t timeout_ms_;
};

} // namespace loadmesh::monitoring
