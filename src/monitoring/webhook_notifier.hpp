/**
 * @file webhook_notifier.hpp
 * @brief Отправка алертов на webhook (JSON POST)
 */

#pragma once

#include "../core/types.hpp"
#include "alert_manager.hpp"

#include <cstdint>
#include <string>

namespace loadmesh::monitoring {

/**
 * @brief Сериализовать алерт в JSON
 */
[[nodiscard]] std::string alert_to_json(const Alert& alert);

/**
 * @brief Отправитель алертов
 *
 * Регистрируется в AlertManager через callback(). Ошибки отправки
 * логируются и не влияют на историю алертов.
 */
class WebhookNotifier {
public:
    WebhookNotifier(std::string url, uint32_t timeout_ms);

    /**
     * @brief Отправить алерт
     *
     * @return ErrorCode::HttpRequestFailed или HttpBadStatus при ошибке
     */
    Result<void> notify(const Alert& alert) const;

    /**
     * @brief Подписчик для AlertManager::on_alert
     */
    [[nodiscard]] AlertCallback callback() const;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    uint32_t timeout_ms_;
};

} // namespace loadmesh::monitoring
