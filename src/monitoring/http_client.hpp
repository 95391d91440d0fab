/**
 * @file http_client.hpp
 * @brief HTTP запросы через libcurl
 *
 * Каждый запрос использует собственный CURL handle, поэтому функции
 * можно вызывать из потоков проверки параллельно.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>

namespace loadmesh::monitoring {

/**
 * @brief Ответ HTTP сервера
 */
struct HttpResponse {
    long status = 0;
    std::string body;

    /// @brief Полное время запроса (мс)
    double elapsed_ms = 0.0;

    [[nodiscard]] bool ok() const noexcept {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief GET запрос
 *
 * @return Ответ с любым статусом или ErrorCode::HttpRequestFailed
 */
[[nodiscard]] Result<HttpResponse> http_get(const std::string& url, uint32_t timeout_ms);

/**
 * @brief POST запрос с JSON телом
 */
[[nodiscard]] Result<HttpResponse> http_post_json(
    const std::string& url,
    const std::string& body,
    uint32_t timeout_ms
);

} // namespace loadmesh::monitoring
