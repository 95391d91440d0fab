/**
 * @file http_client.cpp
 * @brief Реализация HTTP запросов через libcurl
 */

#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <sstream>

namespace loadmesh::monitoring {

namespace {

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

/**
 * @brief Callback для записи ответа
 */
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

Result<HttpResponse> perform(CURL* curl, const std::string& url, uint32_t timeout_ms) {
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::ostringstream msg;
        msg << "CURL ошибка (" << url << "): " << curl_easy_strerror(res);
        return Err<HttpResponse>(ErrorCode::HttpRequestFailed, msg.str());
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    double total_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);
    response.elapsed_ms = total_time * 1000.0;

    return response;
}

CurlHandle make_handle() {
    ensure_curl_initialized();
    return CurlHandle(curl_easy_init());
}

} // namespace

Result<HttpResponse> http_get(const std::string& url, uint32_t timeout_ms) {
    auto curl = make_handle();
    if (!curl) {
        return Err<HttpResponse>(ErrorCode::HttpRequestFailed, "CURL не инициализирован");
    }

    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform(curl.get(), url, timeout_ms);
}

Result<HttpResponse> http_post_json(
    const std::string& url,
    const std::string& body,
    uint32_t timeout_ms
) {
    auto curl = make_handle();
    if (!curl) {
        return Err<HttpResponse>(ErrorCode::HttpRequestFailed, "CURL не инициализирован");
    }

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    return perform(curl.get(), url, timeout_ms);
}

} // namespace loadmesh::monitoring
