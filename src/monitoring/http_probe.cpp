/**
 * @file http_probe.cpp
 * @brief Реализация HTTP проверки здоровья
 */

#include "http_probe.hpp"
#include "http_client.hpp"
#include "../core/json.hpp"

#include <limits>

namespace loadmesh::monitoring {

namespace {

/// @brief Неотрицательный счётчик; значения вне диапазона uint64_t обрезаются
uint64_t extract_counter(std::string_view body, std::string_view key) {
    double value = json::extract_number(body, key).value_or(0.0);
    if (!(value > 0.0)) {
        return 0;
    }
    // 2^64: первое значение, не представимое в uint64_t
    if (value >= 18446744073709551616.0) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(value);
}

} // namespace

HttpNodeProbe::HttpNodeProbe(uint32_t timeout_ms)
    : timeout_ms_(timeout_ms)
{
}

std::string HttpNodeProbe::health_url(std::string_view endpoint) {
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.remove_suffix(1);
    }
    return std::string(endpoint) + "/health";
}

ProbeReport HttpNodeProbe::parse_health(
    long status,
    std::string_view body,
    const balancer::ResourceSnapshot& fallback
) {
    ProbeReport report;
    report.healthy = status >= 200 && status < 300;

    if (auto healthy = json::extract_bool(body, "healthy")) {
        report.healthy = report.healthy && *healthy;
    }
    if (auto state = json::extract_raw(body, "status")) {
        if (*state == "unhealthy" || *state == "error" || *state == "down") {
            report.healthy = false;
        }
    }

    auto& m = report.metrics;
    m.cpu_usage_pct = json::extract_number(body, "cpu_usage").value_or(fallback.cpu_usage_pct);
    m.memory_usage_pct = json::extract_number(body, "memory_usage").value_or(fallback.memory_usage_pct);
    m.network_latency_ms = fallback.network_latency_ms;
    m.request_count = extract_counter(body, "request_count");
    m.error_count = extract_counter(body, "error_count");
    m.uptime_s = json::extract_number(body, "uptime").value_or(0.0);

    return report;
}

Result<ProbeReport> HttpNodeProbe::probe(const balancer::Node& node) {
    if (node.endpoint.empty()) {
        return Err<ProbeReport>(ErrorCode::ProbeFailure, "У узла " + node.id + " не задан endpoint");
    }

    auto response = http_get(health_url(node.endpoint), timeout_ms_);
    if (!response) {
        return std::unexpected(response.error());
    }

    auto report = parse_health(response->status, response->body, node.resources);
    report.metrics.network_latency_ms = response->elapsed_ms;
    return report;
}

} // namespace loadmesh::monitoring
