/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>

namespace loadmesh {

namespace {

/**
 * @brief Прочитать неотрицательное целое
 *
 * @return false если значение отрицательное
 */
template<typename T>
bool read_unsigned(const toml::table& section, std::string_view key, T& target) {
    if (auto val = section[key].value<int64_t>()) {
        if (*val < 0) {
            return false;
        }
        target = static_cast<T>(*val);
    }
    return true;
}

void read_double(const toml::table& section, std::string_view key, double& target) {
    if (auto val = section[key].value<double>()) {
        target = *val;
    }
}

Result<Config> negative_value(std::string_view section, std::string_view key) {
    std::ostringstream msg;
    msg << section << "." << key << " не может быть отрицательным";
    return Err<Config>(ErrorCode::ConfigInvalidValue, msg.str());
}

bool is_percent(double value) {
    return !std::isnan(value) && value >= 0.0 && value <= 100.0;
}

bool is_fraction(double value) {
    return !std::isnan(value) && value >= 0.0 && value <= 1.0;
}

Result<void> invalid(std::string message) {
    return Err<void>(ErrorCode::ConfigInvalidValue, std::move(message));
}

// =============================================================================
// Разбор таблицы
// =============================================================================

Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [balancer] ===
    if (auto balancer = table["balancer"].as_table()) {
        read_double(*balancer, "eligibility_threshold", config.balancer.eligibility_threshold);
        read_double(*balancer, "max_latency_ms", config.balancer.max_latency_ms);

        if (!read_unsigned(*balancer, "random_seed", config.balancer.random_seed)) {
            return negative_value("balancer", "random_seed");
        }
        if (!read_unsigned(*balancer, "max_connections", config.balancer.max_connections)) {
            return negative_value("balancer", "max_connections");
        }

        if (auto weights = (*balancer)["weights"].as_table()) {
            auto& w = config.balancer.weights;
            read_double(*weights, "health", w.health);
            read_double(*weights, "cpu", w.cpu);
            read_double(*weights, "memory", w.memory);
            read_double(*weights, "network", w.network);
            read_double(*weights, "load", w.load);
        }
    }

    // === Секция [monitoring] ===
    if (auto monitoring = table["monitoring"].as_table()) {
        auto& h = config.health;

        if (!read_unsigned(*monitoring, "check_interval_ms", h.check_interval_ms)) {
            return negative_value("monitoring", "check_interval_ms");
        }
        if (!read_unsigned(*monitoring, "timeout_ms", h.timeout_ms)) {
            return negative_value("monitoring", "timeout_ms");
        }
        if (!read_unsigned(*monitoring, "retry_attempts", h.retry_attempts)) {
            return negative_value("monitoring", "retry_attempts");
        }
        if (!read_unsigned(*monitoring, "history_size", h.history_size)) {
            return negative_value("monitoring", "history_size");
        }
        if (!read_unsigned(*monitoring, "score_window", h.score_window)) {
            return negative_value("monitoring", "score_window");
        }
        if (!read_unsigned(*monitoring, "alert_history_size", config.alerting.max_alerts)) {
            return negative_value("monitoring", "alert_history_size");
        }
        if (!read_unsigned(*monitoring, "retention_period_ms", config.performance.retention_period_ms)) {
            return negative_value("monitoring", "retention_period_ms");
        }
        if (!read_unsigned(*monitoring, "webhook_timeout_ms", config.alerting.webhook_timeout_ms)) {
            return negative_value("monitoring", "webhook_timeout_ms");
        }

        if (auto val = (*monitoring)["alerting_enabled"].value<bool>()) {
            h.alerting_enabled = *val;
            config.performance.alerting_enabled = *val;
        }
        if (auto val = (*monitoring)["webhook_url"].value<std::string>()) {
            config.alerting.webhook_url = *val;
        }

        if (auto thresholds = (*monitoring)["alert_thresholds"].as_table()) {
            auto& t = h.alert_thresholds;
            read_double(*thresholds, "latency", t.latency_ms);
            read_double(*thresholds, "error_rate", t.error_rate);
            read_double(*thresholds, "cpu", t.cpu_pct);
            read_double(*thresholds, "memory", t.memory_pct);
        }
    }

    // Порог отказа узла совпадает с порогом допуска балансировщика
    config.health.unhealthy_threshold = config.balancer.eligibility_threshold;

    // === Секция [performance] ===
    if (auto performance = table["performance"].as_table()) {
        auto& p = config.performance;

        if (auto val = (*performance)["enabled"].value<bool>()) {
            p.enabled = *val;
        }
        if (!read_unsigned(*performance, "interval_ms", p.interval_ms)) {
            return negative_value("performance", "interval_ms");
        }
        if (!read_unsigned(*performance, "window_ms", p.window_ms)) {
            return negative_value("performance", "window_ms");
        }
        if (!read_unsigned(*performance, "bucket_ms", p.bucket_ms)) {
            return negative_value("performance", "bucket_ms");
        }

        if (auto thresholds = (*performance)["thresholds"].as_table()) {
            auto& t = p.thresholds;
            read_double(*thresholds, "p50", t.p50_ms);
            read_double(*thresholds, "p95", t.p95_ms);
            read_double(*thresholds, "p99", t.p99_ms);
            read_double(*thresholds, "min_requests_per_second", t.min_requests_per_second);
            read_double(*thresholds, "min_bytes_per_second", t.min_bytes_per_second);
            read_double(*thresholds, "max_error_rate", t.max_error_rate);
            read_double(*thresholds, "min_availability", t.min_availability);
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
        if (!read_unsigned(*logging, "status_interval_ms", config.logging.status_interval_ms)) {
            return negative_value("logging", "status_interval_ms");
        }
    }

    // === Массив [[nodes]] ===
    if (auto nodes = table["nodes"].as_array()) {
        for (const auto& entry : *nodes) {
            auto node = entry.as_table();
            if (!node) {
                return Err<Config>(ErrorCode::ConfigParseError, "Элемент [[nodes]] должен быть таблицей");
            }

            NodeConfig nc;
            if (auto val = (*node)["id"].value<std::string>()) {
                nc.id = *val;
            }
            if (auto val = (*node)["endpoint"].value<std::string>()) {
                nc.endpoint = *val;
            }
            config.nodes.push_back(std::move(nc));
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            "Файл конфигурации не найден: " + path.string()
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << "Ошибка парсинга TOML (" << path.string() << "): " << e.description();
        return Err<Config>(ErrorCode::ConfigParseError, msg.str());
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << "Ошибка парсинга TOML: " << e.description();
        return Err<Config>(ErrorCode::ConfigParseError, msg.str());
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Список путей для поиска
    std::vector<std::filesystem::path> search_paths;

    if (path.has_value()) {
        search_paths.push_back(path.value());
    }

    // Стандартные пути
    search_paths.push_back("loadmesh.toml");
    search_paths.push_back("/etc/loadmesh/loadmesh.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "loadmesh" / "loadmesh.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Балансировщик
    if (!is_percent(balancer.eligibility_threshold)) {
        return invalid("balancer.eligibility_threshold должен быть в диапазоне 0-100");
    }
    if (balancer.max_connections == 0) {
        return invalid("balancer.max_connections не может быть 0");
    }
    if (std::isnan(balancer.max_latency_ms) || balancer.max_latency_ms <= 0.0) {
        return invalid("balancer.max_latency_ms должен быть положительным");
    }

    const auto& w = balancer.weights;
    for (double k : {w.health, w.cpu, w.memory, w.network, w.load}) {
        if (std::isnan(k) || k < 0.0) {
            return invalid("Весовые коэффициенты balancer.weights не могут быть отрицательными");
        }
    }

    // Проверка здоровья
    if (health.check_interval_ms == 0) {
        return invalid("monitoring.check_interval_ms не может быть 0");
    }
    if (health.timeout_ms == 0) {
        return invalid("monitoring.timeout_ms не может быть 0");
    }
    if (health.timeout_ms >= health.check_interval_ms) {
        return invalid("monitoring.timeout_ms должен быть меньше check_interval_ms");
    }
    if (health.history_size == 0 || health.score_window == 0) {
        return invalid("monitoring.history_size и score_window не могут быть 0");
    }
    if (alerting.max_alerts == 0) {
        return invalid("monitoring.alert_history_size не может быть 0");
    }

    const auto& at = health.alert_thresholds;
    if (std::isnan(at.latency_ms) || at.latency_ms < 0.0) {
        return invalid("monitoring.alert_thresholds.latency не может быть отрицательным");
    }
    if (!is_fraction(at.error_rate)) {
        return invalid("monitoring.alert_thresholds.error_rate должен быть в диапазоне 0-1");
    }
    if (!is_percent(at.cpu_pct) || !is_percent(at.memory_pct)) {
        return invalid("monitoring.alert_thresholds.cpu и memory должны быть в диапазоне 0-100");
    }

    // Производительность
    if (performance.interval_ms == 0 || performance.window_ms == 0 || performance.bucket_ms == 0) {
        return invalid("performance.interval_ms, window_ms и bucket_ms не могут быть 0");
    }
    if (performance.retention_period_ms == 0) {
        return invalid("monitoring.retention_period_ms не может быть 0");
    }

    const auto& pt = performance.thresholds;
    for (double latency : {pt.p50_ms, pt.p95_ms, pt.p99_ms}) {
        if (std::isnan(latency) || latency < 0.0) {
            return invalid("Пороги performance.thresholds p50/p95/p99 не могут быть отрицательными");
        }
    }
    if (pt.min_requests_per_second < 0.0 || pt.min_bytes_per_second < 0.0) {
        return invalid("Пороги пропускной способности не могут быть отрицательными");
    }
    if (!is_fraction(pt.max_error_rate) || !is_fraction(pt.min_availability)) {
        return invalid("max_error_rate и min_availability должны быть в диапазоне 0-1");
    }

    // Логирование
    if (!log::parse_level(logging.level)) {
        return invalid("Неизвестный уровень логирования: " + logging.level);
    }

    // Узлы
    std::set<std::string> ids;
    for (const auto& node : nodes) {
        if (node.id.empty()) {
            return invalid("У узла в [[nodes]] не указан id");
        }
        if (!ids.insert(node.id).second) {
            return invalid("Повторяющийся id узла: " + node.id);
        }
    }

    return {};
}

} // namespace loadmesh
