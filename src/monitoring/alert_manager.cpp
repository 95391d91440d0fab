/**
 * @file alert_manager.cpp
 * @brief Реализация менеджера алертов
 */

#include "alert_manager.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <iterator>
#include <mutex>

namespace loadmesh::monitoring {

namespace {

constexpr std::string_view COMPONENT = "AlertManager";

log::Level level_for(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Critical: return log::Level::Error;
        case AlertSeverity::Error:    return log::Level::Warn;
        case AlertSeverity::Warning:  return log::Level::Info;
    }
    return log::Level::Info;
}

} // namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct AlertManager::Impl {
    AlertingConfig config;
    ClockFn clock;

    mutable std::mutex alerts_mutex;
    std::deque<Alert> alerts;
    uint64_t next_alert_id = 1;

    std::mutex callbacks_mutex;
    std::vector<AlertCallback> callbacks;

    Impl(const AlertingConfig& cfg, ClockFn clk)
        : config(cfg), clock(std::move(clk)) {}

    void trim() {
        while (alerts.size() > config.max_alerts) {
            alerts.pop_front();
        }
    }

    template<typename Pred>
    std::vector<Alert> select(Pred pred) const {
        std::lock_guard<std::mutex> lock(alerts_mutex);

        std::vector<Alert> result;
        std::copy_if(alerts.begin(), alerts.end(), std::back_inserter(result), pred);
        return result;
    }
};

// =============================================================================
// AlertManager публичный интерфейс
// =============================================================================

AlertManager::AlertManager(const AlertingConfig& config, ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(clock)))
{
}

AlertManager::~AlertManager() = default;

uint64_t AlertManager::publish(Alert alert) {
    {
        std::lock_guard<std::mutex> lock(impl_->alerts_mutex);

        alert.id = impl_->next_alert_id++;
        if (alert.timestamp == TimePoint{}) {
            alert.timestamp = impl_->clock();
        }

        impl_->alerts.push_back(alert);
        impl_->trim();
    }

    log::Line(level_for(alert.severity), COMPONENT)
        << "[" << to_string(alert.category) << "/" << to_string(alert.severity) << "] "
        << (alert.node_id.empty() ? "" : alert.node_id + ": ") << alert.message;

    std::vector<AlertCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
        callbacks = impl_->callbacks;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(alert);
        } catch (const std::exception& e) {
            log::error(COMPONENT) << "ошибка обработчика алерта #" << alert.id << ": " << e.what();
        } catch (...) {
            log::error(COMPONENT) << "ошибка обработчика алерта #" << alert.id << ": unknown error";
        }
    }

    return alert.id;
}

void AlertManager::on_alert(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->callbacks.push_back(std::move(callback));
}

std::vector<Alert> AlertManager::recent_alerts(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->alerts_mutex);

    auto count = std::min(limit, impl_->alerts.size());
    return std::vector<Alert>(
        impl_->alerts.end() - static_cast<std::ptrdiff_t>(count),
        impl_->alerts.end()
    );
}

std::vector<Alert> AlertManager::alerts_by_category(AlertCategory category) const {
    return impl_->select([category](const Alert& a) { return a.category == category; });
}

std::vector<Alert> AlertManager::alerts_by_severity(AlertSeverity severity) const {
    return impl_->select([severity](const Alert& a) { return a.severity == severity; });
}

AlertManager::AlertCounts AlertManager::counts() const {
    std::lock_guard<std::mutex> lock(impl_->alerts_mutex);

    AlertCounts result;
    for (const auto& alert : impl_->alerts) {
        result.total++;

        switch (alert.severity) {
            case AlertSeverity::Warning:  result.warning++; break;
            case AlertSeverity::Error:    result.error++; break;
            case AlertSeverity::Critical: result.critical++; break;
        }
    }
    return result;
}

void AlertManager::clear() {
    std::lock_guard<std::mutex> lock(impl_->alerts_mutex);
    impl_->alerts.clear();
}

std::size_t AlertManager::cleanup_old(std::chrono::milliseconds max_age) {
    std::lock_guard<std::mutex> lock(impl_->alerts_mutex);

    auto cutoff = impl_->clock() - max_age;
    auto before = impl_->alerts.size();

    impl_->alerts.erase(
        std::remove_if(impl_->alerts.begin(), impl_->alerts.end(),
            [cutoff](const Alert& a) { return a.timestamp < cutoff; }),
        impl_->alerts.end()
    );

    return before - impl_->alerts.size();
}

void AlertManager::set_max_alerts(std::size_t max_alerts) {
    std::lock_guard<std::mutex> lock(impl_->alerts_mutex);
    impl_->config.max_alerts = max_alerts;
    impl_->trim();
}

} // namespace loadmesh::monitoring
