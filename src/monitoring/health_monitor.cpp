/**
 * @file health_monitor.cpp
 * @brief Реализация мониторинга здоровья узлов
 */

#include "health_monitor.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace loadmesh::monitoring {

namespace {

constexpr std::string_view COMPONENT = "HealthMonitor";

using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Итог опроса узла в отдельном потоке
 */
struct ProbeOutcome {
    Result<ProbeReport> report;
    double response_time_ms = 0.0;
};

Result<ProbeReport> invoke_probe(INodeProbe& probe, const balancer::Node& node) {
    try {
        return probe.probe(node);
    } catch (const std::exception& e) {
        return Err<ProbeReport>(ErrorCode::ProbeFailure, e.what());
    }
}

/**
 * @brief Запустить опрос узла с повторами до дедлайна
 *
 * Поток не ссылается на монитор: результат после дедлайна
 * просто отбрасывается.
 */
std::future<ProbeOutcome> launch_probe(
    std::shared_ptr<INodeProbe> probe,
    balancer::Node node,
    uint32_t attempts,
    SteadyClock::time_point deadline
) {
    auto promise = std::make_shared<std::promise<ProbeOutcome>>();
    auto future = promise->get_future();

    std::thread([probe = std::move(probe), node = std::move(node), attempts, deadline, promise] {
        auto started = SteadyClock::now();

        auto report = invoke_probe(*probe, node);
        for (uint32_t attempt = 1; attempt < attempts && !report; ++attempt) {
            if (SteadyClock::now() >= deadline) {
                break;
            }
            log::debug(COMPONENT) << node.id << ": повтор проверки (" << attempt + 1
                                  << "/" << attempts << ")";
            report = invoke_probe(*probe, node);
        }

        std::chrono::duration<double, std::milli> elapsed = SteadyClock::now() - started;
        promise->set_value(ProbeOutcome{std::move(report), elapsed.count()});
    }).detach();

    return future;
}

Alert make_alert(
    AlertCategory category,
    AlertSeverity severity,
    const std::string& node_id,
    double threshold,
    double observed,
    std::string message
) {
    Alert alert;
    alert.category = category;
    alert.severity = severity;
    alert.node_id = node_id;
    alert.threshold = threshold;
    alert.observed_value = observed;
    alert.message = std::move(message);
    return alert;
}

} // namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct HealthMonitor::Impl {
    mutable std::mutex config_mutex;
    HealthMonitorConfig config;

    std::shared_ptr<INodeProbe> probe;
    balancer::NodeRegistry& registry;
    AlertManager& alerts;
    ClockFn clock;

    // Состояние узлов
    mutable std::mutex state_mutex;
    std::unordered_map<std::string, std::deque<HealthCheckResult>> history;
    std::unordered_map<std::string, balancer::NodeStatus> last_status;
    HealthStats stats;

    // Подписчики
    std::mutex callbacks_mutex;
    std::vector<NodeFailedCallback> failed_callbacks;
    std::vector<CycleCallback> cycle_callbacks;

    // Один цикл за раз (фоновый и ручной)
    std::mutex cycle_mutex;
    NodeInventoryProvider provider;

    // Незавершённые опросы: не больше одного на узел
    std::unordered_map<std::string, std::future<ProbeOutcome>> in_flight;

    // Worker thread
    std::thread worker_thread;
    std::atomic<bool> running{false};
    std::condition_variable cv;
    std::mutex cv_mutex;

    Impl(
        const HealthMonitorConfig& cfg,
        std::shared_ptr<INodeProbe> p,
        balancer::NodeRegistry& reg,
        AlertManager& am,
        ClockFn clk
    )
        : config(cfg)
        , probe(std::move(p))
        , registry(reg)
        , alerts(am)
        , clock(std::move(clk))
    {
    }

    HealthMonitorConfig current_config() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config;
    }

    void start(NodeInventoryProvider inventory) {
        if (running.exchange(true)) {
            log::warn(COMPONENT) << "мониторинг уже запущен";
            return;
        }

        {
            std::lock_guard<std::mutex> lock(cycle_mutex);
            provider = std::move(inventory);
        }

        worker_thread = std::thread([this] {
            worker_loop();
        });

        log::info(COMPONENT) << "мониторинг запущен, интервал "
                             << current_config().check_interval_ms << " мс";
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(cv_mutex);
        }
        cv.notify_all();

        if (worker_thread.joinable()) {
            worker_thread.join();
        }

        log::info(COMPONENT) << "мониторинг остановлен";
    }

    void worker_loop() {
        while (running) {
            run_cycle();

            std::unique_lock<std::mutex> lock(cv_mutex);
            cv.wait_for(lock, std::chrono::milliseconds(current_config().check_interval_ms), [this] {
                return !running.load();
            });
        }
    }

    HealthCheckResult timed_out(
        const balancer::Node& node,
        const HealthMonitorConfig& cfg,
        std::vector<Alert>& pending
    ) {
        HealthCheckResult result;
        result.node_id = node.id;
        result.checked_at = clock();
        result.status = CheckStatus::Error;
        result.response_time_ms = cfg.timeout_ms;
        result.error = Error{ErrorCode::ProbeTimeout};

        std::ostringstream msg;
        msg << "Проверка здоровья не завершилась за " << cfg.timeout_ms << " мс";
        pending.push_back(make_alert(AlertCategory::Availability, AlertSeverity::Critical,
            node.id, cfg.timeout_ms, cfg.timeout_ms, msg.str()));
        return result;
    }

    /**
     * @brief Сформировать результат проверки и алерты по её итогу
     */
    HealthCheckResult evaluate(
        const balancer::Node& node,
        std::future<ProbeOutcome>& future,
        SteadyClock::time_point deadline,
        const HealthMonitorConfig& cfg,
        std::vector<Alert>& pending
    ) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            return timed_out(node, cfg, pending);
        }

        HealthCheckResult result;
        result.node_id = node.id;
        result.checked_at = clock();

        auto outcome = future.get();
        result.response_time_ms = outcome.response_time_ms;

        if (!outcome.report) {
            result.status = CheckStatus::Error;
            result.error = outcome.report.error();

            pending.push_back(make_alert(AlertCategory::Availability, AlertSeverity::Critical,
                node.id, 0.0, 0.0, "Проверка здоровья завершилась ошибкой: " + outcome.report.error().message));
            return result;
        }

        const auto& report = *outcome.report;
        result.status = report.healthy ? CheckStatus::Active : CheckStatus::Error;
        result.metrics = report.metrics;
        result.dependencies = report.dependencies;

        const auto& t = cfg.alert_thresholds;

        if (result.response_time_ms > t.latency_ms) {
            std::ostringstream msg;
            msg << "Высокое время ответа: " << result.response_time_ms << " мс";
            pending.push_back(make_alert(AlertCategory::Latency, AlertSeverity::Warning,
                node.id, t.latency_ms, result.response_time_ms, msg.str()));
        }

        if (report.metrics.cpu_usage_pct > t.cpu_pct) {
            std::ostringstream msg;
            msg << "Высокая загрузка CPU: " << report.metrics.cpu_usage_pct << "%";
            pending.push_back(make_alert(AlertCategory::Resource, AlertSeverity::Error,
                node.id, t.cpu_pct, report.metrics.cpu_usage_pct, msg.str()));
        }

        if (report.metrics.memory_usage_pct > t.memory_pct) {
            std::ostringstream msg;
            msg << "Высокое использование памяти: " << report.metrics.memory_usage_pct << "%";
            pending.push_back(make_alert(AlertCategory::Resource, AlertSeverity::Error,
                node.id, t.memory_pct, report.metrics.memory_usage_pct, msg.str()));
        }

        double error_rate = report.metrics.error_rate();
        if (error_rate > t.error_rate) {
            std::ostringstream msg;
            msg << "Высокая доля ошибок: " << error_rate * 100.0 << "%";
            pending.push_back(make_alert(AlertCategory::ErrorRate, AlertSeverity::Error,
                node.id, t.error_rate, error_rate, msg.str()));
        }

        if (!report.healthy) {
            pending.push_back(make_alert(AlertCategory::Availability, AlertSeverity::Critical,
                node.id, 0.0, 0.0, "Узел сообщил о нездоровом состоянии"));
        }

        return result;
    }

    HealthStats run_cycle() {
        std::lock_guard<std::mutex> cycle_lock(cycle_mutex);

        const auto cfg = current_config();
        const auto nodes = provider ? provider() : registry.snapshot();

        // Все узлы опрашиваются параллельно с общим дедлайном.
        // Пока предыдущий опрос узла не завершился, новый не запускается.
        auto deadline = SteadyClock::now() + std::chrono::milliseconds(cfg.timeout_ms);
        std::vector<std::future<ProbeOutcome>*> futures;
        futures.reserve(nodes.size());
        for (const auto& node : nodes) {
            auto& slot = in_flight[node.id];
            if (slot.valid() && slot.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                log::debug(COMPONENT) << node.id << ": предыдущая проверка ещё выполняется";
                futures.push_back(nullptr);
                continue;
            }
            slot = launch_probe(probe, node, std::max<uint32_t>(cfg.retry_attempts, 1), deadline);
            futures.push_back(&slot);
        }

        std::vector<Alert> pending;
        std::vector<HealthCheckResult> results;
        results.reserve(nodes.size());
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            results.push_back(futures[i]
                ? evaluate(nodes[i], *futures[i], deadline, cfg, pending)
                : timed_out(nodes[i], cfg, pending));
        }

        std::vector<std::string> newly_failed;
        HealthStats cycle_stats;
        {
            std::lock_guard<std::mutex> lock(state_mutex);

            std::unordered_set<std::string> seen;
            double response_sum = 0.0;
            std::size_t response_count = 0;

            for (std::size_t i = 0; i < nodes.size(); ++i) {
                const auto& node = nodes[i];
                const auto& result = results[i];
                seen.insert(node.id);

                auto& entries = history[node.id];
                entries.push_back(result);
                while (entries.size() > std::max<std::size_t>(cfg.history_size, 1)) {
                    entries.pop_front();
                }

                // Health score по последним проверкам
                auto window = std::min(entries.size(), std::max<std::size_t>(cfg.score_window, 1));
                auto successes = std::count_if(entries.end() - static_cast<std::ptrdiff_t>(window), entries.end(),
                    [](const HealthCheckResult& r) { return r.status == CheckStatus::Active; });
                double score = 100.0 * static_cast<double>(successes) / static_cast<double>(window);

                balancer::NodeStatus status;
                if (result.status == CheckStatus::Active && score > cfg.unhealthy_threshold) {
                    status = balancer::NodeStatus::Active;
                } else if (score <= cfg.unhealthy_threshold) {
                    status = balancer::NodeStatus::Failed;
                } else {
                    status = balancer::NodeStatus::Degraded;
                }

                auto resources = node.resources;
                if (!result.error) {
                    resources.cpu_usage_pct = result.metrics.cpu_usage_pct;
                    resources.memory_usage_pct = result.metrics.memory_usage_pct;
                    resources.network_latency_ms = result.metrics.network_latency_ms;
                }
                registry.apply_health(node.id, status, score, resources);

                auto previous = last_status.find(node.id);
                auto before = previous != last_status.end() ? previous->second : node.status;
                if (status == balancer::NodeStatus::Failed && before != balancer::NodeStatus::Failed) {
                    newly_failed.push_back(node.id);
                }
                last_status[node.id] = status;

                switch (status) {
                    case balancer::NodeStatus::Active:   cycle_stats.active_nodes++; break;
                    case balancer::NodeStatus::Degraded: cycle_stats.degraded_nodes++; break;
                    case balancer::NodeStatus::Failed:   cycle_stats.failed_nodes++; break;
                }

                auto recent = std::min(entries.size(), constants::RESPONSE_TIME_WINDOW);
                double node_sum = 0.0;
                for (auto it = entries.end() - static_cast<std::ptrdiff_t>(recent); it != entries.end(); ++it) {
                    node_sum += it->response_time_ms;
                }
                response_sum += node_sum / static_cast<double>(recent);
                response_count++;
            }

            // Узлы, исчезнувшие из инвентаря
            std::erase_if(in_flight, [&seen](const auto& entry) { return !seen.contains(entry.first); });
            std::erase_if(history, [&seen](const auto& entry) { return !seen.contains(entry.first); });
            std::erase_if(last_status, [&seen](const auto& entry) { return !seen.contains(entry.first); });

            cycle_stats.total_nodes = nodes.size();
            cycle_stats.average_response_time_ms = response_count > 0
                ? response_sum / static_cast<double>(response_count)
                : 0.0;
            cycle_stats.overall_health_score = cycle_stats.total_nodes > 0
                ? static_cast<double>(cycle_stats.active_nodes) / static_cast<double>(cycle_stats.total_nodes) * 100.0
                : 0.0;
            cycle_stats.last_update = clock();
            stats = cycle_stats;
        }

        if (cfg.alerting_enabled) {
            for (auto& alert : pending) {
                alerts.publish(std::move(alert));
            }
        }

        std::vector<NodeFailedCallback> on_failed;
        std::vector<CycleCallback> on_cycle;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex);
            on_failed = failed_callbacks;
            on_cycle = cycle_callbacks;
        }

        for (const auto& node_id : newly_failed) {
            log::warn(COMPONENT) << "узел " << node_id << " помечен как failed";
            for (const auto& callback : on_failed) {
                callback(node_id);
            }
        }

        log::info(COMPONENT) << "цикл проверки завершён: узлов " << cycle_stats.total_nodes
                             << ", общий health score " << cycle_stats.overall_health_score << "%";

        for (const auto& callback : on_cycle) {
            callback(cycle_stats);
        }

        return cycle_stats;
    }
};

// =============================================================================
// HealthMonitor публичный интерфейс
// =============================================================================

HealthMonitor::HealthMonitor(
    const HealthMonitorConfig& config,
    std::shared_ptr<INodeProbe> probe,
    balancer::NodeRegistry& registry,
    AlertManager& alerts,
    ClockFn clock
)
    : impl_(std::make_unique<Impl>(config, std::move(probe), registry, alerts, std::move(clock)))
{
}

HealthMonitor::~HealthMonitor() {
    impl_->stop();
}

void HealthMonitor::start(NodeInventoryProvider provider) {
    impl_->start(std::move(provider));
}

void HealthMonitor::stop() {
    impl_->stop();
}

bool HealthMonitor::is_running() const noexcept {
    return impl_->running;
}

HealthStats HealthMonitor::run_cycle() {
    return impl_->run_cycle();
}

void HealthMonitor::on_node_failed(NodeFailedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->failed_callbacks.push_back(std::move(callback));
}

void HealthMonitor::on_cycle_complete(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex);
    impl_->cycle_callbacks.push_back(std::move(callback));
}

std::vector<HealthCheckResult> HealthMonitor::health_history(
    const std::string& node_id,
    std::size_t limit
) const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);

    auto it = impl_->history.find(node_id);
    if (it == impl_->history.end()) {
        return {};
    }

    const auto& entries = it->second;
    auto count = std::min(limit, entries.size());
    return std::vector<HealthCheckResult>(
        entries.end() - static_cast<std::ptrdiff_t>(count),
        entries.end()
    );
}

HealthStats HealthMonitor::current_stats() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->stats;
}

HealthMonitorConfig HealthMonitor::config() const {
    return impl_->current_config();
}

void HealthMonitor::update_config(const HealthMonitorConfig& config) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    impl_->config = config;
}

} // namespace loadmesh::monitoring
