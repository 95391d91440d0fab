/**
 * @file engine.cpp
 * @brief Реализация движка распределения нагрузки
 */

#include "engine.hpp"
#include "../log/logger.hpp"
#include "../monitoring/webhook_notifier.hpp"

#include <algorithm>

namespace loadmesh {

namespace {

constexpr std::string_view COMPONENT = "Engine";

} // namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct Engine::Impl {
    Config config;

    balancer::NodeRegistry registry;
    balancer::LoadBalancer balancer;
    monitoring::AlertManager alerts;
    monitoring::PerformanceMonitor performance;
    monitoring::HealthMonitor health;

    bool running = false;

    Impl(const Config& cfg, std::shared_ptr<monitoring::INodeProbe> probe, ClockFn clock)
        : config(cfg)
        , balancer(cfg.balancer)
        , alerts(cfg.alerting, clock)
        , performance(cfg.performance, alerts, clock)
        , health(cfg.health, std::move(probe), registry, alerts, clock)
    {
    }

    /**
     * @brief Узлы, которые участвуют в распределении
     */
    std::vector<balancer::Node> routable_nodes() const {
        auto nodes = registry.snapshot();
        std::erase_if(nodes, [](const balancer::Node& n) {
            return n.status == balancer::NodeStatus::Failed;
        });
        return nodes;
    }

    void wire() {
        health.on_node_failed([this](const std::string& node_id) {
            auto result = balancer.handle_failure(node_id);
            if (!result.success) {
                log::error(COMPONENT) << "failover узла " << node_id << " не выполнен: "
                                      << (result.error ? result.error->message : "");
                return;
            }
            log::info(COMPONENT) << "нагрузка узла " << node_id << " перераспределена на "
                                 << result.active_nodes.size() << " узлов ("
                                 << result.redistributed_count << " соединений)";
        });

        health.on_cycle_complete([this](const monitoring::HealthStats&) {
            balancer.update_weights(routable_nodes());
        });

        if (!config.alerting.webhook_url.empty()) {
            monitoring::WebhookNotifier notifier(config.alerting.webhook_url, config.alerting.webhook_timeout_ms);
            alerts.on_alert(notifier.callback());
            log::info(COMPONENT) << "алерты отправляются на " << config.alerting.webhook_url;
        }
    }
};

// =============================================================================
// Engine публичный интерфейс
// =============================================================================

Result<std::unique_ptr<Engine>> Engine::create(
    const Config& config,
    std::shared_ptr<monitoring::INodeProbe> probe,
    ClockFn clock
) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (!probe) {
        return Err<std::unique_ptr<Engine>>(ErrorCode::ConfigInvalidValue, "Не задана проверка здоровья узлов");
    }

    std::unique_ptr<Engine> engine(new Engine(config, std::move(probe), std::move(clock)));

    for (const auto& node : config.nodes) {
        balancer::Node n;
        n.id = node.id;
        n.endpoint = node.endpoint;
        engine->impl_->registry.upsert(std::move(n));
    }
    engine->refresh_weights();

    log::info(COMPONENT) << "узлов в конфигурации: " << config.nodes.size();
    return engine;
}

Engine::Engine(const Config& config, std::shared_ptr<monitoring::INodeProbe> probe, ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(probe), std::move(clock)))
{
    impl_->wire();
}

Engine::~Engine() {
    stop();
}

void Engine::register_node(const balancer::Node& node) {
    impl_->registry.upsert(node);
    refresh_weights();
}

bool Engine::remove_node(const std::string& node_id) {
    if (!impl_->registry.remove(node_id)) {
        return false;
    }
    refresh_weights();
    return true;
}

Result<balancer::Node> Engine::distribute(const balancer::RequestContext& request) {
    return impl_->balancer.distribute(request, impl_->registry.snapshot());
}

void Engine::complete(const RequestOutcome& outcome) {
    impl_->balancer.complete(outcome.node_id);

    auto& perf = impl_->performance;
    if (outcome.success) {
        perf.record_latency(outcome.operation, outcome.latency_ms);
        perf.record_throughput(outcome.operation, 1, outcome.bytes, outcome.latency_ms);
    } else {
        perf.record_error(outcome.operation, outcome.error_message);
    }
}

void Engine::refresh_weights() {
    impl_->balancer.update_weights(impl_->routable_nodes());
}

void Engine::start() {
    if (impl_->running) {
        log::warn(COMPONENT) << "движок уже запущен";
        return;
    }
    impl_->running = true;

    impl_->health.start();
    impl_->performance.start();
}

void Engine::stop() {
    if (!impl_->running) {
        return;
    }
    impl_->running = false;

    impl_->health.stop();
    impl_->performance.stop();
}

bool Engine::is_running() const noexcept {
    return impl_->running;
}

balancer::NodeRegistry& Engine::registry() noexcept {
    return impl_->registry;
}

balancer::LoadBalancer& Engine::balancer() noexcept {
    return impl_->balancer;
}

monitoring::AlertManager& Engine::alerts() noexcept {
    return impl_->alerts;
}

monitoring::HealthMonitor& Engine::health() noexcept {
    return impl_->health;
}

monitoring::PerformanceMonitor& Engine::performance() noexcept {
    return impl_->performance;
}

const Config& Engine::config() const noexcept {
    return impl_->config;
}

} // namespace loadmesh
