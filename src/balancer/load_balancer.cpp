/**
 * @file load_balancer.cpp
 * @brief Реализация балансировщика нагрузки
 */

#include "load_balancer.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <numeric>
#include <random>
#include <shared_mutex>
#include <unordered_map>

namespace loadmesh::balancer {

namespace {

constexpr std::string_view COMPONENT = "LoadBalancer";

using Counter = std::atomic<uint64_t>;

} // namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct LoadBalancer::Impl {
    // Конфигурация
    mutable std::mutex config_mutex;
    BalancerConfig config;

    // Таблица весов и последние снимки отслеживаемых узлов.
    // Порядок блокировок: weights_mutex, затем connections_mutex.
    mutable std::mutex weights_mutex;
    WeightMapPtr weights = std::make_shared<const WeightMap>();
    std::unordered_map<std::string, Node> tracked_nodes;

    // Счётчики соединений
    mutable std::shared_mutex connections_mutex;
    std::unordered_map<std::string, std::unique_ptr<Counter>> connections;

    // Генератор для взвешенной выборки
    std::mutex rng_mutex;
    std::mt19937_64 rng;

    // Курсор round-robin
    std::atomic<std::size_t> round_robin_cursor{0};

    explicit Impl(const BalancerConfig& cfg) : config(cfg) {
        seed(cfg.random_seed);
    }

    void seed(uint64_t value) {
        std::lock_guard<std::mutex> lock(rng_mutex);
        if (value != 0) {
            rng.seed(value);
        } else {
            std::random_device rd;
            rng.seed((static_cast<uint64_t>(rd()) << 32) | rd());
        }
    }

    BalancerConfig current_config() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config;
    }

    uint64_t read_connections(const std::string& node_id) const {
        std::shared_lock lock(connections_mutex);
        auto it = connections.find(node_id);
        return it != connections.end() ? it->second->load() : 0;
    }

    /// @brief Увеличить счётчик узла, создавая его при первом обращении
    uint64_t acquire(const std::string& node_id) {
        {
            std::shared_lock lock(connections_mutex);
            auto it = connections.find(node_id);
            if (it != connections.end()) {
                return it->second->fetch_add(1) + 1;
            }
        }

        std::unique_lock lock(connections_mutex);
        auto [it, inserted] = connections.try_emplace(node_id, nullptr);
        if (inserted) {
            it->second = std::make_unique<Counter>(0);
        }
        return it->second->fetch_add(1) + 1;
    }

    double draw(double upper) {
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::uniform_real_distribution<double> dist(0.0, upper);
        return dist(rng);
    }

    /**
     * @brief Взвешенная выборка среди допущенных узлов
     */
    const Node& select(const std::vector<const Node*>& eligible, const BalancerConfig& cfg) {
        struct Weighted {
            const Node* node;
            double weight;
        };

        std::vector<Weighted> weighted;
        weighted.reserve(eligible.size());

        double total = 0.0;
        for (const auto* node : eligible) {
            double w = compute_weight(*node, read_connections(node->id), cfg);
            weighted.push_back({node, w});
            total += w;
        }

        if (total <= 0.0) {
            // Вырожденные веса: round-robin гарантирует продвижение
            auto index = round_robin_cursor.fetch_add(1) % eligible.size();
            return *eligible[index];
        }

        std::stable_sort(weighted.begin(), weighted.end(),
            [](const Weighted& a, const Weighted& b) { return a.weight > b.weight; });

        double remainder = draw(total);
        for (const auto& entry : weighted) {
            remainder -= entry.weight;
            if (remainder <= 0.0) {
                return *entry.node;
            }
        }

        // Остаток от погрешности округления
        return *weighted.front().node;
    }
};

// =============================================================================
// LoadBalancer публичный интерфейс
// =============================================================================

LoadBalancer::LoadBalancer(const BalancerConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

LoadBalancer::~LoadBalancer() = default;

Result<Node> LoadBalancer::distribute(
    const RequestContext& request,
    const std::vector<Node>& candidates
) {
    if (candidates.empty()) {
        return Err<Node>(ErrorCode::NoAvailableNodes, "Нет узлов-кандидатов для распределения");
    }

    const auto cfg = impl_->current_config();

    std::vector<const Node*> eligible;
    eligible.reserve(candidates.size());
    for (const auto& node : candidates) {
        if (node.status == NodeStatus::Active && node.health_score > cfg.eligibility_threshold) {
            eligible.push_back(&node);
        }
    }

    if (eligible.empty()) {
        return Err<Node>(ErrorCode::NoAvailableNodes, "Нет здоровых узлов для распределения");
    }

    const Node& selected = impl_->select(eligible, cfg);
    auto count = impl_->acquire(selected.id);

    log::debug(COMPONENT) << "запрос " << request.request_id << " -> " << selected.id
                          << " (соединений: " << count << ")";
    return selected;
}

void LoadBalancer::complete(const std::string& node_id) {
    std::shared_lock lock(impl_->connections_mutex);

    auto it = impl_->connections.find(node_id);
    if (it == impl_->connections.end()) {
        return;
    }

    auto& counter = *it->second;
    uint64_t current = counter.load();
    while (current > 0 && !counter.compare_exchange_weak(current, current - 1)) {
        // Повтор
    }
}

void LoadBalancer::update_weights(const std::vector<Node>& nodes) {
    const auto cfg = impl_->current_config();

    auto fresh = std::make_shared<WeightMap>();
    std::unordered_map<std::string, Node> fresh_nodes;
    for (const auto& node : nodes) {
        (*fresh)[node.id] = compute_weight(node, impl_->read_connections(node.id), cfg);
        fresh_nodes[node.id] = node;
    }

    std::lock_guard<std::mutex> weights_lock(impl_->weights_mutex);
    std::unique_lock connections_lock(impl_->connections_mutex);

    for (auto it = impl_->connections.begin(); it != impl_->connections.end();) {
        if (!fresh->contains(it->first)) {
            log::debug(COMPONENT) << "узел " << it->first << " удалён из учёта";
            it = impl_->connections.erase(it);
        } else {
            ++it;
        }
    }

    impl_->weights = std::move(fresh);
    impl_->tracked_nodes = std::move(fresh_nodes);
}

double LoadBalancer::weight_of(const std::string& node_id) const {
    auto table = weights();
    auto it = table->find(node_id);
    return it != table->end() ? it->second : 0.0;
}

WeightMapPtr LoadBalancer::weights() const {
    std::lock_guard<std::mutex> lock(impl_->weights_mutex);
    return impl_->weights;
}

FailoverResult LoadBalancer::handle_failure(const std::string& failed_node_id) {
    FailoverResult result;

    std::lock_guard<std::mutex> weights_lock(impl_->weights_mutex);
    std::unique_lock connections_lock(impl_->connections_mutex);

    uint64_t failed_connections = 0;
    if (auto it = impl_->connections.find(failed_node_id); it != impl_->connections.end()) {
        failed_connections = it->second->load();
        impl_->connections.erase(it);
    }

    auto remaining_weights = std::make_shared<WeightMap>(*impl_->weights);
    remaining_weights->erase(failed_node_id);
    impl_->tracked_nodes.erase(failed_node_id);

    std::vector<std::string> remaining;
    remaining.reserve(remaining_weights->size());
    for (const auto& [id, weight] : *remaining_weights) {
        remaining.push_back(id);
    }
    std::sort(remaining.begin(), remaining.end());

    impl_->weights = std::move(remaining_weights);

    if (remaining.empty()) {
        result.error = Error{
            ErrorCode::FailoverExhausted,
            "Не осталось узлов для failover"
        };
        log::warn(COMPONENT) << "failover узла " << failed_node_id
                             << " невозможен: узлов не осталось ("
                             << failed_connections << " соединений потеряно)";
        return result;
    }

    const uint64_t count = remaining.size();
    const uint64_t per_node = (failed_connections + count - 1) / count;

    double latency_sum = 0.0;
    std::size_t latency_count = 0;

    for (const auto& id : remaining) {
        auto [it, inserted] = impl_->connections.try_emplace(id, nullptr);
        if (inserted) {
            it->second = std::make_unique<Counter>(0);
        }
        uint64_t updated = it->second->fetch_add(per_node) + per_node;

        result.redistributed_count += per_node;
        result.load_distribution[id] = updated;

        if (auto node = impl_->tracked_nodes.find(id); node != impl_->tracked_nodes.end()) {
            latency_sum += node->second.resources.network_latency_ms;
            ++latency_count;
        }
    }

    result.success = true;
    result.active_nodes = std::move(remaining);
    result.average_latency_ms = latency_count > 0
        ? latency_sum / static_cast<double>(latency_count)
        : 0.0;

    log::info(COMPONENT) << "failover узла " << failed_node_id << ": "
                         << failed_connections << " соединений, по " << per_node
                         << " на " << count << " узлов";
    return result;
}

std::map<std::string, double> LoadBalancer::load_distribution() const {
    std::shared_lock lock(impl_->connections_mutex);

    std::map<std::string, uint64_t> snapshot;
    uint64_t total = 0;
    for (const auto& [id, counter] : impl_->connections) {
        auto value = counter->load();
        snapshot[id] = value;
        total += value;
    }

    std::map<std::string, double> distribution;
    if (total == 0) {
        return distribution;
    }

    for (const auto& [id, value] : snapshot) {
        distribution[id] = static_cast<double>(value) / static_cast<double>(total) * 100.0;
    }
    return distribution;
}

uint64_t LoadBalancer::connections(const std::string& node_id) const {
    return impl_->read_connections(node_id);
}

void LoadBalancer::reset_connections() {
    std::unique_lock lock(impl_->connections_mutex);
    impl_->connections.clear();
}

BalancerStats LoadBalancer::statistics() const {
    std::vector<uint64_t> counts;
    {
        std::shared_lock lock(impl_->connections_mutex);
        counts.reserve(impl_->connections.size());
        for (const auto& [id, counter] : impl_->connections) {
            counts.push_back(counter->load());
        }
    }

    BalancerStats stats;
    stats.node_count = counts.size();
    stats.total_connections = std::accumulate(counts.begin(), counts.end(), uint64_t{0});

    if (stats.node_count == 0) {
        return stats;
    }

    stats.average_connections_per_node =
        static_cast<double>(stats.total_connections) / static_cast<double>(stats.node_count);

    double variance = 0.0;
    for (auto value : counts) {
        double diff = static_cast<double>(value) - stats.average_connections_per_node;
        variance += diff * diff;
    }
    stats.load_stddev = std::sqrt(variance / static_cast<double>(stats.node_count));
    return stats;
}

BalancerConfig LoadBalancer::config() const {
    return impl_->current_config();
}

void LoadBalancer::set_config(const BalancerConfig& config) {
    {
        std::lock_guard<std::mutex> lock(impl_->config_mutex);
        impl_->config = config;
    }
    impl_->seed(config.random_seed);
}

} // namespace loadmesh::balancer
