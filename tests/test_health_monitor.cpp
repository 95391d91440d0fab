/**
 * @file test_health_monitor.cpp
 * @brief Тесты мониторинга здоровья узлов
 */

#include <gtest/gtest.h>

#include "monitoring/health_monitor.hpp"
#include "test_support.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace loadmesh::tests {

using monitoring::AlertCategory;
using monitoring::AlertSeverity;
using monitoring::CheckStatus;
using monitoring::HealthMonitor;

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.timeout_ms = 200;
        config_.check_interval_ms = 1000;
        config_.retry_attempts = 1;
        config_.score_window = 5;
        config_.unhealthy_threshold = 50.0;

        probe_ = std::make_shared<ScriptedProbe>();
        alerts_ = std::make_unique<monitoring::AlertManager>(monitoring::AlertingConfig{}, clock_.fn());
    }

    std::unique_ptr<HealthMonitor> make_monitor() {
        return std::make_unique<HealthMonitor>(config_, probe_, registry_, *alerts_, clock_.fn());
    }

    monitoring::HealthMonitorConfig config_;
    ManualClock clock_;
    std::shared_ptr<ScriptedProbe> probe_;
    balancer::NodeRegistry registry_;
    std::unique_ptr<monitoring::AlertManager> alerts_;
};

// =============================================================================
// Цикл проверки
// =============================================================================

/**
 * @brief Тест: здоровые узлы остаются active со score 100
 */
TEST_F(HealthMonitorTest, HealthyNodesStayActive) {
    registry_.upsert(make_node("a"));
    registry_.upsert(make_node("b"));

    monitoring::NodeMetrics metrics;
    metrics.cpu_usage_pct = 35.0;
    metrics.memory_usage_pct = 45.0;
    metrics.network_latency_ms = 12.0;
    probe_->healthy("a", metrics);

    auto monitor = make_monitor();
    auto stats = monitor->run_cycle();

    EXPECT_EQ(stats.total_nodes, 2u);
    EXPECT_EQ(stats.active_nodes, 2u);
    EXPECT_EQ(stats.failed_nodes, 0u);
    EXPECT_DOUBLE_EQ(stats.overall_health_score, 100.0);
    EXPECT_EQ(stats.last_update, clock_.now());

    auto a = registry_.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->status, balancer::NodeStatus::Active);
    EXPECT_DOUBLE_EQ(a->health_score, 100.0);
    EXPECT_DOUBLE_EQ(a->resources.cpu_usage_pct, 35.0);
    EXPECT_DOUBLE_EQ(a->resources.memory_usage_pct, 45.0);
    EXPECT_DOUBLE_EQ(a->resources.network_latency_ms, 12.0);

    EXPECT_EQ(alerts_->counts().total, 0u);
}

/**
 * @brief Тест: пустой набор узлов
 */
TEST_F(HealthMonitorTest, EmptyFleet) {
    auto monitor = make_monitor();
    auto stats = monitor->run_cycle();

    EXPECT_EQ(stats.total_nodes, 0u);
    EXPECT_DOUBLE_EQ(stats.overall_health_score, 0.0);
    EXPECT_DOUBLE_EQ(stats.average_response_time_ms, 0.0);
}

/**
 * @brief Тест: зависшая проверка завершается по таймауту с критическим алертом
 */
TEST_F(HealthMonitorTest, TimeoutRaisesCriticalAvailabilityAlert) {
    config_.timeout_ms = 50;
    registry_.upsert(make_node("slow"));
    probe_->hanging("slow", std::chrono::milliseconds(300));

    auto monitor = make_monitor();
    auto started = std::chrono::steady_clock::now();
    auto stats = monitor->run_cycle();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
    EXPECT_DOUBLE_EQ(stats.average_response_time_ms, 50.0);

    auto history = monitor->health_history("slow");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, CheckStatus::Error);
    ASSERT_TRUE(history[0].error.has_value());
    EXPECT_EQ(history[0].error->code, ErrorCode::ProbeTimeout);
    EXPECT_DOUBLE_EQ(history[0].response_time_ms, 50.0);

    auto alerts = alerts_->alerts_by_category(AlertCategory::Availability);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::Critical);
    EXPECT_EQ(alerts[0].node_id, "slow");
}

/**
 * @brief Тест: пока зависшая проверка не завершилась, новая для узла не запускается
 */
TEST_F(HealthMonitorTest, HangingCheckIsNotRelaunched) {
    config_.timeout_ms = 50;
    registry_.upsert(make_node("slow"));
    probe_->hanging("slow", std::chrono::milliseconds(500));

    auto monitor = make_monitor();
    auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        monitor->run_cycle();
    }
    EXPECT_EQ(probe_->calls(), 1);

    auto history = monitor->health_history("slow");
    ASSERT_EQ(history.size(), 3u);
    for (const auto& entry : history) {
        ASSERT_TRUE(entry.error.has_value());
        EXPECT_EQ(entry.error->code, ErrorCode::ProbeTimeout);
    }
    EXPECT_EQ(alerts_->alerts_by_category(AlertCategory::Availability).size(), 3u);

    // После завершения зависшей проверки узел снова опрашивается
    probe_->healthy("slow");
    std::this_thread::sleep_until(started + std::chrono::milliseconds(700));
    monitor->run_cycle();

    EXPECT_EQ(probe_->calls(), 2);
    history = monitor->health_history("slow", 1);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, CheckStatus::Active);
}

/**
 * @brief Тест: исключение проверки превращается в ProbeFailure
 */
TEST_F(HealthMonitorTest, ThrowingProbeIsReportedAsFailure) {
    registry_.upsert(make_node("a"));
    probe_->set("a", [](const balancer::Node&) -> Result<monitoring::ProbeReport> {
        throw std::runtime_error("socket closed");
    });

    auto monitor = make_monitor();
    monitor->run_cycle();

    auto history = monitor->health_history("a");
    ASSERT_EQ(history.size(), 1u);
    ASSERT_TRUE(history[0].error.has_value());
    EXPECT_EQ(history[0].error->code, ErrorCode::ProbeFailure);
    EXPECT_EQ(history[0].error->message, "socket closed");
}

/**
 * @brief Тест: ошибка проверки повторяется retry_attempts раз
 */
TEST_F(HealthMonitorTest, FailedProbeIsRetried) {
    config_.retry_attempts = 3;
    registry_.upsert(make_node("a"));
    probe_->failing("a");

    auto monitor = make_monitor();
    monitor->run_cycle();

    EXPECT_EQ(probe_->calls(), 3);
    EXPECT_EQ(alerts_->alerts_by_severity(AlertSeverity::Critical).size(), 1u);
}

/**
 * @brief Тест: превышение порогов ресурсов и ошибок
 */
TEST_F(HealthMonitorTest, ThresholdAlerts) {
    registry_.upsert(make_node("hot"));

    monitoring::NodeMetrics metrics;
    metrics.cpu_usage_pct = 95.0;
    metrics.memory_usage_pct = 90.0;
    metrics.request_count = 100;
    metrics.error_count = 10;
    probe_->healthy("hot", metrics);

    auto monitor = make_monitor();
    monitor->run_cycle();

    auto resource = alerts_->alerts_by_category(AlertCategory::Resource);
    ASSERT_EQ(resource.size(), 2u);
    EXPECT_EQ(resource[0].severity, AlertSeverity::Error);
    EXPECT_DOUBLE_EQ(resource[0].threshold, 80.0);
    EXPECT_DOUBLE_EQ(resource[0].observed_value, 95.0);
    EXPECT_DOUBLE_EQ(resource[1].observed_value, 90.0);

    auto errors = alerts_->alerts_by_category(AlertCategory::ErrorRate);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_DOUBLE_EQ(errors[0].observed_value, 0.1);

    EXPECT_TRUE(alerts_->alerts_by_category(AlertCategory::Availability).empty());
}

/**
 * @brief Тест: нездоровый ответ узла считается неудачной проверкой
 */
TEST_F(HealthMonitorTest, UnhealthyReportCountsAsFailure) {
    registry_.upsert(make_node("a"));
    probe_->set("a", [](const balancer::Node&) -> Result<monitoring::ProbeReport> {
        monitoring::ProbeReport report;
        report.healthy = false;
        report.dependencies.push_back({"database", false});
        return report;
    });

    auto monitor = make_monitor();
    monitor->run_cycle();

    auto history = monitor->health_history("a");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, CheckStatus::Error);
    EXPECT_FALSE(history[0].error.has_value());
    ASSERT_EQ(history[0].dependencies.size(), 1u);
    EXPECT_EQ(history[0].dependencies[0].id, "database");

    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Failed);
    EXPECT_EQ(alerts_->alerts_by_category(AlertCategory::Availability).size(), 1u);
}

/**
 * @brief Тест: отключённые алерты не публикуются
 */
TEST_F(HealthMonitorTest, AlertingDisabled) {
    config_.alerting_enabled = false;
    registry_.upsert(make_node("a"));
    probe_->failing("a");

    auto monitor = make_monitor();
    monitor->run_cycle();

    EXPECT_EQ(alerts_->counts().total, 0u);
}

// =============================================================================
// Health score и статус
// =============================================================================

/**
 * @brief Тест: переходы active -> degraded -> failed по окну проверок
 */
TEST_F(HealthMonitorTest, ScoreDrivesStatusTransitions) {
    registry_.upsert(make_node("a"));

    std::atomic<bool> healthy{true};
    probe_->set("a", [&healthy](const balancer::Node&) -> Result<monitoring::ProbeReport> {
        if (healthy) {
            return monitoring::ProbeReport{};
        }
        return Err<monitoring::ProbeReport>(ErrorCode::ProbeFailure, "refused");
    });

    auto monitor = make_monitor();

    int failed_events = 0;
    std::string failed_node;
    monitor->on_node_failed([&](const std::string& id) {
        ++failed_events;
        failed_node = id;
    });

    for (int i = 0; i < 4; ++i) {
        monitor->run_cycle();
    }
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Active);

    healthy = false;

    // Окно [ok, ok, ok, ok, fail]: 80
    monitor->run_cycle();
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Degraded);
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 80.0);

    // [ok, ok, ok, fail, fail]: 60
    monitor->run_cycle();
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Degraded);
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 60.0);
    EXPECT_EQ(failed_events, 0);

    // [ok, ok, fail, fail, fail]: 40
    auto stats = monitor->run_cycle();
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Failed);
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 40.0);
    EXPECT_EQ(stats.failed_nodes, 1u);
    EXPECT_EQ(failed_events, 1);
    EXPECT_EQ(failed_node, "a");

    // Повторный отказ не сообщается
    monitor->run_cycle();
    EXPECT_EQ(failed_events, 1);

    // [fail, fail, fail, fail, ok]: 20, всё ещё failed
    healthy = true;
    monitor->run_cycle();
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Failed);

    for (int i = 0; i < 2; ++i) {
        monitor->run_cycle();
    }
    // [fail, fail, ok, ok, ok]: 60
    EXPECT_EQ(registry_.get("a")->status, balancer::NodeStatus::Active);
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 60.0);
}

/**
 * @brief Тест: история проверок ограничена
 */
TEST_F(HealthMonitorTest, HistoryIsBounded) {
    config_.history_size = 3;
    registry_.upsert(make_node("a"));

    auto monitor = make_monitor();
    for (int i = 0; i < 5; ++i) {
        clock_.advance(std::chrono::seconds(1));
        monitor->run_cycle();
    }

    auto history = monitor->health_history("a");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.back().checked_at, clock_.now());

    EXPECT_EQ(monitor->health_history("a", 2).size(), 2u);
    EXPECT_TRUE(monitor->health_history("unknown").empty());
}

/**
 * @brief Тест: история удалённых из инвентаря узлов очищается
 */
TEST_F(HealthMonitorTest, RemovedNodesArePurged) {
    registry_.upsert(make_node("a"));
    registry_.upsert(make_node("b"));

    auto monitor = make_monitor();
    monitor->run_cycle();
    ASSERT_EQ(monitor->health_history("b").size(), 1u);

    registry_.remove("b");
    auto stats = monitor->run_cycle();

    EXPECT_EQ(stats.total_nodes, 1u);
    EXPECT_TRUE(monitor->health_history("b").empty());
}

/**
 * @brief Тест: подписчики цикла получают статистику
 */
TEST_F(HealthMonitorTest, CycleCallback) {
    registry_.upsert(make_node("a"));

    auto monitor = make_monitor();

    std::size_t seen_total = 0;
    monitor->on_cycle_complete([&](const monitoring::HealthStats& stats) {
        seen_total = stats.total_nodes;
    });

    monitor->run_cycle();
    EXPECT_EQ(seen_total, 1u);
    EXPECT_EQ(monitor->current_stats().total_nodes, 1u);
}

// =============================================================================
// Фоновый режим
// =============================================================================

/**
 * @brief Тест: запуск, повторный запуск и остановка
 */
TEST_F(HealthMonitorTest, StartStop) {
    config_.check_interval_ms = 60000;
    registry_.upsert(make_node("a"));

    auto monitor = make_monitor();
    EXPECT_FALSE(monitor->is_running());

    monitor->start();
    EXPECT_TRUE(monitor->is_running());

    // Второй запуск только предупреждает
    monitor->start();
    EXPECT_TRUE(monitor->is_running());

    // Первый цикл выполняется сразу
    for (int i = 0; i < 100 && monitor->current_stats().total_nodes == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(monitor->current_stats().total_nodes, 1u);

    // Остановка не ждёт следующего интервала
    auto started = std::chrono::steady_clock::now();
    monitor->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_FALSE(monitor->is_running());

    monitor->stop();
}

/**
 * @brief Тест: внешний источник инвентаря
 */
TEST_F(HealthMonitorTest, CustomInventoryProvider) {
    config_.check_interval_ms = 60000;
    registry_.upsert(make_node("a"));
    registry_.upsert(make_node("b"));

    auto monitor = make_monitor();
    monitor->start([this] {
        return std::vector<balancer::Node>{*registry_.get("a")};
    });

    for (int i = 0; i < 100 && monitor->current_stats().total_nodes == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    monitor->stop();

    EXPECT_EQ(monitor->current_stats().total_nodes, 1u);
    EXPECT_EQ(monitor->health_history("a").size(), 1u);
    EXPECT_TRUE(monitor->health_history("b").empty());
}

} // namespace loadmesh::tests
