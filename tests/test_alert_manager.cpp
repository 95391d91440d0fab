/**
 * @file test_alert_manager.cpp
 * @brief Тесты менеджера алертов
 */

#include <gtest/gtest.h>

#include "monitoring/alert_manager.hpp"
#include "test_support.hpp"

#include <stdexcept>

namespace loadmesh::tests {

using monitoring::Alert;
using monitoring::AlertCategory;
using monitoring::AlertManager;
using monitoring::AlertSeverity;

class AlertManagerTest : public ::testing::Test {
protected:
    static Alert make_alert(
        AlertCategory category,
        AlertSeverity severity,
        const std::string& message = "test"
    ) {
        Alert alert;
        alert.category = category;
        alert.severity = severity;
        alert.node_id = "node-1";
        alert.message = message;
        return alert;
    }

    monitoring::AlertingConfig config_;
    ManualClock clock_;
};

/**
 * @brief Тест: ID и время назначаются при публикации
 */
TEST_F(AlertManagerTest, PublishAssignsIdAndTimestamp) {
    AlertManager manager(config_, clock_.fn());

    auto first = manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning));
    auto second = manager.publish(make_alert(AlertCategory::Resource, AlertSeverity::Error));

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);

    auto alerts = manager.recent_alerts();
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].id, 1u);
    EXPECT_EQ(alerts[0].timestamp, clock_.now());
    EXPECT_EQ(alerts[1].category, AlertCategory::Resource);
}

/**
 * @brief Тест: заданное время не перезаписывается
 */
TEST_F(AlertManagerTest, ExplicitTimestampIsKept) {
    AlertManager manager(config_, clock_.fn());

    auto alert = make_alert(AlertCategory::Latency, AlertSeverity::Warning);
    alert.timestamp = clock_.now() - std::chrono::minutes(5);
    manager.publish(alert);

    EXPECT_EQ(manager.recent_alerts().front().timestamp, alert.timestamp);
}

/**
 * @brief Тест: история ограничена, старые вытесняются первыми
 */
TEST_F(AlertManagerTest, HistoryIsBoundedFifo) {
    config_.max_alerts = 3;
    AlertManager manager(config_, clock_.fn());

    for (int i = 0; i < 5; ++i) {
        manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning,
                                   "alert " + std::to_string(i)));
    }

    auto alerts = manager.recent_alerts();
    ASSERT_EQ(alerts.size(), 3u);
    EXPECT_EQ(alerts[0].message, "alert 2");
    EXPECT_EQ(alerts[2].message, "alert 4");
    EXPECT_EQ(alerts[2].id, 5u);

    manager.set_max_alerts(1);
    alerts = manager.recent_alerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].message, "alert 4");
}

/**
 * @brief Тест: recent_alerts возвращает последние N
 */
TEST_F(AlertManagerTest, RecentAlertsLimit) {
    AlertManager manager(config_, clock_.fn());

    for (int i = 0; i < 10; ++i) {
        manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning,
                                   std::to_string(i)));
    }

    auto alerts = manager.recent_alerts(3);
    ASSERT_EQ(alerts.size(), 3u);
    EXPECT_EQ(alerts[0].message, "7");
    EXPECT_EQ(alerts[2].message, "9");
}

/**
 * @brief Тест: фильтры и счётчики
 */
TEST_F(AlertManagerTest, FiltersAndCounts) {
    AlertManager manager(config_, clock_.fn());

    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning));
    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Critical));
    manager.publish(make_alert(AlertCategory::Availability, AlertSeverity::Critical));
    manager.publish(make_alert(AlertCategory::ErrorRate, AlertSeverity::Error));

    EXPECT_EQ(manager.alerts_by_category(AlertCategory::Latency).size(), 2u);
    EXPECT_EQ(manager.alerts_by_category(AlertCategory::Throughput).size(), 0u);
    EXPECT_EQ(manager.alerts_by_severity(AlertSeverity::Critical).size(), 2u);

    auto counts = manager.counts();
    EXPECT_EQ(counts.warning, 1u);
    EXPECT_EQ(counts.error, 1u);
    EXPECT_EQ(counts.critical, 2u);
    EXPECT_EQ(counts.total, 4u);

    manager.clear();
    EXPECT_EQ(manager.counts().total, 0u);
}

/**
 * @brief Тест: подписчики получают опубликованный алерт
 */
TEST_F(AlertManagerTest, CallbacksReceiveAlerts) {
    AlertManager manager(config_, clock_.fn());

    std::vector<uint64_t> received;
    manager.on_alert([&](const Alert& alert) { received.push_back(alert.id); });

    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning));
    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning));

    EXPECT_EQ(received, (std::vector<uint64_t>{1, 2}));
}

/**
 * @brief Тест: исключение подписчика не мешает остальным
 */
TEST_F(AlertManagerTest, FailingCallbackIsIsolated) {
    AlertManager manager(config_, clock_.fn());

    int delivered = 0;
    manager.on_alert([](const Alert&) { throw std::runtime_error("webhook down"); });
    manager.on_alert([&](const Alert&) { ++delivered; });

    EXPECT_NO_THROW(manager.publish(make_alert(AlertCategory::Availability, AlertSeverity::Critical)));
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(manager.counts().total, 1u);
}

/**
 * @brief Тест: исключение не из std::exception тоже не прерывает доставку
 */
TEST_F(AlertManagerTest, NonStandardCallbackExceptionIsIsolated) {
    AlertManager manager(config_, clock_.fn());

    int delivered = 0;
    manager.on_alert([](const Alert&) { throw 42; });
    manager.on_alert([&](const Alert&) { ++delivered; });

    EXPECT_NO_THROW(manager.publish(make_alert(AlertCategory::Resource, AlertSeverity::Error)));
    EXPECT_NO_THROW(manager.publish(make_alert(AlertCategory::Resource, AlertSeverity::Error)));
    EXPECT_EQ(delivered, 2);
}

/**
 * @brief Тест: удаление устаревших алертов
 */
TEST_F(AlertManagerTest, CleanupOldAlerts) {
    AlertManager manager(config_, clock_.fn());

    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning, "old"));
    clock_.advance(std::chrono::minutes(10));
    manager.publish(make_alert(AlertCategory::Latency, AlertSeverity::Warning, "new"));
    clock_.advance(std::chrono::minutes(1));

    EXPECT_EQ(manager.cleanup_old(std::chrono::minutes(5)), 1u);

    auto alerts = manager.recent_alerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].message, "new");

    EXPECT_EQ(manager.cleanup_old(std::chrono::minutes(5)), 0u);
}

} // namespace loadmesh::tests
