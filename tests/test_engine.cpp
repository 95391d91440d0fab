/**
 * @file test_engine.cpp
 * @brief Интеграционные тесты движка: распределение, проверка здоровья, failover
 */

#include <gtest/gtest.h>

#include "engine/engine.hpp"
#include "test_support.hpp"

namespace loadmesh::tests {

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.balancer.random_seed = 7;
        config_.health.timeout_ms = 200;
        config_.health.check_interval_ms = 1000;
        config_.health.retry_attempts = 1;
        config_.health.score_window = 1;
        config_.nodes = {
            {"a", "http://10.0.0.1:8080"},
            {"b", "http://10.0.0.2:8080"},
            {"c", "http://10.0.0.3:8080"},
        };

        probe_ = std::make_shared<ScriptedProbe>();
    }

    std::unique_ptr<Engine> make_engine() {
        auto engine = Engine::create(config_, probe_, clock_.fn());
        if (!engine) {
            ADD_FAILURE() << engine.error().message;
            return nullptr;
        }
        return std::move(*engine);
    }

    Config config_;
    ManualClock clock_;
    std::shared_ptr<ScriptedProbe> probe_;
};

/**
 * @brief Тест: некорректная конфигурация отклоняется
 */
TEST_F(EngineTest, CreateValidatesConfig) {
    config_.health.timeout_ms = config_.health.check_interval_ms;

    auto engine = Engine::create(config_, probe_, clock_.fn());
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: без проверки здоровья движок не создаётся
 */
TEST_F(EngineTest, CreateRequiresProbe) {
    auto engine = Engine::create(config_, nullptr, clock_.fn());
    ASSERT_FALSE(engine.has_value());
}

/**
 * @brief Тест: узлы из конфигурации регистрируются и получают веса
 */
TEST_F(EngineTest, NodesFromConfigAreRegistered) {
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    EXPECT_EQ(engine->registry().size(), 3u);
    EXPECT_EQ(engine->registry().get("b")->endpoint, "http://10.0.0.2:8080");
    EXPECT_EQ(engine->balancer().weights()->size(), 3u);

    auto node = engine->distribute({"req-1", "read"});
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(engine->balancer().connections(node->id), 1u);
}

/**
 * @brief Тест: итог запроса освобождает соединение и попадает в метрики
 */
TEST_F(EngineTest, CompleteRecordsOutcome) {
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    auto first = engine->distribute({"req-1", "read"});
    ASSERT_TRUE(first.has_value());
    engine->complete({first->id, "read", 25.0, true, 512, ""});

    auto second = engine->distribute({"req-2", "read"});
    ASSERT_TRUE(second.has_value());
    engine->complete({second->id, "read", 0.0, false, 0, "connection reset"});

    EXPECT_EQ(engine->balancer().statistics().total_connections, 0u);

    auto metrics = engine->performance().collect_for("read");
    EXPECT_EQ(metrics.latency_samples, 1u);
    EXPECT_EQ(metrics.error_count, 1u);
    EXPECT_DOUBLE_EQ(metrics.latency.p50, 25.0);
    EXPECT_DOUBLE_EQ(metrics.error_rate, 0.5);
}

/**
 * @brief Тест: отказавший узел исключается, его нагрузка перераспределяется
 */
TEST_F(EngineTest, FailedNodeIsFailedOver) {
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    // Нагрузка только на узел a
    std::vector<balancer::Node> only_a = {*engine->registry().get("a")};
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(engine->balancer().distribute({"req", "read"}, only_a).has_value());
    }

    probe_->failing("a");
    auto stats = engine->health().run_cycle();

    EXPECT_EQ(stats.failed_nodes, 1u);
    EXPECT_EQ(stats.active_nodes, 2u);
    EXPECT_EQ(engine->registry().get("a")->status, balancer::NodeStatus::Failed);

    // 4 соединения поделены между b и c
    EXPECT_EQ(engine->balancer().connections("a"), 0u);
    EXPECT_EQ(engine->balancer().connections("b"), 2u);
    EXPECT_EQ(engine->balancer().connections("c"), 2u);
    EXPECT_EQ(engine->balancer().weights()->count("a"), 0u);

    auto distribution = engine->balancer().load_distribution();
    EXPECT_EQ(distribution.count("a"), 0u);
    EXPECT_DOUBLE_EQ(distribution["b"], 50.0);
    EXPECT_DOUBLE_EQ(distribution["c"], 50.0);

    auto critical = engine->alerts().alerts_by_category(monitoring::AlertCategory::Availability);
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].node_id, "a");

    for (int i = 0; i < 100; ++i) {
        auto node = engine->distribute({"req", "read"});
        ASSERT_TRUE(node.has_value());
        EXPECT_NE(node->id, "a");
    }
}

/**
 * @brief Тест: узел с низким health score не выбирается, после отказа A нагрузка только на B
 */
TEST_F(EngineTest, LowScoreNodeOnlyReceivesFailoverLoad) {
    config_.nodes.clear();
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    engine->register_node(make_node("A", 90.0, 10.0));
    engine->register_node(make_node("B", 40.0, 10.0));

    for (int i = 0; i < 100; ++i) {
        auto node = engine->distribute({"req", "read"});
        ASSERT_TRUE(node.has_value());
        EXPECT_EQ(node->id, "A");
    }

    auto result = engine->balancer().handle_failure("A");
    ASSERT_TRUE(result.success);

    auto distribution = engine->balancer().load_distribution();
    ASSERT_EQ(distribution.size(), 1u);
    EXPECT_DOUBLE_EQ(distribution.at("B"), 100.0);
}

/**
 * @brief Тест: восстановившийся узел возвращается в распределение
 */
TEST_F(EngineTest, RecoveredNodeRejoins) {
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    probe_->failing("a");
    engine->health().run_cycle();
    ASSERT_EQ(engine->registry().get("a")->status, balancer::NodeStatus::Failed);

    probe_->healthy("a");
    engine->health().run_cycle();

    EXPECT_EQ(engine->registry().get("a")->status, balancer::NodeStatus::Active);
    EXPECT_EQ(engine->balancer().weights()->count("a"), 1u);
}

/**
 * @brief Тест: все узлы отказали
 */
TEST_F(EngineTest, AllNodesFailed) {
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    probe_->failing("a");
    probe_->failing("b");
    probe_->failing("c");
    auto stats = engine->health().run_cycle();

    EXPECT_EQ(stats.failed_nodes, 3u);
    EXPECT_DOUBLE_EQ(stats.overall_health_score, 0.0);

    auto node = engine->distribute({"req", "read"});
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::NoAvailableNodes);
}

/**
 * @brief Тест: добавление и удаление узлов во время работы
 */
TEST_F(EngineTest, RegisterAndRemoveNodes) {
    config_.nodes.clear();
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    EXPECT_FALSE(engine->distribute({"req", "read"}).has_value());

    engine->register_node(make_node("x"));
    EXPECT_EQ(engine->balancer().weights()->count("x"), 1u);

    auto node = engine->distribute({"req", "read"});
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->id, "x");

    EXPECT_TRUE(engine->remove_node("x"));
    EXPECT_FALSE(engine->remove_node("x"));
    EXPECT_EQ(engine->balancer().weights()->count("x"), 0u);
    EXPECT_EQ(engine->balancer().connections("x"), 0u);
}

/**
 * @brief Тест: запуск и остановка мониторинга
 */
TEST_F(EngineTest, StartStop) {
    config_.health.check_interval_ms = 60000;
    config_.performance.interval_ms = 60000;
    auto engine = make_engine();
    ASSERT_TRUE(engine);

    engine->start();
    EXPECT_TRUE(engine->is_running());
    EXPECT_TRUE(engine->health().is_running());
    EXPECT_TRUE(engine->performance().is_running());

    engine->stop();
    EXPECT_FALSE(engine->is_running());
    EXPECT_FALSE(engine->health().is_running());
}

} // namespace loadmesh::tests
