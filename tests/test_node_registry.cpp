/**
 * @file test_node_registry.cpp
 * @brief Тесты реестра узлов
 */

#include <gtest/gtest.h>

#include "balancer/node_registry.hpp"
#include "test_support.hpp"

namespace loadmesh::tests {

class NodeRegistryTest : public ::testing::Test {
protected:
    balancer::NodeRegistry registry_;
};

/**
 * @brief Тест: добавление и замена узла
 */
TEST_F(NodeRegistryTest, UpsertAddsAndReplaces) {
    registry_.upsert(make_node("a", 90.0));
    registry_.upsert(make_node("b", 70.0));
    EXPECT_EQ(registry_.size(), 2u);

    registry_.upsert(make_node("a", 40.0));
    EXPECT_EQ(registry_.size(), 2u);

    auto a = registry_.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_DOUBLE_EQ(a->health_score, 40.0);
}

/**
 * @brief Тест: health score ограничен диапазоном 0-100
 */
TEST_F(NodeRegistryTest, ScoreIsClamped) {
    registry_.upsert(make_node("a", 250.0));
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 100.0);

    registry_.apply_health("a", balancer::NodeStatus::Failed, -5.0, {});
    EXPECT_DOUBLE_EQ(registry_.get("a")->health_score, 0.0);
}

/**
 * @brief Тест: применение результата проверки
 */
TEST_F(NodeRegistryTest, ApplyHealthUpdatesState) {
    registry_.upsert(make_node("a"));

    balancer::ResourceSnapshot resources{55.0, 65.0, 12.0};
    EXPECT_TRUE(registry_.apply_health("a", balancer::NodeStatus::Degraded, 60.0, resources));

    auto a = registry_.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->status, balancer::NodeStatus::Degraded);
    EXPECT_DOUBLE_EQ(a->health_score, 60.0);
    EXPECT_DOUBLE_EQ(a->resources.cpu_usage_pct, 55.0);
    EXPECT_DOUBLE_EQ(a->resources.memory_usage_pct, 65.0);
    EXPECT_DOUBLE_EQ(a->resources.network_latency_ms, 12.0);
}

/**
 * @brief Тест: результат для удалённого узла игнорируется
 */
TEST_F(NodeRegistryTest, ApplyHealthToUnknownNode) {
    EXPECT_FALSE(registry_.apply_health("ghost", balancer::NodeStatus::Active, 100.0, {}));
    EXPECT_EQ(registry_.size(), 0u);
}

/**
 * @brief Тест: снимок упорядочен по id
 */
TEST_F(NodeRegistryTest, SnapshotIsOrderedById) {
    registry_.upsert(make_node("c"));
    registry_.upsert(make_node("a"));
    registry_.upsert(make_node("b"));

    auto nodes = registry_.snapshot();
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0].id, "a");
    EXPECT_EQ(nodes[1].id, "b");
    EXPECT_EQ(nodes[2].id, "c");
}

/**
 * @brief Тест: удаление
 */
TEST_F(NodeRegistryTest, Remove) {
    registry_.upsert(make_node("a"));

    EXPECT_TRUE(registry_.remove("a"));
    EXPECT_FALSE(registry_.remove("a"));
    EXPECT_FALSE(registry_.get("a").has_value());
}

} // namespace loadmesh::tests
