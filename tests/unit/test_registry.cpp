/**
 * @file test_registry.cpp
 * @brief Unit tests for policy lookup and instance persistence.
 */

#include "scheduler/registry.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace ledger_scheduler;

namespace {

Task make_task(std::string id) {
    return Task{
        .id = std::move(id),
        .demand = {1, 1, 1, 1},
        .deadline = std::chrono::system_clock::now() + std::chrono::hours{1},
        .duration = std::nullopt
    };
}

}  // namespace

TEST(RegistryTest, ResolvesEveryPolicyName) {
    SchedulerRegistry registry(SchedulerConfig{});
    for (std::string_view name : {"roundrobin", "urgency", "leastloaded", "blockchain"}) {
        auto instance = registry.get(name);
        ASSERT_TRUE(instance.has_value()) << name;
        EXPECT_EQ((*instance)->name(), name);
    }
}

TEST(RegistryTest, UnknownNameIsAnError) {
    SchedulerRegistry registry(SchedulerConfig{});
    auto instance = registry.get("fifo");
    ASSERT_FALSE(instance.has_value());
    EXPECT_EQ(instance.error().code, ErrorCode::UnknownPolicy);
    EXPECT_NE(instance.error().message.find("fifo"), std::string::npos);

    EXPECT_FALSE(registry.get("BlockChain").has_value());
    EXPECT_TRUE(registry.constructed().empty());
}

TEST(RegistryTest, InstancesAreBuiltLazily) {
    SchedulerRegistry registry(SchedulerConfig{});
    EXPECT_TRUE(registry.constructed().empty());

    (void)registry.get(PolicyKind::LeastLoaded);
    (void)registry.get(PolicyKind::RoundRobin);
    EXPECT_EQ(registry.constructed(), (std::vector<std::string>{"roundrobin", "leastloaded"}));
}

TEST(RegistryTest, RepeatedLookupsShareState) {
    SchedulerRegistry registry(SchedulerConfig{});
    auto fleet = make_fleet(3, {8, 16, 4, 10});

    auto first = registry.get("roundrobin");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)->schedule(make_task("a"), fleet).vm_id, VmId{0});

    auto second = registry.get("roundrobin");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ((*second)->schedule(make_task("b"), fleet).vm_id, VmId{1});
}

TEST(RegistryTest, BlockchainLedgerPersists) {
    SchedulerRegistry registry(SchedulerConfig{});
    auto fleet = make_fleet(2, {8, 16, 4, 10});

    (void)registry.get(PolicyKind::BlockchainInspired).schedule(make_task("a"), fleet);
    (void)registry.get(PolicyKind::BlockchainInspired).schedule(make_task("b"), fleet);

    auto summary = registry.get(PolicyKind::BlockchainInspired).ledger_summary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total_transactions, 2u);
}

TEST(RegistryTest, ConfigFlowsIntoPolicies) {
    SchedulerConfig config;
    config.blockchain.block_size = 1;
    SchedulerRegistry registry(config);
    auto fleet = make_fleet(1, {8, 16, 4, 10});

    auto& chain = registry.get(PolicyKind::BlockchainInspired);
    (void)chain.schedule(make_task("a"), fleet);
    EXPECT_EQ(chain.block_count(), 2u);
}

TEST(RegistryTest, ConcurrentLookupsYieldOneInstance) {
    SchedulerRegistry registry(SchedulerConfig{});
    std::vector<PolicyInstance*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] { seen[i] = &registry.get(PolicyKind::UrgencyAware); });
    }
    for (auto& t : threads) t.join();

    for (auto* p : seen) {
        EXPECT_EQ(p, seen.front());
    }
    EXPECT_EQ(registry.constructed().size(), 1u);
}
