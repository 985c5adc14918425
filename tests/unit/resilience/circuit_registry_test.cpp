/// @file circuit_registry_test.cpp
/// @brief Unit tests for CircuitRegistry.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "callguard/resilience/circuit_registry.hpp"

using namespace callguard::resilience;
using namespace std::chrono_literals;

TEST(CircuitRegistryTest, CreatesBreakerNamedAfterKey) {
    CircuitRegistry registry;
    auto breaker = registry.getOrCreate("payments", {.failureThreshold = 4, .name = "ignored"});

    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->name(), "payments");
    EXPECT_EQ(breaker->config().failureThreshold, 4u);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("payments"));
}

TEST(CircuitRegistryTest, SameNameReturnsSameInstance) {
    CircuitRegistry registry;
    auto first = registry.getOrCreate("db", 5, 30s, 2);
    auto second = registry.getOrCreate("db", 5, 30s, 2);

    EXPECT_EQ(first, second);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(CircuitRegistryTest, FirstWriterWinsOnConflictingConfig) {
    CircuitRegistry registry;
    auto first = registry.getOrCreate("search", 5, 30s, 2);
    auto second = registry.getOrCreate("search", 1, 1s, 1);

    EXPECT_EQ(first, second);
    EXPECT_EQ(second->config().failureThreshold, 5u);
    EXPECT_EQ(second->config().resetTimeout, 30s);
    EXPECT_EQ(second->config().successThreshold, 2u);
}

TEST(CircuitRegistryTest, SharedStateAcrossCallers) {
    CircuitRegistry registry;
    auto a = registry.getOrCreate("ai", 2, 30s);
    a->recordFailure();
    a->recordFailure();

    auto b = registry.getOrCreate("ai");
    EXPECT_EQ(b->state(), CircuitBreaker::State::Open);
}

TEST(CircuitRegistryTest, FindDoesNotCreate) {
    CircuitRegistry registry;
    EXPECT_EQ(registry.find("missing"), nullptr);
    EXPECT_FALSE(registry.contains("missing"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(CircuitRegistryTest, RegistriesAreIsolated) {
    CircuitRegistry one;
    CircuitRegistry two;
    auto a = one.getOrCreate("db");
    auto b = two.getOrCreate("db");
    EXPECT_NE(a, b);
}

TEST(CircuitRegistryTest, NamesAndSnapshotAreSorted) {
    CircuitRegistry registry;
    (void)registry.getOrCreate("zeta");
    (void)registry.getOrCreate("alpha");
    auto mid = registry.getOrCreate("mid", 1, 30s);
    mid->recordFailure();

    auto names = registry.names();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "mid");
    EXPECT_EQ(names[2], "zeta");

    auto snapshot = registry.snapshot();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[1].name, "mid");
    EXPECT_EQ(snapshot[1].state, CircuitBreaker::State::Open);
    EXPECT_EQ(snapshot[0].state, CircuitBreaker::State::Closed);
}

TEST(CircuitRegistryTest, ResetAllClosesEveryBreaker) {
    CircuitRegistry registry;
    auto a = registry.getOrCreate("a", 1, 30s);
    auto b = registry.getOrCreate("b", 1, 30s);
    a->recordFailure();
    b->recordFailure();

    registry.resetAll();

    EXPECT_EQ(a->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(b->state(), CircuitBreaker::State::Closed);
}

TEST(CircuitRegistryTest, ConcurrentGetOrCreateYieldsOneBreaker) {
    CircuitRegistry registry;
    constexpr int kThreads = 8;

    std::vector<std::shared_ptr<CircuitBreaker>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&registry, &seen, i] {
            seen[i] = registry.getOrCreate("contended", static_cast<uint32_t>(i + 1), 1s);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<CircuitBreaker*> distinct;
    for (const auto& breaker : seen) {
        distinct.insert(breaker.get());
    }
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(registry.size(), 1u);
}
