/// @file policy_catalog_test.cpp
/// @brief Unit tests for presets and PolicyCatalog.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "callguard/foundation/config_manager.hpp"
#include "callguard/resilience/policy_catalog.hpp"
#include "callguard/resilience/policy_presets.hpp"

using namespace callguard::resilience;
using namespace std::chrono_literals;
using callguard::foundation::ConfigManager;
using callguard::foundation::GuardError;
using callguard::foundation::GuardResult;

namespace {

std::vector<std::string> describeAll(const Pipeline& pipeline) {
    std::vector<std::string> names;
    for (const auto& policy : pipeline.policies()) {
        names.push_back(policy->describe());
    }
    return names;
}

} // anonymous namespace

// ===========================================================================
// Presets
// ===========================================================================

TEST(PolicyPresetsTest, ExternalApi) {
    EXPECT_EQ(describeAll(*presets::externalApi()),
              (std::vector<std::string>{"Timeout(30000ms)", "Retry(max=3, base=1000ms)",
                                        "Bulkhead(max=5, block)"}));
}

TEST(PolicyPresetsTest, Database) {
    EXPECT_EQ(describeAll(*presets::database()),
              (std::vector<std::string>{"Timeout(10000ms)", "Retry(max=2, base=500ms)"}));
}

TEST(PolicyPresetsTest, Ai) {
    auto pipeline = presets::ai();
    EXPECT_EQ(describeAll(*pipeline),
              (std::vector<std::string>{"Timeout(60000ms)", "Retry(max=3, base=2000ms)",
                                        "Bulkhead(max=3, block)"}));
    auto retry = std::dynamic_pointer_cast<RetryPolicy>(pipeline->policies()[1]);
    ASSERT_NE(retry, nullptr);
    EXPECT_DOUBLE_EQ(retry->config().backoffFactor, 3.0);
}

TEST(PolicyPresetsTest, CacheTreatsFailureAsMiss) {
    auto cache = presets::cache(std::string("<miss>"));
    EXPECT_EQ(describeAll(*cache),
              (std::vector<std::string>{"Fallback(value)", "Timeout(1000ms)"}));

    auto result = cache->execute([]() -> GuardResult<std::string> {
        return GuardResult<std::string>::err(GuardError(ErrorCode::ConnectionLost, "redis gone"));
    });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "<miss>");
}

// ===========================================================================
// Catalog
// ===========================================================================

TEST(PolicyCatalogTest, DefaultsRegisterThreeProfiles) {
    auto catalog = PolicyCatalog::withDefaults();
    EXPECT_EQ(catalog.names(), (std::vector<std::string>{"ai", "database", "external_api"}));

    auto ai = catalog.get("ai");
    ASSERT_TRUE(ai.hasValue());
    EXPECT_EQ(ai.value()->size(), 3u);
}

TEST(PolicyCatalogTest, UnknownProfileIsNotFound) {
    PolicyCatalog catalog;
    auto result = catalog.get("nope");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST(PolicyCatalogTest, AddReplacesExistingEntry) {
    auto catalog = PolicyCatalog::withDefaults();
    catalog.add("ai", std::make_shared<Pipeline>());

    EXPECT_EQ(catalog.size(), 3u);
    EXPECT_TRUE(catalog.get("ai").value()->empty());
}

class PolicyCatalogConfigTest : public ::testing::Test {
protected:
    ConfigManager config_;
    CircuitRegistry registry_;
    PolicyCatalog catalog_;
};

TEST_F(PolicyCatalogConfigTest, LoadsProfilesInDefaultOrder) {
    ASSERT_TRUE(config_.loadString(R"(
resilience:
  policies:
    payments:
      bulkhead:
        max_concurrent: 8
        queue: reject
      circuit:
        failure_threshold: 4
        reset_timeout_ms: 15000
      retry:
        max_attempts: 4
        base_delay_ms: 200
        jitter: false
      timeout_ms: 5000
    search:
      timeout_ms: 800
)").hasValue());

    auto loaded = catalog_.loadFromConfig(config_, registry_);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();

    auto payments = catalog_.get("payments");
    ASSERT_TRUE(payments.hasValue());
    EXPECT_EQ(describeAll(*payments.value()),
              (std::vector<std::string>{"Timeout(5000ms)", "Retry(max=4, base=200ms)",
                                        "CircuitBreaker(payments)",
                                        "Bulkhead(max=8, reject)"}));

    auto breaker = registry_.find("payments");
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->config().failureThreshold, 4u);
    EXPECT_EQ(breaker->config().resetTimeout, 15000ms);

    auto search = catalog_.get("search");
    ASSERT_TRUE(search.hasValue());
    EXPECT_EQ(search.value()->size(), 1u);
}

TEST_F(PolicyCatalogConfigTest, ExplicitOrderIsHonoured) {
    ASSERT_TRUE(config_.loadString(R"(
resilience:
  policies:
    reports:
      timeout_ms: 2000
      retry:
        max_attempts: 2
      circuit:
        name: reporting-db
      order: [circuit, retry, timeout]
)").hasValue());

    ASSERT_TRUE(catalog_.loadFromConfig(config_, registry_).hasValue());

    auto reports = catalog_.get("reports");
    ASSERT_TRUE(reports.hasValue());
    EXPECT_EQ(describeAll(*reports.value()),
              (std::vector<std::string>{"CircuitBreaker(reporting-db)",
                                        "Retry(max=2, base=1000ms)", "Timeout(2000ms)"}));
    EXPECT_TRUE(registry_.contains("reporting-db"));
}

TEST_F(PolicyCatalogConfigTest, CustomPrefix) {
    ASSERT_TRUE(config_.loadString(R"(
services:
  geo:
    timeout_ms: 300
)").hasValue());

    ASSERT_TRUE(catalog_.loadFromConfig(config_, registry_, "services").hasValue());
    EXPECT_TRUE(catalog_.contains("geo"));
}

TEST_F(PolicyCatalogConfigTest, WrongTypeIsConfigTypeMismatch) {
    ASSERT_TRUE(config_.loadString(R"(
resilience:
  policies:
    broken:
      timeout_ms: soon
)").hasValue());

    auto loaded = catalog_.loadFromConfig(config_, registry_);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(PolicyCatalogConfigTest, InvalidValuesAreRejected) {
    const char* documents[] = {
        "resilience:\n  policies:\n    p:\n      retry:\n        max_attempts: 0\n",
        "resilience:\n  policies:\n    p:\n      retry:\n        backoff_factor: 0.5\n",
        "resilience:\n  policies:\n    p:\n      retry:\n        max_attempts: 4294967297\n",
        "resilience:\n  policies:\n    p:\n      bulkhead:\n        max_concurrent: 4294967296\n",
        "resilience:\n  policies:\n    p:\n      circuit:\n        failure_threshold: 4294967296\n",
        "resilience:\n  policies:\n    p:\n      bulkhead:\n        queue: lifo\n",
        "resilience:\n  policies:\n    p:\n      timeout_ms: 10\n      order: [timeout, cache]\n",
        "resilience:\n  policies:\n    p:\n      timeout_ms: 10\n      retry:\n"
        "        max_attempts: 2\n      order: [retry]\n",
    };

    for (const char* doc : documents) {
        ConfigManager config;
        ASSERT_TRUE(config.loadString(doc).hasValue()) << doc;
        auto loaded = catalog_.loadFromConfig(config, registry_);
        ASSERT_TRUE(loaded.hasError()) << doc;
        EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidArgument) << doc;
    }
}

TEST_F(PolicyCatalogConfigTest, FailedLoadLeavesCatalogUnchanged) {
    ASSERT_TRUE(config_.loadString(R"(
resilience:
  policies:
    a_good:
      timeout_ms: 100
    b_bad:
      timeout_ms: -5
)").hasValue());

    ASSERT_TRUE(catalog_.loadFromConfig(config_, registry_).hasError());
    EXPECT_EQ(catalog_.size(), 0u);
}

TEST_F(PolicyCatalogConfigTest, ShippedSampleLoads) {
    ASSERT_TRUE(config_.load(CALLGUARD_SAMPLE_CONFIG).hasValue());
    ASSERT_TRUE(catalog_.loadFromConfig(config_, registry_).hasValue());

    EXPECT_EQ(catalog_.names(), (std::vector<std::string>{"llm", "payments", "search"}));
    EXPECT_EQ(describeAll(*catalog_.get("llm").value()),
              (std::vector<std::string>{"Retry(max=3, base=2000ms)", "Timeout(60000ms)",
                                        "CircuitBreaker(llm)"}));
    EXPECT_EQ(registry_.names(), (std::vector<std::string>{"llm", "payments-gateway"}));
}
