/// @file pipeline_test.cpp
/// @brief Unit tests for Pipeline composition.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "callguard/foundation/task_executor.hpp"
#include "callguard/resilience/pipeline.hpp"

using namespace callguard::resilience;
using namespace std::chrono_literals;
using callguard::foundation::GuardError;
using callguard::foundation::GuardResult;
using callguard::foundation::TaskExecutor;

namespace {

/// Records when it is entered and left, then forwards.
class TracingPolicy final : public Policy {
public:
    TracingPolicy(std::string name, std::shared_ptr<std::vector<std::string>> trace)
        : name_(std::move(name)), trace_(std::move(trace)) {}

    ErasedResult run(const Operation& op) override {
        trace_->push_back("enter " + name_);
        auto result = op();
        trace_->push_back("leave " + name_);
        return result;
    }

    std::string describe() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<std::vector<std::string>> trace_;
};

/// Fails with a fixed code without calling the operation.
class ShortCircuit final : public Policy {
public:
    explicit ShortCircuit(ErrorCode code) : code_(code) {}

    ErasedResult run(const Operation&) override {
        return ErasedResult::err(GuardError(code_, "short-circuited"));
    }

    std::string describe() const override { return "ShortCircuit"; }

private:
    ErrorCode code_;
};

std::vector<std::string> describeAll(const Pipeline& pipeline) {
    std::vector<std::string> names;
    for (const auto& policy : pipeline.policies()) {
        names.push_back(policy->describe());
    }
    return names;
}

} // anonymous namespace

class PipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> trace_ = std::make_shared<std::vector<std::string>>();
    std::shared_ptr<Policy> a_ = std::make_shared<TracingPolicy>("a", trace_);
    std::shared_ptr<Policy> b_ = std::make_shared<TracingPolicy>("b", trace_);
    std::shared_ptr<Policy> c_ = std::make_shared<TracingPolicy>("c", trace_);
};

TEST_F(PipelineTest, ExecutesOuterToInner) {
    Pipeline pipeline({a_, b_, c_});

    auto result = pipeline.execute([this] {
        trace_->push_back("call");
        return 1;
    });

    ASSERT_TRUE(result.hasValue());
    std::vector<std::string> expected = {"enter a", "enter b", "enter c", "call",
                                         "leave c", "leave b", "leave a"};
    EXPECT_EQ(*trace_, expected);
}

TEST_F(PipelineTest, EmptyPipelineRunsOperationDirectly) {
    Pipeline pipeline;
    EXPECT_TRUE(pipeline.empty());

    auto result = pipeline.execute([] { return std::string("direct"); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "direct");
    EXPECT_EQ(pipeline.describe(), "Pipeline[]");
}

TEST_F(PipelineTest, CompositionIsAssociative) {
    auto left = compose(compose(a_, b_), c_);
    auto right = compose(a_, compose(b_, c_));

    EXPECT_EQ(left->policies(), right->policies());
    EXPECT_EQ(describeAll(*left), (std::vector<std::string>{"a", "b", "c"}));

    (void)left->execute([] { return 0; });
    auto leftTrace = *trace_;
    trace_->clear();
    (void)right->execute([] { return 0; });
    EXPECT_EQ(leftTrace, *trace_);
}

TEST(PipelineAssociativityTest, RetryTimeoutFallbackGroupingsAgree) {
    auto executor = std::make_shared<TaskExecutor>(2, "associativity-test");

    struct Outcome {
        int calls = 0;
        GuardResult<int> result = GuardResult<int>::ok(-1);
    };
    auto runGrouping = [&executor](bool groupLeft) {
        std::shared_ptr<Policy> retry = std::make_shared<RetryPolicy>(
            RetryConfig{.maxAttempts = 3, .sleeper = [](std::chrono::milliseconds) {}});
        std::shared_ptr<Policy> timeout = std::make_shared<TimeoutPolicy>(
            TimeoutConfig{.duration = 1s, .executor = executor});
        std::shared_ptr<Policy> fallback = FallbackPolicy::withValue(0);

        auto pipeline = groupLeft ? compose(compose(retry, timeout), fallback)
                                  : compose(retry, compose(timeout, fallback));
        auto calls = std::make_shared<std::atomic<int>>(0);
        Outcome outcome;
        outcome.result = pipeline->execute([calls]() -> GuardResult<int> {
            calls->fetch_add(1);
            return GuardResult<int>::err(GuardError(ErrorCode::ConnectionLost, "reset"));
        });
        outcome.calls = calls->load();
        return outcome;
    };

    auto left = runGrouping(true);
    auto right = runGrouping(false);

    EXPECT_EQ(left.calls, right.calls);
    ASSERT_TRUE(left.result.hasValue());
    ASSERT_TRUE(right.result.hasValue());
    EXPECT_EQ(left.result.value(), right.result.value());
    EXPECT_EQ(left.result.value(), 0);
    // The innermost fallback absorbs the failure, so retry never fires.
    EXPECT_EQ(left.calls, 1);
    executor->stop();
}

TEST_F(PipelineTest, NullPoliciesAreDropped) {
    Pipeline pipeline({a_, nullptr, b_});
    EXPECT_EQ(pipeline.size(), 2u);
}

TEST_F(PipelineTest, InnerErrorPropagatesThroughPassThroughLayers) {
    auto pipeline = compose(a_, std::make_shared<ShortCircuit>(ErrorCode::BulkheadRejected), c_);

    bool invoked = false;
    auto result = pipeline->execute([&invoked] { invoked = true; return 1; });

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::BulkheadRejected);
    EXPECT_FALSE(invoked);
    EXPECT_EQ(*trace_, (std::vector<std::string>{"enter a", "leave a"}));
}

TEST_F(PipelineTest, DescribeListsPolicies) {
    auto pipeline = compose(a_, b_);
    EXPECT_EQ(pipeline->describe(), "Pipeline[a -> b]");
}

TEST(PipelineBuilderTest, BuildsInDeclaredOrder) {
    CircuitBreakerConfig breakerConfig;
    breakerConfig.name = "db";
    auto breaker = std::make_shared<CircuitBreaker>(breakerConfig);

    auto pipeline = Pipeline::Builder()
                        .fallbackTo(0)
                        .timeout(10s)
                        .retry({.maxAttempts = 2, .baseDelay = 500ms})
                        .circuit(breaker)
                        .bulkhead({.maxConcurrent = 4})
                        .build();

    EXPECT_EQ(describeAll(pipeline),
              (std::vector<std::string>{"Fallback(value)", "Timeout(10000ms)",
                                        "Retry(max=2, base=500ms)", "CircuitBreaker(db)",
                                        "Bulkhead(max=4, block)"}));
}

TEST(PipelineBuilderTest, RetryOutsideFallbackSeesSubstitutedValue) {
    std::vector<std::chrono::milliseconds> sleeps;
    auto pipeline = Pipeline::Builder()
                        .retry({.maxAttempts = 3,
                                .sleeper = [&sleeps](std::chrono::milliseconds d) {
                                    sleeps.push_back(d);
                                }})
                        .fallbackTo(-1)
                        .buildShared();

    int calls = 0;
    auto result = pipeline->execute([&calls] {
        ++calls;
        return GuardResult<int>::err(GuardError(ErrorCode::QueryFailed));
    });

    // The fallback ends propagation, so the retry never sees a failure.
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), -1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST(PipelineBuilderTest, SharedPolicyEnforcesOneLimit) {
    auto bulkhead = std::make_shared<BulkheadPolicy>(
        BulkheadConfig{.maxConcurrent = 1, .queuePolicy = QueuePolicy::Reject});
    auto first = compose(bulkhead);
    auto second = compose(bulkhead);

    auto nested = first->execute([&second] {
        auto inner = second->execute([] { return 1; });
        return inner.hasError() ? inner.error().code() : ErrorCode::Success;
    });

    ASSERT_TRUE(nested.hasValue());
    EXPECT_EQ(nested.value(), ErrorCode::BulkheadRejected);
}
