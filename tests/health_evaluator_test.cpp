// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file health_evaluator_test.cpp
 * @brief Unit tests for health evaluation and tuning recommendations
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <string>

#include <kcenon/connection_guard/health/health_evaluator.h>

using namespace connection_guard;
using namespace connection_guard::health;
using connection_guard::resilience::breaker_state;

namespace
{

metrics::pool_snapshot snapshot_at(int64_t active,
								   int64_t total = 100,
								   uint64_t errors = 0,
								   double avg_ms = 10.0)
{
	return metrics::make_snapshot(std::chrono::system_clock::now(), active, total, errors,
								  errors * 10, avg_ms, false);
}

bool contains(const std::vector<std::string>& items, const std::string& needle)
{
	return std::any_of(items.begin(), items.end(),
					   [&](const std::string& item) { return item.find(needle) != std::string::npos; });
}

} // namespace

class HealthEvaluatorTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}

	health_evaluator evaluator_;
};

// ============================================================================
// Status Names
// ============================================================================

TEST_F(HealthEvaluatorTest, StatusToString)
{
	EXPECT_STREQ(to_string(health_status::healthy), "healthy");
	EXPECT_STREQ(to_string(health_status::warning), "warning");
	EXPECT_STREQ(to_string(health_status::critical), "critical");
}

// ============================================================================
// Rules
// ============================================================================

TEST_F(HealthEvaluatorTest, HealthyPool)
{
	auto report = evaluator_.evaluate(snapshot_at(50), 0.0, breaker_state::closed);

	EXPECT_EQ(report.status, health_status::healthy);
	EXPECT_TRUE(report.is_healthy());
	EXPECT_EQ(report.message, "Connection pool is healthy");
	EXPECT_TRUE(report.recommendations.empty());
	EXPECT_EQ(report.metrics.active_connections, 50);
}

TEST_F(HealthEvaluatorTest, HighUtilizationWarning)
{
	auto report = evaluator_.evaluate(snapshot_at(85), 0.0, breaker_state::closed);

	EXPECT_EQ(report.status, health_status::warning);
	EXPECT_TRUE(contains(report.recommendations, "increasing max connections"));
}

TEST_F(HealthEvaluatorTest, BoundariesAreExclusive)
{
	EXPECT_EQ(evaluator_.evaluate(snapshot_at(80), 0.0, breaker_state::closed).status,
			  health_status::healthy);
	EXPECT_EQ(evaluator_.evaluate(snapshot_at(95), 0.0, breaker_state::closed).status,
			  health_status::warning);
	EXPECT_EQ(evaluator_.evaluate(snapshot_at(50), 0.05, breaker_state::closed).status,
			  health_status::healthy);
}

TEST_F(HealthEvaluatorTest, CriticalUtilizationWithClosedBreaker)
{
	auto report = evaluator_.evaluate(snapshot_at(97), 0.0, breaker_state::closed);

	EXPECT_EQ(report.status, health_status::critical);
	ASSERT_FALSE(report.recommendations.empty());
	EXPECT_TRUE(contains(report.recommendations, "Immediately increase max connections"));
	EXPECT_TRUE(contains(report.recommendations, "caching"));
	EXPECT_TRUE(contains(report.recommendations, "slow queries"));
}

TEST_F(HealthEvaluatorTest, ErrorRateWarning)
{
	auto report = evaluator_.evaluate(snapshot_at(20), 0.10, breaker_state::closed);

	EXPECT_EQ(report.status, health_status::warning);
	EXPECT_EQ(report.message, "High connection error rate detected");
	EXPECT_TRUE(contains(report.recommendations, "exponential backoff"));
}

TEST_F(HealthEvaluatorTest, ErrorRateWithHighUtilizationEscalates)
{
	auto report = evaluator_.evaluate(snapshot_at(85), 0.10, breaker_state::closed);

	EXPECT_EQ(report.status, health_status::critical);
	// Both rules contribute recommendations
	EXPECT_TRUE(contains(report.recommendations, "optimizing query patterns"));
	EXPECT_TRUE(contains(report.recommendations, "Check database server health"));
}

TEST_F(HealthEvaluatorTest, OpenBreakerForcesCritical)
{
	auto report = evaluator_.evaluate(snapshot_at(0), 0.0, breaker_state::open);

	EXPECT_EQ(report.status, health_status::critical);
	EXPECT_EQ(report.message, "Circuit breaker is open - connection pool is failing");
	EXPECT_TRUE(contains(report.recommendations, "connectivity"));
	EXPECT_TRUE(contains(report.recommendations, "deployment"));
}

TEST_F(HealthEvaluatorTest, HalfOpenBreakerNotCritical)
{
	auto report = evaluator_.evaluate(snapshot_at(10), 0.0, breaker_state::half_open);
	EXPECT_EQ(report.status, health_status::healthy);
}

TEST_F(HealthEvaluatorTest, AllRulesConcatenatedWithoutDuplicates)
{
	auto report = evaluator_.evaluate(snapshot_at(99), 0.5, breaker_state::open);

	EXPECT_EQ(report.status, health_status::critical);
	EXPECT_EQ(report.message, "Circuit breaker is open - connection pool is failing");

	// 3 utilization + 3 error rate + 3 breaker
	EXPECT_EQ(report.recommendations.size(), 9u);
	std::set<std::string> unique(report.recommendations.begin(), report.recommendations.end());
	EXPECT_EQ(unique.size(), report.recommendations.size());
}

TEST_F(HealthEvaluatorTest, CustomThresholds)
{
	health_thresholds thresholds;
	thresholds.warning_utilization = 0.5;
	thresholds.critical_utilization = 0.6;
	health_evaluator strict(thresholds);

	EXPECT_EQ(strict.evaluate(snapshot_at(55), 0.0, breaker_state::closed).status,
			  health_status::warning);
	EXPECT_EQ(strict.evaluate(snapshot_at(65), 0.0, breaker_state::closed).status,
			  health_status::critical);
}

// ============================================================================
// Optimization Recommendations
// ============================================================================

TEST_F(HealthEvaluatorTest, OptimizationForBusyPool)
{
	auto recommendations
		= health_evaluator::optimization_recommendations(snapshot_at(75, 100, 0, 10.0));

	ASSERT_EQ(recommendations.size(), 1u);
	EXPECT_EQ(recommendations[0], "Consider increasing max connections to improve throughput");
}

TEST_F(HealthEvaluatorTest, OptimizationForSlowAndFailingIdlePool)
{
	auto recommendations
		= health_evaluator::optimization_recommendations(snapshot_at(10, 100, 6, 250.0));

	EXPECT_TRUE(contains(recommendations, "High connection time detected"));
	EXPECT_TRUE(contains(recommendations, "Many connection errors"));
	EXPECT_TRUE(contains(recommendations, "Low pool utilization"));
}

TEST_F(HealthEvaluatorTest, OptimizationNoneForBalancedPool)
{
	auto recommendations
		= health_evaluator::optimization_recommendations(snapshot_at(50, 100, 5, 200.0));
	EXPECT_TRUE(recommendations.empty());
}

TEST_F(HealthEvaluatorTest, AppendUniqueSkipsExisting)
{
	std::vector<std::string> target{ "a", "b" };
	append_unique(target, { "b", "c", "c" });

	ASSERT_EQ(target.size(), 3u);
	EXPECT_EQ(target[2], "c");
}
