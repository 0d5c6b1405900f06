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
 * @file access_manager_test.cpp
 * @brief Unit tests for the access manager
 *
 * Tests cover:
 * - Construction and validation
 * - Query execution through a mock database backend
 * - Breaker opening, fast failure and manual reset
 * - Profile switching
 * - Health, statistics and performance review
 * - Lifecycle (start/stop) and logging
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/logging/console_logger.h>

#include <database/database_types.h>

using namespace database;
using namespace connection_guard;
using namespace std::chrono_literals;

// ============================================================================
// Mock Database for Testing
// ============================================================================

namespace
{

class mock_database : public core::database_backend
{
public:
	mock_database() : initialized_(false) {}

	~mock_database() override
	{
		if (initialized_)
		{
			(void)shutdown();
		}
	}

	database_types type() const override { return database_types::mysql; }

	kcenon::common::VoidResult initialize(const core::connection_config& /*config*/) override
	{
		initialized_ = true;
		return kcenon::common::ok();
	}

	kcenon::common::VoidResult shutdown() override
	{
		initialized_ = false;
		return kcenon::common::ok();
	}

	bool is_initialized() const override { return initialized_; }

	kcenon::common::Result<uint64_t> insert_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<uint64_t> update_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<uint64_t> delete_query(const std::string& /*query_string*/) override
	{
		return uint64_t{ 1 };
	}

	kcenon::common::Result<core::database_result> select_query(
		const std::string& /*query_string*/) override
	{
		++select_calls_;
		if (!initialized_)
		{
			return kcenon::common::error_info{ -1, "Not initialized", "mock_database" };
		}
		if (failures_remaining_.load() > 0)
		{
			--failures_remaining_;
			return kcenon::common::error_info{ -2, "Connection reset by peer", "mock_database" };
		}
		core::database_row row;
		row["result"] = std::string("mock_result");
		return core::database_result{ row };
	}

	kcenon::common::VoidResult execute_query(const std::string& /*query_string*/) override
	{
		return kcenon::common::ok();
	}

	kcenon::common::VoidResult begin_transaction() override { return kcenon::common::ok(); }

	kcenon::common::VoidResult commit_transaction() override { return kcenon::common::ok(); }

	kcenon::common::VoidResult rollback_transaction() override { return kcenon::common::ok(); }

	bool in_transaction() const override { return false; }

	std::string last_error() const override { return {}; }

	std::map<std::string, std::string> connection_info() const override { return {}; }

	void fail_next(int count) { failures_remaining_.store(count); }
	int select_calls() const { return select_calls_.load(); }

private:
	bool initialized_;
	std::atomic<int> failures_remaining_{ 0 };
	std::atomic<int> select_calls_{ 0 };
};

guard_config test_config()
{
	auto config = guard_config::defaults();
	config.max_connections = 10;
	config.max_retries = 0;
	config.retry_base_delay = 1ms;
	config.circuit_breaker_threshold = 2;
	config.circuit_breaker_cooldown = 60000ms;
	config.sample_interval = 10ms;
	return config;
}

bool contains(const std::vector<std::string>& items, const std::string& needle)
{
	return std::any_of(items.begin(), items.end(),
					   [&](const std::string& item) { return item.find(needle) != std::string::npos; });
}

} // namespace

class AccessManagerTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		database_ = std::make_unique<mock_database>();
		(void)database_->initialize(core::connection_config{});
		manager_ = std::make_unique<access_manager>(test_config(), database_.get());
	}

	void TearDown() override
	{
		manager_.reset();
		database_.reset();
	}

	std::unique_ptr<mock_database> database_;
	std::unique_ptr<access_manager> manager_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(AccessManagerTest, CreateRejectsInvalidConfig)
{
	auto config = test_config();
	config.max_connections = 0;

	auto result = access_manager::create(config);
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), guard_error::config_invalid));
}

TEST_F(AccessManagerTest, CreateAcceptsValidConfig)
{
	auto result = access_manager::create(test_config(), database_.get());
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value()->config().max_connections, 10);
}

TEST_F(AccessManagerTest, FreshManagerIsHealthy)
{
	auto report = manager_->health();

	EXPECT_EQ(report.status, health::health_status::healthy);
	EXPECT_EQ(report.metrics.total_connections, 10);
	EXPECT_EQ(report.metrics.active_connections + report.metrics.idle_connections,
			  report.metrics.total_connections);
	EXPECT_EQ(report.breaker, resilience::breaker_state::closed);
}

// ============================================================================
// Query Execution
// ============================================================================

TEST_F(AccessManagerTest, ExecuteQuerySuccess)
{
	auto rows = manager_->execute_query("SELECT 1");

	EXPECT_TRUE(rows.is_ok());
	EXPECT_EQ(database_->select_calls(), 1);
	EXPECT_EQ(manager_->sampler().cumulative_attempts(), 1u);
}

TEST_F(AccessManagerTest, ExecuteQueryWithoutBackend)
{
	access_manager detached(test_config());

	auto rows = detached.execute_query("SELECT 1");
	ASSERT_TRUE(rows.is_err());
	EXPECT_TRUE(has_code(rows.error(), guard_error::no_backend));
}

TEST_F(AccessManagerTest, ExecuteQueryRetriesTransientFailure)
{
	auto config = test_config();
	config.max_retries = 2;
	ASSERT_TRUE(manager_->configure(config).is_ok());

	database_->fail_next(2);
	auto rows = manager_->execute_query("SELECT 1");

	EXPECT_TRUE(rows.is_ok());
	EXPECT_EQ(database_->select_calls(), 3);
	EXPECT_EQ(manager_->breaker_statistics().consecutive_failures, 0u);
}

TEST_F(AccessManagerTest, GenericExecute)
{
	auto result = manager_->execute("count_rows",
		[this]() -> kcenon::common::Result<uint64_t>
		{ return database_->update_query("UPDATE t SET x = 1"); });

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value(), 1u);
	EXPECT_EQ(manager_->operation_statistics().at("count_rows").successes, 1u);
}

// ============================================================================
// Circuit Breaker
// ============================================================================

TEST_F(AccessManagerTest, BreakerOpensAndShedsLoad)
{
	database_->fail_next(100);

	auto first = manager_->execute_query("SELECT 1");
	auto second = manager_->execute_query("SELECT 1");
	EXPECT_TRUE(is_operation_failure(first.error()));
	EXPECT_TRUE(is_operation_failure(second.error()));

	auto shed = manager_->execute_query("SELECT 1");
	ASSERT_TRUE(shed.is_err());
	EXPECT_TRUE(is_circuit_open(shed.error()));
	EXPECT_EQ(database_->select_calls(), 2);

	auto report = manager_->health();
	EXPECT_EQ(report.status, health::health_status::critical);
	EXPECT_EQ(report.breaker, resilience::breaker_state::open);
}

TEST_F(AccessManagerTest, ResetCircuitBreaker)
{
	database_->fail_next(2);
	(void)manager_->execute_query("SELECT 1");
	(void)manager_->execute_query("SELECT 1");
	ASSERT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::open);

	manager_->reset_circuit_breaker();

	EXPECT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::closed);
	EXPECT_TRUE(manager_->execute_query("SELECT 1").is_ok());
}

TEST_F(AccessManagerTest, OperationErrorKeepsCause)
{
	database_->fail_next(1);
	auto rows = manager_->execute_query("SELECT 1");

	ASSERT_TRUE(rows.is_err());
	ASSERT_TRUE(rows.error().details.has_value());
	EXPECT_NE(rows.error().details->find("Connection reset by peer"), std::string::npos);
}

// ============================================================================
// Profiles
// ============================================================================

TEST_F(AccessManagerTest, ConfigureProductionProfile)
{
	auto result = manager_->configure_profile("production");
	ASSERT_TRUE(result.is_ok());

	auto config = manager_->config();
	EXPECT_EQ(config.profile, "production");
	EXPECT_EQ(config.max_connections, 20);

	EXPECT_EQ(manager_->executor_settings().max_connections, 20);
	EXPECT_EQ(manager_->breaker().settings().threshold, 5u);
	EXPECT_EQ(manager_->health().metrics.total_connections, 20);
}

TEST_F(AccessManagerTest, UnknownProfileLeavesConfigUnchanged)
{
	auto result = manager_->configure_profile("turbo");
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), guard_error::unknown_profile));

	EXPECT_EQ(manager_->config().max_connections, 10);
	EXPECT_EQ(manager_->config().profile, "default");
}

TEST_F(AccessManagerTest, ConfigureRejectsInvalid)
{
	auto config = test_config();
	config.circuit_breaker_threshold = -1;

	auto result = manager_->configure(config);
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), guard_error::config_invalid));
	EXPECT_EQ(manager_->config().circuit_breaker_threshold, 2);
}

TEST_F(AccessManagerTest, ProfileSwitchKeepsBreakerState)
{
	database_->fail_next(2);
	(void)manager_->execute_query("SELECT 1");
	(void)manager_->execute_query("SELECT 1");
	ASSERT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::open);

	ASSERT_TRUE(manager_->configure_profile("development").is_ok());
	EXPECT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::open);
}

// ============================================================================
// Health, Statistics and Review
// ============================================================================

TEST_F(AccessManagerTest, CriticalUtilizationFromTelemetry)
{
	auto config = test_config();
	config.max_connections = 100;
	ASSERT_TRUE(manager_->configure(config).is_ok());
	manager_->set_active_connection_source([] { return std::optional<int64_t>(97); });

	auto report = manager_->health();
	EXPECT_EQ(report.status, health::health_status::critical);
	EXPECT_FALSE(report.metrics.estimated);
	EXPECT_TRUE(contains(report.recommendations, "max connections"));
}

TEST_F(AccessManagerTest, StatisticsWindow)
{
	auto config = test_config();
	config.statistics_window = 3;
	ASSERT_TRUE(manager_->configure(config).is_ok());

	for (int i = 0; i < 5; ++i)
	{
		(void)manager_->sampler().sample();
	}

	auto stats = manager_->statistics();
	EXPECT_EQ(stats.historical.size(), 3u);
	EXPECT_EQ(stats.trends.utilization, health::trend_direction::stable);
	EXPECT_EQ(stats.current.total_connections, 10);
}

TEST_F(AccessManagerTest, HealthUsesSampledErrorRate)
{
	auto config = test_config();
	config.circuit_breaker_threshold = 100;
	config.error_rate_window = 20;
	ASSERT_TRUE(manager_->configure(config).is_ok());

	// Two failed calls among a thousand, spread over twenty samples
	database_->fail_next(2);
	for (int round = 0; round < 20; ++round)
	{
		for (int i = 0; i < 50; ++i)
		{
			(void)manager_->execute_query("SELECT 1");
		}
		(void)manager_->sampler().sample();
	}

	auto report = manager_->health();
	EXPECT_DOUBLE_EQ(report.error_rate, 0.1);
	EXPECT_EQ(report.status, health::health_status::warning);
}

TEST_F(AccessManagerTest, StatisticsSeeOutcomeAndBreakerTogether)
{
	auto config = test_config();
	config.circuit_breaker_threshold = 1000000;
	ASSERT_TRUE(manager_->configure(config).is_ok());

	constexpr int calls = 2000;
	std::atomic<bool> done{ false };
	std::thread writer(
		[this, &done]()
		{
			for (int i = 0; i < calls; ++i)
			{
				(void)manager_->execute("always_fails",
					[]() -> kcenon::common::Result<int>
					{ return kcenon::common::error_info{ -2, "Connection refused", "test" }; });
			}
			done.store(true);
		});

	// Every failure reaches the metrics and the breaker in the same step
	int mismatches = 0;
	while (!done.load())
	{
		auto stats = manager_->statistics();
		if (stats.current.cumulative_errors
			!= static_cast<uint64_t>(stats.breaker.consecutive_failures))
		{
			++mismatches;
		}
	}
	writer.join();

	EXPECT_EQ(mismatches, 0);
	auto stats = manager_->statistics();
	EXPECT_EQ(stats.current.cumulative_errors, static_cast<uint64_t>(calls));
	EXPECT_EQ(stats.breaker.consecutive_failures, static_cast<uint32_t>(calls));
	EXPECT_EQ(stats.breaker.state, resilience::breaker_state::closed);
}

TEST_F(AccessManagerTest, StatisticsWithNoHistory)
{
	auto stats = manager_->statistics();
	EXPECT_TRUE(stats.historical.empty());
	EXPECT_EQ(stats.trends.errors, health::trend_direction::stable);
}

TEST_F(AccessManagerTest, PerformanceReviewForIdlePool)
{
	auto review = manager_->review_performance();

	EXPECT_EQ(review.health.status, health::health_status::healthy);
	EXPECT_TRUE(contains(review.optimizations, "Low pool utilization"));
	EXPECT_TRUE(contains(review.recommendations, "Low pool utilization"));
}

TEST_F(AccessManagerTest, PerformanceReviewMergesHealthRecommendations)
{
	database_->fail_next(100);
	for (int i = 0; i < 6; ++i)
	{
		(void)manager_->execute_query("SELECT 1");
		manager_->reset_circuit_breaker();
	}
	(void)manager_->execute_query("SELECT 1");
	(void)manager_->execute_query("SELECT 1");

	auto review = manager_->review_performance();
	EXPECT_EQ(review.health.status, health::health_status::critical);
	EXPECT_TRUE(contains(review.recommendations, "Check database connectivity"));
	EXPECT_TRUE(contains(review.recommendations, "Many connection errors"));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(AccessManagerTest, StartStop)
{
	manager_->start();
	EXPECT_TRUE(manager_->is_running());
	EXPECT_TRUE(manager_->sampler().is_running());

	auto deadline = std::chrono::steady_clock::now() + 2s;
	while (manager_->sampler().history().empty() && std::chrono::steady_clock::now() < deadline)
	{
		std::this_thread::sleep_for(5ms);
	}
	EXPECT_FALSE(manager_->sampler().history().empty());

	manager_->stop();
	EXPECT_FALSE(manager_->is_running());
	EXPECT_FALSE(manager_->sampler().is_running());

	auto rows = manager_->execute_query("SELECT 1");
	ASSERT_TRUE(rows.is_err());
	EXPECT_TRUE(is_aborted(rows.error()));

	manager_->start();
	EXPECT_TRUE(manager_->execute_query("SELECT 1").is_ok());
	manager_->stop();
}

TEST_F(AccessManagerTest, LoggerPropagatesToComponents)
{
	std::ostringstream out;
	std::ostringstream err;
	auto logger = std::make_shared<logging::console_logger>(
		"manager_test", kcenon::common::interfaces::log_level::debug, &out, &err);
	manager_->set_logger(logger);

	database_->fail_next(2);
	(void)manager_->execute_query("SELECT 1");
	(void)manager_->execute_query("SELECT 1");
	manager_->reset_circuit_breaker();

	EXPECT_NE(err.str().find("[circuit_breaker]"), std::string::npos);
	EXPECT_NE(err.str().find("[retry_executor]"), std::string::npos);
	EXPECT_NE(out.str().find("manually reset"), std::string::npos);
}
