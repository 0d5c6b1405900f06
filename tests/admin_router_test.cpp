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
 * @file admin_router_test.cpp
 * @brief Unit tests for JSON reports and the admin router
 */

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/reporting/admin_router.h>
#include <kcenon/connection_guard/reporting/json_report.h>

using namespace connection_guard;
using namespace connection_guard::reporting;
using namespace std::chrono_literals;

namespace
{

guard_config router_config()
{
	auto config = guard_config::defaults();
	config.max_retries = 0;
	config.retry_base_delay = 1ms;
	config.circuit_breaker_threshold = 1;
	config.monitoring_enabled = false;
	return config;
}

} // namespace

// ============================================================================
// JSON Report Tests
// ============================================================================

class JsonReportTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(JsonReportTest, TimestampIsIsoUtc)
{
	std::chrono::system_clock::time_point epoch{};
	EXPECT_EQ(format_timestamp(epoch + 1500ms), "1970-01-01T00:00:01.500Z");
}

TEST_F(JsonReportTest, SnapshotFields)
{
	auto snapshot = metrics::make_snapshot(std::chrono::system_clock::time_point{}, 3, 10, 2, 9,
										   12.5, true);
	nlohmann::json j = snapshot;

	EXPECT_EQ(j["active_connections"], 3);
	EXPECT_EQ(j["idle_connections"], 7);
	EXPECT_EQ(j["total_connections"], 10);
	EXPECT_EQ(j["cumulative_errors"], 2);
	EXPECT_DOUBLE_EQ(j["utilization"].get<double>(), 0.3);
	EXPECT_EQ(j["estimated"], true);
	EXPECT_EQ(j["timestamp"], "1970-01-01T00:00:00.000Z");
}

TEST_F(JsonReportTest, HealthReportFields)
{
	health::health_evaluator evaluator;
	auto snapshot = metrics::make_snapshot(std::chrono::system_clock::now(), 97, 100, 0, 0,
										   1.0, false);
	nlohmann::json j = evaluator.evaluate(snapshot, 0.0, resilience::breaker_state::closed);

	EXPECT_EQ(j["status"], "critical");
	EXPECT_TRUE(j["recommendations"].is_array());
	EXPECT_FALSE(j["recommendations"].empty());
	EXPECT_EQ(j["metrics"]["active_connections"], 97);
	EXPECT_EQ(j["circuit_breaker"], "closed");
}

TEST_F(JsonReportTest, ConfigSections)
{
	nlohmann::json j = guard_config::for_profile("production").value();

	EXPECT_EQ(j["profile"], "production");
	EXPECT_EQ(j["pool"]["max_connections"], 20);
	EXPECT_EQ(j["retry"]["base_delay_ms"], 2000);
	EXPECT_EQ(j["breaker"]["cooldown_ms"], 300000);
}

// ============================================================================
// Admin Router Tests
// ============================================================================

class AdminRouterTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		manager_ = std::make_unique<access_manager>(router_config());
		router_ = std::make_unique<admin_router>(*manager_);
	}

	void TearDown() override
	{
		router_.reset();
		manager_.reset();
	}

	void trip_breaker()
	{
		(void)manager_->execute("failing",
			[]() -> kcenon::common::VoidResult
			{ return kcenon::common::error_info{ -1, "down", "test" }; });
	}

	std::unique_ptr<access_manager> manager_;
	std::unique_ptr<admin_router> router_;
};

TEST_F(AdminRouterTest, HealthEndpoint)
{
	auto response = router_->handle("GET", "/health");

	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body["status"], "healthy");
	EXPECT_TRUE(response.body.contains("metrics"));
	EXPECT_TRUE(response.body.contains("timestamp"));
	EXPECT_EQ(response.content_type(), "application/json");
}

TEST_F(AdminRouterTest, DegradedHealthStillReturns200)
{
	trip_breaker();

	auto response = router_->handle("GET", "/health");
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body["status"], "critical");
}

TEST_F(AdminRouterTest, StatsEndpoint)
{
	(void)manager_->sampler().sample();
	(void)manager_->sampler().sample();

	auto response = router_->handle("GET", "/stats");

	EXPECT_EQ(response.status, 200);
	EXPECT_TRUE(response.body["current"].is_object());
	EXPECT_EQ(response.body["historical"].size(), 2u);
	EXPECT_EQ(response.body["trends"]["utilization"], "stable");
	EXPECT_EQ(response.body["circuit_breaker"]["state"], "closed");
}

TEST_F(AdminRouterTest, PerformanceEndpoint)
{
	auto response = router_->handle("GET", "/performance");

	EXPECT_EQ(response.status, 200);
	EXPECT_TRUE(response.body["recommendations"].is_array());
	EXPECT_EQ(response.body["health"]["status"], "healthy");
}

TEST_F(AdminRouterTest, ConfigEndpoint)
{
	auto response = router_->handle("GET", "/config");

	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body["config"]["pool"]["max_connections"], 10);
	EXPECT_EQ(response.body["executor_settings"]["min_connections"], 2);
}

TEST_F(AdminRouterTest, ResetBreaker)
{
	trip_breaker();
	ASSERT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::open);

	auto response = router_->handle("POST", "/admin/reset-breaker");

	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body["success"], true);
	EXPECT_EQ(response.body["state"], "closed");
	EXPECT_EQ(manager_->breaker_statistics().state, resilience::breaker_state::closed);
}

TEST_F(AdminRouterTest, SwitchProfile)
{
	auto response = router_->handle("POST", "/admin/profile/production");

	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body["profile"], "production");
	EXPECT_EQ(manager_->config().max_connections, 20);
}

TEST_F(AdminRouterTest, SwitchUnknownProfile)
{
	auto response = router_->handle("POST", "/admin/profile/turbo");

	EXPECT_EQ(response.status, 400);
	EXPECT_EQ(response.body["success"], false);
	EXPECT_EQ(manager_->config().profile, "default");
}

TEST_F(AdminRouterTest, UnknownRoute)
{
	EXPECT_EQ(router_->handle("GET", "/metrics").status, 404);
	EXPECT_EQ(router_->handle("POST", "/admin/profile/").status, 404);
}

TEST_F(AdminRouterTest, WrongMethod)
{
	EXPECT_EQ(router_->handle("POST", "/health").status, 405);
	EXPECT_EQ(router_->handle("GET", "/admin/reset-breaker").status, 405);
}

TEST_F(AdminRouterTest, QueryStringAndTrailingSlashIgnored)
{
	EXPECT_EQ(router_->handle("GET", "/health?verbose=1").status, 200);
	EXPECT_EQ(router_->handle("GET", "/stats/").status, 200);
}
