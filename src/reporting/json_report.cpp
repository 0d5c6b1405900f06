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

#include <kcenon/connection_guard/reporting/json_report.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace connection_guard::reporting
{

std::string format_timestamp(std::chrono::system_clock::time_point time)
{
	auto time_t_value = std::chrono::system_clock::to_time_t(time);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
			  % 1000;
	if (ms.count() < 0)
	{
		ms += std::chrono::milliseconds(1000);
	}

	std::tm tm_buf{};
	gmtime_r(&time_t_value, &tm_buf);

	std::ostringstream oss;
	oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
		<< std::setw(3) << ms.count() << 'Z';
	return oss.str();
}

} // namespace connection_guard::reporting

namespace connection_guard::metrics
{

void to_json(nlohmann::json& j, const pool_snapshot& snapshot)
{
	j = nlohmann::json{ { "timestamp", reporting::format_timestamp(snapshot.timestamp) },
						{ "active_connections", snapshot.active_connections },
						{ "idle_connections", snapshot.idle_connections },
						{ "total_connections", snapshot.total_connections },
						{ "cumulative_errors", snapshot.cumulative_errors },
						{ "cumulative_attempts", snapshot.cumulative_attempts },
						{ "avg_connection_time_ms", snapshot.avg_connection_time_ms },
						{ "utilization", snapshot.utilization },
						{ "estimated", snapshot.estimated } };
}

} // namespace connection_guard::metrics

namespace connection_guard::health
{

void to_json(nlohmann::json& j, const health_report& report)
{
	j = nlohmann::json{ { "status", to_string(report.status) },
						{ "message", report.message },
						{ "metrics", report.metrics },
						{ "error_rate", report.error_rate },
						{ "circuit_breaker", resilience::to_string(report.breaker) },
						{ "recommendations", report.recommendations } };
}

void to_json(nlohmann::json& j, const trend_report& trends)
{
	j = nlohmann::json{ { "utilization", to_string(trends.utilization) },
						{ "errors", to_string(trends.errors) },
						{ "performance", to_string(trends.performance) } };
}

} // namespace connection_guard::health

namespace connection_guard::resilience
{

void to_json(nlohmann::json& j, const breaker_stats& stats)
{
	j = nlohmann::json{ { "state", to_string(stats.state) },
						{ "enabled", stats.enabled },
						{ "consecutive_failures", stats.consecutive_failures },
						{ "times_opened", stats.times_opened },
						{ "rejected_calls", stats.rejected_calls } };
}

void to_json(nlohmann::json& j, const operation_stats& stats)
{
	j = nlohmann::json{ { "calls", stats.calls },
						{ "successes", stats.successes },
						{ "failures", stats.failures },
						{ "rejected", stats.rejected },
						{ "aborted", stats.aborted },
						{ "attempts", stats.attempts },
						{ "last_duration_ms", stats.last_duration.count() } };
}

} // namespace connection_guard::resilience

namespace connection_guard
{

void to_json(nlohmann::json& j, const guard_config& config)
{
	j = nlohmann::json{
		{ "profile", config.profile },
		{ "pool",
		  { { "max_connections", config.max_connections },
			{ "idle_timeout_ms", config.idle_timeout.count() },
			{ "connection_timeout_ms", config.connection_timeout.count() } } },
		{ "retry",
		  { { "max_retries", config.max_retries },
			{ "base_delay_ms", config.retry_base_delay.count() } } },
		{ "breaker",
		  { { "enabled", config.circuit_breaker_enabled },
			{ "threshold", config.circuit_breaker_threshold },
			{ "cooldown_ms", config.circuit_breaker_cooldown.count() } } },
		{ "monitoring",
		  { { "enabled", config.monitoring_enabled },
			{ "sample_interval_ms", config.sample_interval.count() },
			{ "history_capacity", config.history_capacity },
			{ "statistics_window", config.statistics_window },
			{ "error_rate_window", config.error_rate_window },
			{ "latency_window", config.latency_window } } }
	};
}

void to_json(nlohmann::json& j, const executor_pool_settings& settings)
{
	j = nlohmann::json{ { "max_connections", settings.max_connections },
						{ "min_connections", settings.min_connections },
						{ "acquire_timeout_ms", settings.acquire_timeout.count() },
						{ "create_timeout_ms", settings.create_timeout.count() },
						{ "destroy_timeout_ms", settings.destroy_timeout.count() },
						{ "idle_timeout_ms", settings.idle_timeout.count() },
						{ "reap_interval_ms", settings.reap_interval.count() },
						{ "create_retry_interval_ms", settings.create_retry_interval.count() } };
}

void to_json(nlohmann::json& j, const pool_statistics& stats)
{
	j = nlohmann::json{ { "current", stats.current },
						{ "historical", stats.historical },
						{ "trends", stats.trends },
						{ "circuit_breaker", stats.breaker } };
}

void to_json(nlohmann::json& j, const performance_review& review)
{
	j = nlohmann::json{ { "health", review.health },
						{ "optimizations", review.optimizations },
						{ "recommendations", review.recommendations } };
}

} // namespace connection_guard
