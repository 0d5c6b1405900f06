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

#include <kcenon/connection_guard/health/health_evaluator.h>

#include <algorithm>

namespace connection_guard::health
{

namespace
{

struct rule_match
{
	health_status status;
	std::string message;
	std::vector<std::string> recommendations;
};

} // namespace

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& items)
{
	for (const auto& item : items)
	{
		if (std::find(target.begin(), target.end(), item) == target.end())
		{
			target.push_back(item);
		}
	}
}

health_evaluator::health_evaluator(health_thresholds thresholds) : thresholds_(thresholds) {}

health_report health_evaluator::evaluate(const metrics::pool_snapshot& snapshot,
										 double error_rate,
										 resilience::breaker_state breaker) const
{
	std::vector<rule_match> matches;

	bool high_utilization = snapshot.utilization > thresholds_.warning_utilization;

	if (snapshot.utilization > thresholds_.critical_utilization)
	{
		matches.push_back({ health_status::critical,
							"Critical connection pool utilization",
							{ "Immediately increase max connections",
							  "Implement query result caching",
							  "Review and optimize slow queries" } });
	}
	else if (high_utilization)
	{
		matches.push_back({ health_status::warning,
							"High connection pool utilization detected",
							{ "Consider increasing max connections or optimizing query patterns",
							  "Implement connection pooling in the client configuration" } });
	}

	if (error_rate > thresholds_.error_rate)
	{
		matches.push_back({ high_utilization ? health_status::critical : health_status::warning,
							high_utilization
								? "High connection error rate under high pool utilization"
								: "High connection error rate detected",
							{ "Check database server health",
							  "Increase connection timeout values",
							  "Implement retry logic with exponential backoff" } });
	}

	if (breaker == resilience::breaker_state::open)
	{
		matches.push_back({ health_status::critical,
							"Circuit breaker is open - connection pool is failing",
							{ "Check database connectivity",
							  "Review recent deployment changes",
							  "Consider increasing circuit breaker timeout" } });
	}

	health_report report;
	report.metrics = snapshot;
	report.error_rate = error_rate;
	report.breaker = breaker;
	report.status = health_status::healthy;
	report.message = "Connection pool is healthy";

	for (const auto& match : matches)
	{
		// Later rules win ties so the breaker message takes precedence
		if (match.status >= report.status && match.status != health_status::healthy)
		{
			report.status = match.status;
			report.message = match.message;
		}
		append_unique(report.recommendations, match.recommendations);
	}

	return report;
}

std::vector<std::string> health_evaluator::optimization_recommendations(
	const metrics::pool_snapshot& snapshot)
{
	std::vector<std::string> recommendations;

	if (snapshot.utilization > HIGH_THROUGHPUT_UTILIZATION)
	{
		recommendations.push_back("Consider increasing max connections to improve throughput");
	}

	if (snapshot.avg_connection_time_ms > SLOW_CONNECTION_MS)
	{
		recommendations.push_back("High connection time detected - check database performance");
	}

	if (snapshot.cumulative_errors > MANY_ERRORS)
	{
		recommendations.push_back(
			"Many connection errors - review network connectivity and database health");
	}

	if (snapshot.utilization < LOW_UTILIZATION)
	{
		recommendations.push_back(
			"Low pool utilization - consider reducing max connections to save resources");
	}

	return recommendations;
}

} // namespace connection_guard::health
