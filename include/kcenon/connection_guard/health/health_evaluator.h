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
 * @file health_evaluator.h
 * @brief Tri-level health status derived from pool metrics
 */

#pragma once

#include <kcenon/connection_guard/metrics/pool_snapshot.h>
#include <kcenon/connection_guard/resilience/circuit_breaker.h>

#include <cstdint>
#include <string>
#include <vector>

namespace connection_guard::health
{

/**
 * @enum health_status
 * @brief Overall health, ordered by severity
 */
enum class health_status
{
	healthy = 0,
	warning = 1,
	critical = 2
};

/**
 * @brief Converts health_status enum to string representation.
 */
constexpr const char* to_string(health_status status) noexcept
{
	switch (status)
	{
	case health_status::healthy:
		return "healthy";
	case health_status::warning:
		return "warning";
	case health_status::critical:
		return "critical";
	default:
		return "unknown";
	}
}

/**
 * @struct health_thresholds
 * @brief Rule thresholds used by health_evaluator
 */
struct health_thresholds
{
	double warning_utilization{ 0.8 };   ///< utilization above this -> warning
	double critical_utilization{ 0.95 }; ///< utilization above this -> critical
	double error_rate{ 0.05 };           ///< recent error rate above this -> warning
};

/**
 * @struct health_report
 * @brief Result of one health evaluation
 */
struct health_report
{
	health_status status{ health_status::healthy };
	std::string message;
	connection_guard::metrics::pool_snapshot metrics;
	double error_rate{ 0.0 };
	resilience::breaker_state breaker{ resilience::breaker_state::closed };
	std::vector<std::string> recommendations;

	[[nodiscard]] bool is_healthy() const { return status == health_status::healthy; }
};

/**
 * @class health_evaluator
 * @brief Pure mapping from (snapshot, error rate, breaker state) to a report
 *
 * Rules:
 * - utilization > critical_utilization: critical
 * - utilization > warning_utilization: warning
 * - error rate > error_rate: warning, critical when utilization is also
 *   above warning_utilization
 * - breaker open: critical
 *
 * The most severe rule decides status and message. Recommendations of every
 * matching rule are concatenated in rule order without duplicates.
 */
class health_evaluator
{
public:
	explicit health_evaluator(health_thresholds thresholds = health_thresholds{});

	[[nodiscard]] health_report evaluate(const metrics::pool_snapshot& snapshot,
										 double error_rate,
										 resilience::breaker_state breaker) const;

	/**
	 * @brief Tuning suggestions for a performance review
	 *
	 * Independent of health status: also suggests shrinking an
	 * underused pool.
	 */
	[[nodiscard]] static std::vector<std::string> optimization_recommendations(
		const metrics::pool_snapshot& snapshot);

	[[nodiscard]] const health_thresholds& thresholds() const { return thresholds_; }

	static constexpr double HIGH_THROUGHPUT_UTILIZATION = 0.7;
	static constexpr double LOW_UTILIZATION = 0.3;
	static constexpr double SLOW_CONNECTION_MS = 200.0;
	static constexpr uint64_t MANY_ERRORS = 5;

private:
	health_thresholds thresholds_;
};

/**
 * @brief Append items not already present in target
 */
void append_unique(std::vector<std::string>& target, const std::vector<std::string>& items);

} // namespace connection_guard::health
