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
 * @file trend_analyzer.h
 * @brief Direction of utilization, errors and latency over the history
 */

#pragma once

#include <kcenon/connection_guard/metrics/pool_snapshot.h>

#include <vector>

namespace connection_guard::health
{

/**
 * @enum trend_direction
 * @brief Direction of a metric between the two halves of a window
 */
enum class trend_direction
{
	stable,
	increasing,
	decreasing
};

/**
 * @brief Converts trend_direction enum to string representation.
 */
constexpr const char* to_string(trend_direction direction) noexcept
{
	switch (direction)
	{
	case trend_direction::stable:
		return "stable";
	case trend_direction::increasing:
		return "increasing";
	case trend_direction::decreasing:
		return "decreasing";
	default:
		return "unknown";
	}
}

/**
 * @struct trend_report
 */
struct trend_report
{
	trend_direction utilization{ trend_direction::stable };
	trend_direction errors{ trend_direction::stable };      ///< errors per sample interval
	trend_direction performance{ trend_direction::stable }; ///< average connection time
};

/**
 * @class trend_analyzer
 * @brief Compares first-half and second-half averages of a sample window
 *
 * The window is split by index: the first floor(n/2) samples against the
 * rest. A metric is increasing or decreasing when the second-half average
 * differs from the first-half average by more than the relative threshold.
 * Errors are compared as per-sample increments of cumulative_errors, so
 * the n-1 increments are split instead of the n samples.
 *
 * Fewer than two samples yields stable for every metric.
 */
class trend_analyzer
{
public:
	explicit trend_analyzer(double relative_threshold = DEFAULT_RELATIVE_THRESHOLD);

	[[nodiscard]] trend_report analyze(const std::vector<metrics::pool_snapshot>& samples) const;

	/**
	 * @brief Classify the change from first to second
	 *
	 * A zero first value has no relative change: any positive second value
	 * counts as increasing.
	 */
	[[nodiscard]] static trend_direction classify(double first,
												  double second,
												  double relative_threshold);

	[[nodiscard]] double relative_threshold() const { return relative_threshold_; }

	static constexpr double DEFAULT_RELATIVE_THRESHOLD = 0.05;

private:
	[[nodiscard]] trend_direction halves(const std::vector<double>& values) const;

	double relative_threshold_;
};

} // namespace connection_guard::health
