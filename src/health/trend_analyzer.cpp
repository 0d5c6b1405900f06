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

#include <kcenon/connection_guard/health/trend_analyzer.h>

#include <cmath>
#include <iterator>
#include <numeric>

namespace connection_guard::health
{

namespace
{

double average(std::vector<double>::const_iterator first,
			   std::vector<double>::const_iterator last)
{
	auto count = std::distance(first, last);
	if (count <= 0)
	{
		return 0.0;
	}
	return std::accumulate(first, last, 0.0) / static_cast<double>(count);
}

} // namespace

trend_analyzer::trend_analyzer(double relative_threshold)
	: relative_threshold_(relative_threshold)
{
}

trend_report trend_analyzer::analyze(const std::vector<metrics::pool_snapshot>& samples) const
{
	trend_report report;
	if (samples.size() < 2)
	{
		return report;
	}

	std::vector<double> utilization;
	std::vector<double> latency;
	std::vector<double> error_increments;
	utilization.reserve(samples.size());
	latency.reserve(samples.size());
	error_increments.reserve(samples.size() - 1);

	for (size_t i = 0; i < samples.size(); ++i)
	{
		utilization.push_back(samples[i].utilization);
		latency.push_back(samples[i].avg_connection_time_ms);

		if (i > 0)
		{
			auto previous = samples[i - 1].cumulative_errors;
			auto current = samples[i].cumulative_errors;
			// Counters restart with a new sampler; treat a drop as no new errors
			error_increments.push_back(
				current >= previous ? static_cast<double>(current - previous) : 0.0);
		}
	}

	report.utilization = halves(utilization);
	report.errors = halves(error_increments);
	report.performance = halves(latency);
	return report;
}

trend_direction trend_analyzer::classify(double first, double second, double relative_threshold)
{
	if (first == 0.0)
	{
		return second > 0.0 ? trend_direction::increasing : trend_direction::stable;
	}

	double change = (second - first) / std::fabs(first);
	if (change > relative_threshold)
	{
		return trend_direction::increasing;
	}
	if (change < -relative_threshold)
	{
		return trend_direction::decreasing;
	}
	return trend_direction::stable;
}

trend_direction trend_analyzer::halves(const std::vector<double>& values) const
{
	auto split = values.size() / 2;
	if (split == 0)
	{
		return trend_direction::stable;
	}

	auto middle = values.begin() + static_cast<std::ptrdiff_t>(split);
	return classify(average(values.begin(), middle), average(middle, values.end()),
					relative_threshold_);
}

} // namespace connection_guard::health
