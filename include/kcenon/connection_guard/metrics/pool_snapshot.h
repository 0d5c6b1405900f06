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
 * @file pool_snapshot.h
 * @brief One point-in-time sample of logical pool usage
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace connection_guard::metrics
{

/**
 * @struct pool_snapshot
 * @brief Immutable sample of logical connection usage
 *
 * Invariants, maintained by make_snapshot():
 * - active_connections + idle_connections == total_connections
 * - utilization == active_connections / total_connections
 *
 * cumulative_errors and cumulative_attempts are running totals over the
 * sampler's lifetime; differences between two snapshots give the activity
 * in between.
 */
struct pool_snapshot
{
	std::chrono::system_clock::time_point timestamp;
	int64_t active_connections{ 0 };
	int64_t idle_connections{ 0 };
	int64_t total_connections{ 0 };
	uint64_t cumulative_errors{ 0 };
	uint64_t cumulative_attempts{ 0 };
	double avg_connection_time_ms{ 0.0 };
	double utilization{ 0.0 };
	bool estimated{ true }; ///< active count is an in-flight estimate, not pool telemetry
};

/**
 * @brief Build a snapshot whose derived fields satisfy the invariants
 * @param timestamp Sample time
 * @param active Active connections (clamped to [0, total])
 * @param total Capacity (max_connections)
 * @param errors Cumulative failed attempts
 * @param attempts Cumulative attempts
 * @param avg_connection_time_ms Rolling average attempt latency
 * @param estimated Whether active is an estimate
 */
inline pool_snapshot make_snapshot(std::chrono::system_clock::time_point timestamp,
								   int64_t active,
								   int64_t total,
								   uint64_t errors,
								   uint64_t attempts,
								   double avg_connection_time_ms,
								   bool estimated)
{
	pool_snapshot snapshot;
	snapshot.timestamp = timestamp;
	snapshot.total_connections = std::max<int64_t>(total, 0);
	snapshot.active_connections
		= std::clamp<int64_t>(active, 0, snapshot.total_connections);
	snapshot.idle_connections = snapshot.total_connections - snapshot.active_connections;
	snapshot.cumulative_errors = errors;
	snapshot.cumulative_attempts = attempts;
	snapshot.avg_connection_time_ms = avg_connection_time_ms;
	snapshot.utilization
		= snapshot.total_connections > 0
			  ? static_cast<double>(snapshot.active_connections)
					/ static_cast<double>(snapshot.total_connections)
			  : 0.0;
	snapshot.estimated = estimated;
	return snapshot;
}

} // namespace connection_guard::metrics
