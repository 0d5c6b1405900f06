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
 * @file metrics_sampler.h
 * @brief Periodic pool sampling with bounded history
 *
 * The sampler keeps running totals fed by the retry executor (attempt
 * latency and outcome, operations in flight) and turns them into
 * pool_snapshot values, either on demand or from a background loop.
 */

#pragma once

#include "metrics_history.h"
#include "pool_snapshot.h"

#include <kcenon/connection_guard/core/guard_config.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace connection_guard::metrics
{

/**
 * @brief Source of genuine active-connection counts
 *
 * Returns std::nullopt when the executor cannot report a count right now.
 */
using active_connection_source = std::function<std::optional<int64_t>()>;

/**
 * @class metrics_sampler
 * @brief Produces pool snapshots and keeps the most recent ones
 *
 * Active connections come from the active_connection_source when one is
 * set. Otherwise the number of operations currently in flight through the
 * retry executor is used and the snapshot is marked as estimated.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - History, latency window and counters share one mutex
 * - The sampling loop holds the mutex only while building a snapshot
 * - start() and stop() are serialized; stop() returns after the loop ends
 *
 * Example Usage:
 * @code
 *   metrics_sampler sampler(guard_config::defaults());
 *   sampler.start();
 *
 *   sampler.record_outcome(12.5, true);
 *   auto snapshot = sampler.sample();
 *
 *   sampler.stop();
 * @endcode
 */
class metrics_sampler
{
public:
	/**
	 * @brief Construct a sampler
	 * @param config Capacity, interval and window settings
	 * @param executor Executor for the background loop (std::async if null)
	 */
	explicit metrics_sampler(
		const guard_config& config,
		std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	~metrics_sampler();

	metrics_sampler(const metrics_sampler&) = delete;
	metrics_sampler& operator=(const metrics_sampler&) = delete;
	metrics_sampler(metrics_sampler&&) = delete;
	metrics_sampler& operator=(metrics_sampler&&) = delete;

	/**
	 * @brief Apply new capacity, interval and window settings
	 *
	 * History is kept (trimmed if the capacity shrinks). A running loop
	 * picks up the new interval on its next wait.
	 */
	void configure(const guard_config& config);

	/**
	 * @brief Start the periodic sampling loop
	 *
	 * Does nothing when monitoring is disabled or the loop already runs.
	 */
	void start();

	/**
	 * @brief Stop the sampling loop and wait for it to finish
	 */
	void stop();

	[[nodiscard]] bool is_running() const noexcept;

	/**
	 * @brief Take a snapshot and append it to the history
	 * @return The appended snapshot
	 */
	pool_snapshot sample();

	/**
	 * @brief Take a snapshot without recording it
	 */
	[[nodiscard]] pool_snapshot current() const;

	/**
	 * @brief Record the outcome of one attempt
	 * @param latency_ms Wall-clock latency of the attempt
	 * @param success Whether the attempt succeeded
	 */
	void record_outcome(double latency_ms, bool success);

	/**
	 * @brief Mark an operation as in flight (estimator input)
	 */
	void begin_operation() noexcept;

	/**
	 * @brief Mark an in-flight operation as finished
	 */
	void end_operation() noexcept;

	/**
	 * @brief Full history, most recent last
	 */
	[[nodiscard]] std::vector<pool_snapshot> history() const;

	/**
	 * @brief The last count snapshots, most recent last
	 */
	[[nodiscard]] std::vector<pool_snapshot> recent(size_t count) const;

	[[nodiscard]] std::optional<pool_snapshot> latest() const;

	/**
	 * @brief Errors per sample over the last error_rate_window samples
	 * @return Errors recorded in the window divided by the number of samples
	 *         in it; 0 with an empty history
	 *
	 * Only sampled errors count: failures recorded after the newest sample
	 * enter the rate once the next sample is taken.
	 */
	[[nodiscard]] double recent_error_rate() const;

	[[nodiscard]] uint64_t cumulative_errors() const;
	[[nodiscard]] uint64_t cumulative_attempts() const;
	[[nodiscard]] int64_t in_flight() const noexcept;

	void set_active_connection_source(active_connection_source source);

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	friend class sampler_job;

	/**
	 * @brief Build a snapshot; caller holds mutex_
	 * @param reported Count from the active_connection_source, if any
	 */
	pool_snapshot build_snapshot_locked(std::optional<int64_t> reported) const;

	/**
	 * @brief recent_error_rate(); caller holds mutex_
	 */
	double error_rate_locked() const;

	/**
	 * @brief Query the active_connection_source without holding mutex_
	 */
	std::optional<int64_t> query_active_source() const;

	/**
	 * @brief Background loop (runs on the executor or std::async)
	 */
	void sampling_loop();

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

private:
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;

	mutable std::mutex mutex_;
	std::condition_variable stop_cv_;
	metrics_history history_;
	std::deque<double> latencies_;
	double latency_sum_{ 0.0 };
	uint64_t cumulative_errors_{ 0 };
	uint64_t cumulative_attempts_{ 0 };
	int64_t max_connections_;
	bool monitoring_enabled_;
	std::chrono::milliseconds interval_;
	size_t latency_window_;
	size_t error_rate_window_;
	active_connection_source active_source_;

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	std::atomic<int64_t> in_flight_{ 0 };
	std::mutex lifecycle_mutex_; ///< Serializes start() and stop()
	std::atomic<bool> is_running_{ false };
	bool stop_requested_{ false };
	std::future<void> loop_future_;

	static constexpr double HIGH_UTILIZATION_ALERT = 0.9;
};

} // namespace connection_guard::metrics
