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
 * @file access_manager.h
 * @brief Resilient access layer in front of a query executor
 *
 * Owns one metrics sampler, one circuit breaker and one retry executor,
 * and exposes health, statistics and administrative operations over them.
 * Instances are constructed explicitly and passed to whoever needs them;
 * there is no global instance.
 */

#pragma once

#include <kcenon/connection_guard/core/guard_config.h>
#include <kcenon/connection_guard/core/guard_error.h>
#include <kcenon/connection_guard/health/health_evaluator.h>
#include <kcenon/connection_guard/health/trend_analyzer.h>
#include <kcenon/connection_guard/metrics/metrics_sampler.h>
#include <kcenon/connection_guard/resilience/circuit_breaker.h>
#include <kcenon/connection_guard/resilience/retry_executor.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

// Database system integration
#include <database/core/database_backend.h>

namespace connection_guard
{

/**
 * @struct pool_statistics
 * @brief Current snapshot, recent history, trends and breaker state
 *
 * current, historical and breaker are read as one consistent view.
 */
struct pool_statistics
{
	metrics::pool_snapshot current;
	std::vector<metrics::pool_snapshot> historical;
	health::trend_report trends;
	resilience::breaker_stats breaker;
};

/**
 * @struct performance_review
 * @brief Health report plus tuning suggestions
 */
struct performance_review
{
	connection_guard::health::health_report health;
	std::vector<std::string> optimizations;    ///< Tuning suggestions only
	std::vector<std::string> recommendations;  ///< Health recommendations then optimizations
};

/**
 * @class access_manager
 * @brief Circuit breaking, retries and pool health for a query executor
 *
 * Lifecycle:
 * - Construction wires the components; calls can be executed right away.
 * - start() launches the periodic sampler (when monitoring is enabled).
 * - stop() stops the sampler and aborts pending retry backoffs; further
 *   calls return aborted until start() is called again.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - The active configuration is swapped under a mutex; a call in progress
 *   keeps the retry policy it started with
 *
 * Example Usage:
 * @code
 *   auto config = guard_config::for_profile("production");
 *   access_manager manager(config.value(), backend.get());
 *   manager.start();
 *
 *   auto rows = manager.execute_query("SELECT id FROM accounts");
 *   auto report = manager.health();
 *
 *   manager.stop();
 * @endcode
 */
class access_manager
{
public:
	/**
	 * @brief Construct a manager
	 * @param config Configuration (validate before, or use create())
	 * @param backend Query executor used by execute_query(), not owned, may be null
	 * @param executor Executor for the sampler loop (std::async if null)
	 */
	explicit access_manager(
		guard_config config,
		database::core::database_backend* backend = nullptr,
		std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	~access_manager();

	// Disable copy and move (due to mutex and sampler thread)
	access_manager(const access_manager&) = delete;
	access_manager& operator=(const access_manager&) = delete;
	access_manager(access_manager&&) = delete;
	access_manager& operator=(access_manager&&) = delete;

	/**
	 * @brief Validate the configuration, then construct a manager
	 * @return config_invalid listing every problem, or the manager
	 */
	static kcenon::common::Result<std::unique_ptr<access_manager>> create(
		guard_config config,
		database::core::database_backend* backend = nullptr,
		std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	void start();
	void stop();
	[[nodiscard]] bool is_running() const;

	/**
	 * @brief Execute an operation through breaker, retries and metrics
	 * @tparam Func Callable returning kcenon::common::Result<T>
	 */
	template <typename Func>
	auto execute(const std::string& operation_name, Func&& operation) -> decltype(operation())
	{
		return retry_.execute(operation_name, std::forward<Func>(operation));
	}

	/**
	 * @brief Run a SELECT on the backend through execute()
	 * @return Rows, or no_backend when constructed without a backend
	 */
	kcenon::common::Result<database::core::database_result> execute_query(
		const std::string& query_string);

	/**
	 * @brief Evaluate health from the current snapshot, recent error rate and breaker
	 */
	[[nodiscard]] connection_guard::health::health_report health() const;

	/**
	 * @brief Current snapshot, the last statistics_window samples and their trends
	 */
	[[nodiscard]] pool_statistics statistics() const;

	[[nodiscard]] performance_review review_performance() const;

	/**
	 * @brief Switch to a named profile
	 * @return unknown_profile if the name is not a known profile
	 */
	kcenon::common::VoidResult configure_profile(const std::string& name);

	/**
	 * @brief Switch to an arbitrary validated configuration
	 * @return config_invalid if validation fails; nothing changes then
	 */
	kcenon::common::VoidResult configure(const guard_config& config);

	/**
	 * @brief Force the breaker closed
	 */
	void reset_circuit_breaker();

	[[nodiscard]] guard_config config() const;
	[[nodiscard]] executor_pool_settings executor_settings() const;
	[[nodiscard]] resilience::breaker_stats breaker_statistics() const;
	[[nodiscard]] std::map<std::string, resilience::operation_stats> operation_statistics() const;

	/**
	 * @brief Report genuine active-connection counts instead of the in-flight estimate
	 */
	void set_active_connection_source(metrics::active_connection_source source);

	metrics::metrics_sampler& sampler() { return sampler_; }
	resilience::circuit_breaker& breaker() { return breaker_; }

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;

	/**
	 * @brief Set the logger for the manager and all of its components
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	void apply_config(const guard_config& config);
	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	mutable std::mutex config_mutex_;
	guard_config config_;

	database::core::database_backend* backend_;

	metrics::metrics_sampler sampler_;
	resilience::circuit_breaker breaker_;
	resilience::retry_executor retry_;
	health::health_evaluator evaluator_;
	health::trend_analyzer analyzer_;

	std::atomic<bool> running_{ false };

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace connection_guard
