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
 * @file guard_config.h
 * @brief Access layer configuration and named profiles
 *
 * A guard_config is built once (from defaults, a named profile, explicit
 * overrides or a key=value file), validated once, and then only read.
 * Swapping profiles at runtime replaces the whole object.
 *
 * ## Thread Safety
 * Plain data. Build it before handing it to access_manager; the manager
 * keeps its own immutable copy.
 *
 * @code
 * using namespace connection_guard;
 *
 * config_overrides overrides;
 * overrides.max_retries = 2;
 * overrides.retry_base_delay = std::chrono::milliseconds(100);
 *
 * auto config = guard_config::create(overrides, "production");
 * if (config.is_err()) {
 *     std::cerr << config.error().message << std::endl;
 * }
 * @endcode
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace connection_guard
{

/**
 * @struct config_overrides
 * @brief Field-by-field overrides merged over a base profile
 *
 * Integers are signed so that out-of-range input (e.g. negative retries)
 * reaches validation instead of wrapping around.
 */
struct config_overrides
{
	std::optional<int64_t> max_connections;
	std::optional<std::chrono::milliseconds> idle_timeout;
	std::optional<std::chrono::milliseconds> connection_timeout;
	std::optional<int64_t> max_retries;
	std::optional<std::chrono::milliseconds> retry_base_delay;
	std::optional<bool> circuit_breaker_enabled;
	std::optional<int64_t> circuit_breaker_threshold;
	std::optional<std::chrono::milliseconds> circuit_breaker_cooldown;
	std::optional<bool> monitoring_enabled;
	std::optional<std::chrono::milliseconds> sample_interval;
	std::optional<int64_t> history_capacity;
	std::optional<int64_t> statistics_window;
	std::optional<int64_t> error_rate_window;
	std::optional<int64_t> latency_window;
};

/**
 * @struct executor_pool_settings
 * @brief Pool parameters to hand to the query executor collaborator
 *
 * This layer does not own physical connections; these values are what the
 * executor's own pool should be configured with so both sides agree.
 */
struct executor_pool_settings
{
	int64_t max_connections = 0;
	int64_t min_connections = 2;
	std::chrono::milliseconds acquire_timeout{ 0 };
	std::chrono::milliseconds create_timeout{ 0 };
	std::chrono::milliseconds destroy_timeout{ 5000 };
	std::chrono::milliseconds idle_timeout{ 0 };
	std::chrono::milliseconds reap_interval{ 1000 };
	std::chrono::milliseconds create_retry_interval{ 0 };
};

/**
 * @struct guard_config
 * @brief Settings for the connection access layer
 */
struct guard_config
{
	std::string profile = "default"; ///< Profile this config was derived from

	int64_t max_connections = 10;                     ///< Utilization denominator
	std::chrono::milliseconds idle_timeout{ 30000 };  ///< Passed through to executor
	std::chrono::milliseconds connection_timeout{ 10000 }; ///< Passed through to executor

	int64_t max_retries = 3;                          ///< Retries after the first attempt
	std::chrono::milliseconds retry_base_delay{ 1000 }; ///< Backoff base

	bool circuit_breaker_enabled = true;
	int64_t circuit_breaker_threshold = 5;            ///< Consecutive failures to trip
	std::chrono::milliseconds circuit_breaker_cooldown{ 60000 };

	bool monitoring_enabled = true;                   ///< Run the periodic sampler
	std::chrono::milliseconds sample_interval{ 5000 };
	int64_t history_capacity = 100;                   ///< Samples retained
	int64_t statistics_window = 50;                   ///< Samples reported and trended
	int64_t error_rate_window = 20;                   ///< Samples in the error-rate window
	int64_t latency_window = 100;                     ///< Attempts in the latency average

	/**
	 * @brief Default configuration
	 */
	static guard_config defaults();

	/**
	 * @brief Configuration for a named profile
	 * @param name "default", "development" or "production"
	 * @return Profile configuration, or unknown_profile
	 */
	static kcenon::common::Result<guard_config> for_profile(const std::string& name);

	/**
	 * @brief Merge overrides over a profile and validate once
	 * @param overrides Fields to replace
	 * @param base_profile Profile the overrides are applied to
	 * @return Validated configuration, or config_invalid listing every problem
	 */
	static kcenon::common::Result<guard_config> create(
		const config_overrides& overrides,
		const std::string& base_profile = "default");

	/**
	 * @brief Load configuration from a key=value file
	 * @param path Path to the configuration file
	 * @param base_profile Profile the file's keys apply to; replaces the
	 *        file's own profile= line when set
	 *
	 * Recognised keys: profile, pool.max_connections, pool.idle_timeout_ms,
	 * pool.connection_timeout_ms, retry.max_retries, retry.base_delay_ms,
	 * breaker.enabled, breaker.threshold, breaker.cooldown_ms,
	 * monitoring.enabled, monitoring.sample_interval_ms,
	 * monitoring.history_capacity, monitoring.statistics_window,
	 * monitoring.error_rate_window, monitoring.latency_window.
	 */
	static kcenon::common::Result<guard_config> load_from_file(
		const std::string& path,
		const std::optional<std::string>& base_profile = std::nullopt);

	/**
	 * @brief Names of the built-in profiles
	 */
	static std::vector<std::string> profile_names();

	[[nodiscard]] bool validate() const;

	/**
	 * @brief Get validation error messages
	 * @return One message per invalid field, empty when valid
	 */
	[[nodiscard]] std::vector<std::string> validation_errors() const;

	/**
	 * @brief Validate as a result
	 * @return config_invalid listing every problem, or ok
	 */
	[[nodiscard]] kcenon::common::VoidResult check() const;

	/**
	 * @brief Pool settings the query executor should use
	 */
	[[nodiscard]] executor_pool_settings executor_settings() const;

	/**
	 * @brief Apply overrides in place without validating
	 */
	void apply(const config_overrides& overrides);
};

} // namespace connection_guard
