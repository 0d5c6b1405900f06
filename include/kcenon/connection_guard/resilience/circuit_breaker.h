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
 * @file circuit_breaker.h
 * @brief Consecutive-failure circuit breaker
 *
 * Three states guard whether operations may run at all:
 * - closed:    normal operation, failures are counted
 * - open:      operations are refused until the cooldown elapses
 * - half_open: probing; the next success closes, the next failure re-opens
 *
 * State transitions:
 * - closed -> open:      consecutive_failures >= threshold
 * - open -> half_open:   can_execute() after now - last_transition >= cooldown
 * - half_open -> closed: first success
 * - half_open -> open:   first failure (cooldown restarts)
 */

#pragma once

#include <kcenon/connection_guard/core/guard_config.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

namespace connection_guard::resilience
{

/**
 * @enum breaker_state
 * @brief Current state of the circuit breaker
 */
enum class breaker_state
{
	closed,
	open,
	half_open
};

/**
 * @brief Converts breaker_state enum to string representation.
 */
constexpr const char* to_string(breaker_state state) noexcept
{
	switch (state)
	{
	case breaker_state::closed:
		return "closed";
	case breaker_state::open:
		return "open";
	case breaker_state::half_open:
		return "half-open";
	default:
		return "unknown";
	}
}

/**
 * @struct breaker_settings
 * @brief Circuit breaker configuration
 */
struct breaker_settings
{
	bool enabled{ true };
	uint32_t threshold{ 5 };                        ///< Consecutive failures to trip
	std::chrono::milliseconds cooldown{ 60000 };    ///< Time before probing

	static breaker_settings from(const guard_config& config);
};

/**
 * @struct breaker_stats
 * @brief Point-in-time view of the breaker
 */
struct breaker_stats
{
	breaker_state state{ breaker_state::closed };
	bool enabled{ true };
	uint32_t consecutive_failures{ 0 };
	uint64_t times_opened{ 0 };
	uint64_t rejected_calls{ 0 };
	std::chrono::steady_clock::time_point last_transition;
};

/**
 * @class circuit_breaker
 * @brief Admission control based on consecutive failures and a cooldown
 *
 * When disabled the breaker is bypassed entirely: can_execute() is always
 * true and on_success()/on_failure() change nothing.
 *
 * Thread Safety:
 * - All public methods are thread-safe (single internal mutex)
 * - Transitions are logged after the mutex is released
 */
class circuit_breaker
{
public:
	using clock_function = std::function<std::chrono::steady_clock::time_point()>;

	/**
	 * @brief Construct a circuit breaker
	 * @param settings Threshold, cooldown and enable flag
	 * @param clock Time source (steady_clock::now if empty); tests inject one
	 */
	explicit circuit_breaker(breaker_settings settings = breaker_settings{},
							 clock_function clock = nullptr);

	circuit_breaker(const circuit_breaker&) = delete;
	circuit_breaker& operator=(const circuit_breaker&) = delete;

	/**
	 * @brief Check whether an operation may run
	 *
	 * In the open state this performs the open -> half_open transition once
	 * the cooldown has elapsed.
	 */
	bool can_execute();

	/**
	 * @brief Record a successful operation
	 */
	void on_success();

	/**
	 * @brief Record a failed operation
	 */
	void on_failure();

	/**
	 * @brief Force closed, zero failures and restart the cooldown clock
	 */
	void reset();

	/**
	 * @brief Replace settings, keeping the current state
	 */
	void configure(breaker_settings settings);

	[[nodiscard]] breaker_state state() const;
	[[nodiscard]] uint32_t consecutive_failures() const;
	[[nodiscard]] breaker_settings settings() const;
	[[nodiscard]] breaker_stats stats() const;

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	/**
	 * @brief Change state; caller holds mutex_
	 * @return Log line describing the transition
	 */
	std::string transition_locked(breaker_state to);

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	mutable std::mutex mutex_;
	breaker_settings settings_;
	clock_function clock_;
	breaker_state state_{ breaker_state::closed };
	uint32_t consecutive_failures_{ 0 };
	uint64_t times_opened_{ 0 };
	uint64_t rejected_calls_{ 0 };
	std::chrono::steady_clock::time_point last_transition_;

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace connection_guard::resilience
