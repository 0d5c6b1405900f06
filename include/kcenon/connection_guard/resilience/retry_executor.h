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
 * @file retry_executor.h
 * @brief Bounded retry with exponential backoff behind a circuit breaker
 *
 * Wraps a single logical operation. The breaker is consulted once per
 * call; every attempt is timed and reported to the metrics sampler; the
 * breaker sees one outcome per call (success, or one failure after the
 * retries are exhausted).
 */

#pragma once

#include "circuit_breaker.h"

#include <kcenon/connection_guard/core/guard_config.h>
#include <kcenon/connection_guard/core/guard_error.h>
#include <kcenon/connection_guard/metrics/metrics_sampler.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

// Thread system integration
#include <kcenon/thread/core/cancellation_token.h>

namespace connection_guard::resilience
{

/**
 * @struct retry_policy
 * @brief Number of retries and backoff base
 */
struct retry_policy
{
	uint32_t max_retries{ 3 };                      ///< Attempts = max_retries + 1
	std::chrono::milliseconds base_delay{ 1000 };   ///< Delay before the first retry

	static retry_policy from(const guard_config& config);
};

/**
 * @struct operation_stats
 * @brief Per-operation-name call statistics
 */
struct operation_stats
{
	uint64_t calls{ 0 };
	uint64_t successes{ 0 };
	uint64_t failures{ 0 };  ///< Calls that exhausted their retries
	uint64_t rejected{ 0 };  ///< Calls refused by the breaker
	uint64_t aborted{ 0 };   ///< Calls interrupted by shutdown
	uint64_t attempts{ 0 };
	std::chrono::milliseconds last_duration{ 0 };
};

/**
 * @class retry_executor
 * @brief Runs operations with breaker admission, retries and metrics
 *
 * Algorithm for execute():
 * 1. Shut down -> aborted. Breaker refuses -> circuit_open, op() not called.
 * 2. Up to max_retries + 1 attempts. Success: sampler.record_outcome(latency,
 *    true), breaker.on_success(), result returned.
 * 3. Failure: sampler.record_outcome(latency, false); wait
 *    base_delay * 2^attempt before the next attempt. After the last attempt
 *    breaker.on_failure() once and operation_failed wrapping the last cause.
 *
 * A backoff wait ends early when request_shutdown() is called; the call
 * then returns aborted. No lock is held while waiting or while op() runs.
 *
 * Each attempt's metrics update and the breaker transition it causes are
 * applied under one outcome lock. observe() takes the same lock, so a
 * reader never sees the breaker ahead of the metrics or the reverse.
 *
 * Example Usage:
 * @code
 *   retry_executor executor(breaker, sampler, retry_policy::from(config));
 *
 *   auto rows = executor.execute("load_orders",
 *       [&]() { return backend->select_query("SELECT * FROM orders"); });
 *   if (rows.is_err() && connection_guard::is_circuit_open(rows.error())) {
 *       // shedding load, back off
 *   }
 * @endcode
 */
class retry_executor
{
public:
	retry_executor(circuit_breaker& breaker,
				   metrics::metrics_sampler& sampler,
				   retry_policy policy = retry_policy{});

	~retry_executor();

	retry_executor(const retry_executor&) = delete;
	retry_executor& operator=(const retry_executor&) = delete;

	/**
	 * @brief Execute an operation with retry
	 * @tparam Func Callable returning kcenon::common::Result<T>
	 * @param operation_name Name used for statistics and logs
	 * @param operation Operation to run
	 * @return The operation's result, or circuit_open / operation_failed / aborted
	 */
	template <typename Func>
	auto execute(const std::string& operation_name, Func&& operation)
		-> decltype(operation());

	/**
	 * @brief Backoff before retry number attempt_index (zero-based)
	 * @return base * 2^attempt_index, capped at MAX_BACKOFF
	 */
	[[nodiscard]] static std::chrono::milliseconds backoff_delay(
		std::chrono::milliseconds base, uint32_t attempt_index);

	void configure(retry_policy policy);
	[[nodiscard]] retry_policy policy() const;

	/**
	 * @brief Abort in-flight backoff waits and refuse new calls
	 */
	void request_shutdown();

	/**
	 * @brief Accept calls again after request_shutdown()
	 */
	void resume();

	[[nodiscard]] bool is_shutdown_requested() const;

	[[nodiscard]] std::map<std::string, operation_stats> operation_statistics() const;

	/**
	 * @brief Run reader while no attempt outcome is being applied
	 * @param reader Callable reading breaker and sampler state
	 * @return Whatever reader returns
	 */
	template <typename Reader>
	auto observe(Reader&& reader) const -> decltype(reader())
	{
		std::lock_guard<std::mutex> lock(outcome_mutex_);
		return reader();
	}

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	static constexpr std::chrono::milliseconds MAX_BACKOFF{ 24 * 60 * 60 * 1000 };

private:
	enum class call_outcome
	{
		success,
		failure,
		rejected,
		aborted
	};

	/**
	 * @brief Keeps the sampler's in-flight count for the call's lifetime
	 */
	class in_flight_scope
	{
	public:
		explicit in_flight_scope(metrics::metrics_sampler& sampler) : sampler_(sampler)
		{
			sampler_.begin_operation();
		}
		~in_flight_scope() { sampler_.end_operation(); }

		in_flight_scope(const in_flight_scope&) = delete;
		in_flight_scope& operator=(const in_flight_scope&) = delete;

	private:
		metrics::metrics_sampler& sampler_;
	};

	/**
	 * @brief Run op(), turning a thrown std::exception into an error result
	 */
	template <typename Func>
	static auto invoke_guarded(Func& operation) -> decltype(operation());

	/**
	 * @brief Sleep for delay unless the token is cancelled first
	 * @return false if cancelled
	 */
	bool wait_backoff(const kcenon::thread::cancellation_token& token,
					  std::chrono::milliseconds delay);

	[[nodiscard]] kcenon::thread::cancellation_token current_token() const;
	kcenon::thread::cancellation_token make_token();

	void record_call(const std::string& operation_name,
					 call_outcome outcome,
					 uint32_t attempts,
					 std::chrono::milliseconds duration);

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	static double elapsed_ms(std::chrono::steady_clock::time_point start);

private:
	circuit_breaker& breaker_;
	metrics::metrics_sampler& sampler_;

	mutable std::mutex outcome_mutex_;

	mutable std::mutex mutex_;
	retry_policy policy_;
	kcenon::thread::cancellation_token shutdown_token_;
	std::map<std::string, operation_stats> stats_;

	std::mutex sleep_mutex_;
	std::condition_variable sleep_cv_;

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

template <typename Func>
auto retry_executor::invoke_guarded(Func& operation) -> decltype(operation())
{
	try
	{
		return operation();
	}
	catch (const std::exception& e)
	{
		return kcenon::common::error_info{
			-1, std::string("Exception in operation: ") + e.what(), "retry_executor"
		};
	}
}

template <typename Func>
auto retry_executor::execute(const std::string& operation_name, Func&& operation)
	-> decltype(operation())
{
	using kcenon::common::interfaces::log_level;

	auto call_start = std::chrono::steady_clock::now();
	auto since_start = [&call_start]()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - call_start);
	};

	auto token = current_token();
	if (token.is_cancelled())
	{
		record_call(operation_name, call_outcome::aborted, 0, since_start());
		return make_guard_error(guard_error::aborted,
								"Executor is shut down, operation '" + operation_name
									+ "' not started",
								"retry_executor");
	}

	if (!breaker_.can_execute())
	{
		record_call(operation_name, call_outcome::rejected, 0, since_start());
		return make_guard_error(guard_error::circuit_open,
								"Circuit breaker is open, operation '" + operation_name
									+ "' rejected",
								"retry_executor");
	}

	auto current_policy = policy();
	in_flight_scope in_flight(sampler_);

	kcenon::common::error_info last_error;
	uint32_t attempts = 0;

	for (uint32_t attempt = 0; attempt <= current_policy.max_retries; ++attempt)
	{
		auto attempt_start = std::chrono::steady_clock::now();
		auto result = invoke_guarded(operation);
		auto latency = elapsed_ms(attempt_start);
		++attempts;

		if (result.is_ok())
		{
			{
				std::lock_guard<std::mutex> lock(outcome_mutex_);
				sampler_.record_outcome(latency, true);
				breaker_.on_success();
			}
			record_call(operation_name, call_outcome::success, attempts, since_start());
			return result;
		}

		last_error = result.error();

		if (attempt == current_policy.max_retries)
		{
			// The final failure and the breaker's failure event land together
			std::lock_guard<std::mutex> lock(outcome_mutex_);
			sampler_.record_outcome(latency, false);
			breaker_.on_failure();
			break;
		}

		{
			std::lock_guard<std::mutex> lock(outcome_mutex_);
			sampler_.record_outcome(latency, false);
		}

		auto delay = backoff_delay(current_policy.base_delay, attempt);
		log(log_level::warning,
			"Operation '" + operation_name + "' attempt " + std::to_string(attempts)
				+ " failed: " + last_error.message + ", retrying in "
				+ std::to_string(delay.count()) + "ms");

		if (!wait_backoff(token, delay))
		{
			record_call(operation_name, call_outcome::aborted, attempts, since_start());
			auto aborted = make_guard_error(guard_error::aborted,
											"Operation '" + operation_name
												+ "' aborted by shutdown after "
												+ std::to_string(attempts) + " attempts",
											"retry_executor");
			aborted.details = last_error.message;
			return aborted;
		}
	}

	record_call(operation_name, call_outcome::failure, attempts, since_start());
	log(log_level::error,
		"Operation '" + operation_name + "' failed after " + std::to_string(attempts)
			+ " attempts: " + last_error.message);

	return make_operation_failure(operation_name, attempts, last_error);
}

} // namespace connection_guard::resilience
