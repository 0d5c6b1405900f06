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

#include <kcenon/connection_guard/resilience/retry_executor.h>

#include <algorithm>
#include <cmath>

namespace connection_guard::resilience
{

retry_policy retry_policy::from(const guard_config& config)
{
	retry_policy policy;
	policy.max_retries = static_cast<uint32_t>(std::max<int64_t>(config.max_retries, 0));
	policy.base_delay = std::max(config.retry_base_delay, std::chrono::milliseconds(0));
	return policy;
}

retry_executor::retry_executor(circuit_breaker& breaker,
							   metrics::metrics_sampler& sampler,
							   retry_policy policy)
	: breaker_(breaker)
	, sampler_(sampler)
	, policy_(policy)
	, shutdown_token_(make_token())
{
}

retry_executor::~retry_executor()
{
	request_shutdown();
}

std::chrono::milliseconds retry_executor::backoff_delay(std::chrono::milliseconds base,
														uint32_t attempt_index)
{
	if (base.count() <= 0)
	{
		return std::chrono::milliseconds(0);
	}

	double delay = static_cast<double>(base.count()) * std::ldexp(1.0, static_cast<int>(
																			std::min<uint32_t>(attempt_index, 62)));
	if (delay >= static_cast<double>(MAX_BACKOFF.count()))
	{
		return MAX_BACKOFF;
	}
	return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void retry_executor::configure(retry_policy policy)
{
	std::lock_guard<std::mutex> lock(mutex_);
	policy_ = policy;
}

retry_policy retry_executor::policy() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return policy_;
}

void retry_executor::request_shutdown()
{
	current_token().cancel();
}

void retry_executor::resume()
{
	auto token = make_token();

	std::lock_guard<std::mutex> lock(mutex_);
	if (shutdown_token_.is_cancelled())
	{
		shutdown_token_ = token;
	}
}

bool retry_executor::is_shutdown_requested() const
{
	return current_token().is_cancelled();
}

std::map<std::string, operation_stats> retry_executor::operation_statistics() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return stats_;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> retry_executor::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

void retry_executor::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

bool retry_executor::wait_backoff(const kcenon::thread::cancellation_token& token,
								  std::chrono::milliseconds delay)
{
	std::unique_lock<std::mutex> lock(sleep_mutex_);
	return !sleep_cv_.wait_for(lock, delay, [&token] { return token.is_cancelled(); });
}

kcenon::thread::cancellation_token retry_executor::current_token() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return shutdown_token_;
}

kcenon::thread::cancellation_token retry_executor::make_token()
{
	auto token = kcenon::thread::cancellation_token::create();
	token.register_callback(
		[this]()
		{
			// Taking the lock orders the notify after any predicate check in progress
			{
				std::lock_guard<std::mutex> lock(sleep_mutex_);
			}
			sleep_cv_.notify_all();
		});
	return token;
}

void retry_executor::record_call(const std::string& operation_name,
								 call_outcome outcome,
								 uint32_t attempts,
								 std::chrono::milliseconds duration)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto& stats = stats_[operation_name];
	++stats.calls;
	stats.attempts += attempts;
	stats.last_duration = duration;

	switch (outcome)
	{
	case call_outcome::success:
		++stats.successes;
		break;
	case call_outcome::failure:
		++stats.failures;
		break;
	case call_outcome::rejected:
		++stats.rejected;
		break;
	case call_outcome::aborted:
		++stats.aborted;
		break;
	}
}

void retry_executor::log(kcenon::common::interfaces::log_level level,
						 const std::string& message) const
{
	auto logger = get_logger();
	if (logger)
	{
		(void)logger->log(level, "[retry_executor] " + message);
	}
}

double retry_executor::elapsed_ms(std::chrono::steady_clock::time_point start)
{
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
		.count();
}

} // namespace connection_guard::resilience
