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

#include <kcenon/connection_guard/resilience/circuit_breaker.h>

#include <algorithm>

namespace connection_guard::resilience
{

using kcenon::common::interfaces::log_level;

breaker_settings breaker_settings::from(const guard_config& config)
{
	breaker_settings settings;
	settings.enabled = config.circuit_breaker_enabled;
	settings.threshold
		= static_cast<uint32_t>(std::max<int64_t>(config.circuit_breaker_threshold, 1));
	settings.cooldown = config.circuit_breaker_cooldown;
	return settings;
}

circuit_breaker::circuit_breaker(breaker_settings settings, clock_function clock)
	: settings_(settings)
	, clock_(clock ? std::move(clock)
				   : clock_function([] { return std::chrono::steady_clock::now(); }))
{
	last_transition_ = clock_();
}

bool circuit_breaker::can_execute()
{
	std::string message;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (!settings_.enabled || state_ != breaker_state::open)
		{
			return true;
		}

		if (clock_() - last_transition_ < settings_.cooldown)
		{
			++rejected_calls_;
			return false;
		}

		message = transition_locked(breaker_state::half_open);
	}

	log(log_level::info, message);
	return true;
}

void circuit_breaker::on_success()
{
	std::string message;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (!settings_.enabled)
		{
			return;
		}

		if (state_ == breaker_state::open)
		{
			// Late result of a call admitted before the trip
			return;
		}

		consecutive_failures_ = 0;
		if (state_ == breaker_state::half_open)
		{
			message = transition_locked(breaker_state::closed);
		}
	}

	if (!message.empty())
	{
		log(log_level::info, message);
	}
}

void circuit_breaker::on_failure()
{
	std::string message;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (!settings_.enabled)
		{
			return;
		}

		++consecutive_failures_;

		if (state_ == breaker_state::half_open)
		{
			message = transition_locked(breaker_state::open);
		}
		else if (state_ == breaker_state::closed
				 && consecutive_failures_ >= settings_.threshold)
		{
			message = transition_locked(breaker_state::open);
		}
	}

	if (!message.empty())
	{
		log(log_level::error, message);
	}
}

void circuit_breaker::reset()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		state_ = breaker_state::closed;
		consecutive_failures_ = 0;
		last_transition_ = clock_();
	}

	log(log_level::info, "Circuit breaker reset");
}

void circuit_breaker::configure(breaker_settings settings)
{
	std::lock_guard<std::mutex> lock(mutex_);
	settings_ = settings;
}

breaker_state circuit_breaker::state() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return state_;
}

uint32_t circuit_breaker::consecutive_failures() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return consecutive_failures_;
}

breaker_settings circuit_breaker::settings() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return settings_;
}

breaker_stats circuit_breaker::stats() const
{
	std::lock_guard<std::mutex> lock(mutex_);

	breaker_stats stats;
	stats.state = state_;
	stats.enabled = settings_.enabled;
	stats.consecutive_failures = consecutive_failures_;
	stats.times_opened = times_opened_;
	stats.rejected_calls = rejected_calls_;
	stats.last_transition = last_transition_;
	return stats;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> circuit_breaker::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

void circuit_breaker::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

std::string circuit_breaker::transition_locked(breaker_state to)
{
	std::string message = std::string("Circuit breaker ") + to_string(state_) + " -> "
						  + to_string(to);

	if (to == breaker_state::open)
	{
		++times_opened_;
		message += " after " + std::to_string(consecutive_failures_)
				   + " consecutive failures";
	}

	state_ = to;
	last_transition_ = clock_();
	return message;
}

void circuit_breaker::log(log_level level, const std::string& message) const
{
	auto logger = get_logger();
	if (logger)
	{
		(void)logger->log(level, "[circuit_breaker] " + message);
	}
}

} // namespace connection_guard::resilience
