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

#include <kcenon/connection_guard/core/guard_config.h>
#include <kcenon/connection_guard/core/guard_error.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace connection_guard
{

namespace
{

kcenon::common::error_info invalid_config(const std::vector<std::string>& errors)
{
	std::ostringstream oss;
	oss << "Invalid configuration:";
	for (const auto& error : errors)
	{
		oss << " " << error << ";";
	}
	return make_guard_error(guard_error::config_invalid, oss.str(), "guard_config");
}

void trim(std::string& s)
{
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::optional<int64_t> parse_integer(const std::string& value)
{
	try
	{
		size_t consumed = 0;
		auto parsed = std::stoll(value, &consumed);
		if (consumed != value.size())
		{
			return std::nullopt;
		}
		return static_cast<int64_t>(parsed);
	}
	catch (const std::invalid_argument&)
	{
		return std::nullopt;
	}
	catch (const std::out_of_range&)
	{
		return std::nullopt;
	}
}

std::optional<bool> parse_bool(const std::string& value)
{
	if (value == "true" || value == "1" || value == "yes" || value == "on")
	{
		return true;
	}
	if (value == "false" || value == "0" || value == "no" || value == "off")
	{
		return false;
	}
	return std::nullopt;
}

} // namespace

guard_config guard_config::defaults()
{
	guard_config config;
	// All defaults are set in the struct definition
	return config;
}

kcenon::common::Result<guard_config> guard_config::for_profile(const std::string& name)
{
	guard_config config = defaults();

	if (name == "default")
	{
		return config;
	}

	if (name == "development")
	{
		config.profile = name;
		config.max_connections = 5;
		config.idle_timeout = std::chrono::milliseconds(30000);
		config.connection_timeout = std::chrono::milliseconds(10000);
		config.max_retries = 3;
		config.retry_base_delay = std::chrono::milliseconds(1000);
		config.circuit_breaker_enabled = true;
		config.circuit_breaker_threshold = 3;
		config.circuit_breaker_cooldown = std::chrono::milliseconds(60000);
		return config;
	}

	if (name == "production")
	{
		config.profile = name;
		config.max_connections = 20;
		config.idle_timeout = std::chrono::milliseconds(60000);
		config.connection_timeout = std::chrono::milliseconds(15000);
		config.max_retries = 5;
		config.retry_base_delay = std::chrono::milliseconds(2000);
		config.circuit_breaker_enabled = true;
		config.circuit_breaker_threshold = 5;
		config.circuit_breaker_cooldown = std::chrono::milliseconds(300000);
		return config;
	}

	return make_guard_error(guard_error::unknown_profile,
							"Unknown profile: " + name
								+ " (valid: default, development, production)",
							"guard_config");
}

kcenon::common::Result<guard_config> guard_config::create(const config_overrides& overrides,
														  const std::string& base_profile)
{
	auto base = for_profile(base_profile);
	if (base.is_err())
	{
		return base.error();
	}

	guard_config config = base.value();
	config.apply(overrides);

	auto errors = config.validation_errors();
	if (!errors.empty())
	{
		return invalid_config(errors);
	}

	return config;
}

kcenon::common::Result<guard_config> guard_config::load_from_file(
	const std::string& path,
	const std::optional<std::string>& base_profile)
{
	if (!std::filesystem::exists(path))
	{
		return make_guard_error(guard_error::config_invalid,
								"Configuration file not found: " + path, "guard_config");
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return make_guard_error(guard_error::config_invalid,
								"Cannot open configuration file: " + path, "guard_config");
	}

	std::string profile = "default";
	config_overrides overrides;
	std::vector<std::string> errors;

	std::string line;
	int line_number = 0;
	while (std::getline(file, line))
	{
		++line_number;
		trim(line);

		// Skip comments and empty lines
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			errors.push_back("line " + std::to_string(line_number) + ": expected key=value");
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);
		trim(key);
		trim(value);

		auto integer = [&](std::optional<int64_t>& target)
		{
			auto parsed = parse_integer(value);
			if (!parsed)
			{
				errors.push_back(key + ": not an integer: '" + value + "'");
				return;
			}
			target = *parsed;
		};
		auto millis = [&](std::optional<std::chrono::milliseconds>& target)
		{
			auto parsed = parse_integer(value);
			if (!parsed)
			{
				errors.push_back(key + ": not a duration in milliseconds: '" + value + "'");
				return;
			}
			target = std::chrono::milliseconds(*parsed);
		};
		auto flag = [&](std::optional<bool>& target)
		{
			auto parsed = parse_bool(value);
			if (!parsed)
			{
				errors.push_back(key + ": not a boolean: '" + value + "'");
				return;
			}
			target = *parsed;
		};

		if (key == "profile")
		{
			profile = value;
		}
		else if (key == "pool.max_connections")
		{
			integer(overrides.max_connections);
		}
		else if (key == "pool.idle_timeout_ms")
		{
			millis(overrides.idle_timeout);
		}
		else if (key == "pool.connection_timeout_ms")
		{
			millis(overrides.connection_timeout);
		}
		else if (key == "retry.max_retries")
		{
			integer(overrides.max_retries);
		}
		else if (key == "retry.base_delay_ms")
		{
			millis(overrides.retry_base_delay);
		}
		else if (key == "breaker.enabled")
		{
			flag(overrides.circuit_breaker_enabled);
		}
		else if (key == "breaker.threshold")
		{
			integer(overrides.circuit_breaker_threshold);
		}
		else if (key == "breaker.cooldown_ms")
		{
			millis(overrides.circuit_breaker_cooldown);
		}
		else if (key == "monitoring.enabled")
		{
			flag(overrides.monitoring_enabled);
		}
		else if (key == "monitoring.sample_interval_ms")
		{
			millis(overrides.sample_interval);
		}
		else if (key == "monitoring.history_capacity")
		{
			integer(overrides.history_capacity);
		}
		else if (key == "monitoring.statistics_window")
		{
			integer(overrides.statistics_window);
		}
		else if (key == "monitoring.error_rate_window")
		{
			integer(overrides.error_rate_window);
		}
		else if (key == "monitoring.latency_window")
		{
			integer(overrides.latency_window);
		}
		else
		{
			errors.push_back("Unknown configuration key: " + key);
		}
	}

	if (!errors.empty())
	{
		return invalid_config(errors);
	}

	return create(overrides, base_profile.value_or(profile));
}

std::vector<std::string> guard_config::profile_names()
{
	return { "default", "development", "production" };
}

bool guard_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> guard_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (max_connections <= 0)
	{
		errors.push_back("Maximum connections must be greater than 0");
	}

	if (idle_timeout.count() < 0)
	{
		errors.push_back("Idle timeout cannot be negative");
	}

	if (connection_timeout.count() < 0)
	{
		errors.push_back("Connection timeout cannot be negative");
	}

	if (max_retries < 0)
	{
		errors.push_back("Maximum retries cannot be negative");
	}

	if (retry_base_delay.count() < 0)
	{
		errors.push_back("Retry base delay cannot be negative");
	}

	if (circuit_breaker_threshold <= 0)
	{
		errors.push_back("Circuit breaker threshold must be greater than 0");
	}

	if (circuit_breaker_cooldown.count() < 0)
	{
		errors.push_back("Circuit breaker cooldown cannot be negative");
	}

	if (sample_interval.count() <= 0)
	{
		errors.push_back("Sample interval must be greater than 0");
	}

	if (history_capacity <= 0)
	{
		errors.push_back("History capacity must be greater than 0");
	}

	if (statistics_window <= 0)
	{
		errors.push_back("Statistics window must be greater than 0");
	}

	if (error_rate_window <= 0)
	{
		errors.push_back("Error rate window must be greater than 0");
	}

	if (latency_window <= 0)
	{
		errors.push_back("Latency window must be greater than 0");
	}

	return errors;
}

kcenon::common::VoidResult guard_config::check() const
{
	auto errors = validation_errors();
	if (!errors.empty())
	{
		return invalid_config(errors);
	}
	return kcenon::common::ok();
}

executor_pool_settings guard_config::executor_settings() const
{
	executor_pool_settings settings;
	settings.max_connections = max_connections;
	settings.min_connections = std::min(settings.min_connections, max_connections);
	settings.acquire_timeout = connection_timeout;
	settings.create_timeout = connection_timeout;
	settings.idle_timeout = idle_timeout;
	settings.create_retry_interval = retry_base_delay;
	return settings;
}

void guard_config::apply(const config_overrides& overrides)
{
	if (overrides.max_connections)
		max_connections = *overrides.max_connections;
	if (overrides.idle_timeout)
		idle_timeout = *overrides.idle_timeout;
	if (overrides.connection_timeout)
		connection_timeout = *overrides.connection_timeout;
	if (overrides.max_retries)
		max_retries = *overrides.max_retries;
	if (overrides.retry_base_delay)
		retry_base_delay = *overrides.retry_base_delay;
	if (overrides.circuit_breaker_enabled)
		circuit_breaker_enabled = *overrides.circuit_breaker_enabled;
	if (overrides.circuit_breaker_threshold)
		circuit_breaker_threshold = *overrides.circuit_breaker_threshold;
	if (overrides.circuit_breaker_cooldown)
		circuit_breaker_cooldown = *overrides.circuit_breaker_cooldown;
	if (overrides.monitoring_enabled)
		monitoring_enabled = *overrides.monitoring_enabled;
	if (overrides.sample_interval)
		sample_interval = *overrides.sample_interval;
	if (overrides.history_capacity)
		history_capacity = *overrides.history_capacity;
	if (overrides.statistics_window)
		statistics_window = *overrides.statistics_window;
	if (overrides.error_rate_window)
		error_rate_window = *overrides.error_rate_window;
	if (overrides.latency_window)
		latency_window = *overrides.latency_window;
}

} // namespace connection_guard
