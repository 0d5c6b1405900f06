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

#include <kcenon/connection_guard/access_manager.h>

#include <algorithm>

namespace connection_guard
{

using kcenon::common::interfaces::log_level;

access_manager::access_manager(guard_config config,
							   database::core::database_backend* backend,
							   std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: config_(std::move(config))
	, backend_(backend)
	, sampler_(config_, std::move(executor))
	, breaker_(resilience::breaker_settings::from(config_))
	, retry_(breaker_, sampler_, resilience::retry_policy::from(config_))
{
}

access_manager::~access_manager()
{
	stop();
}

kcenon::common::Result<std::unique_ptr<access_manager>> access_manager::create(
	guard_config config,
	database::core::database_backend* backend,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
{
	auto valid = config.check();
	if (valid.is_err())
	{
		return valid.error();
	}

	return std::make_unique<access_manager>(std::move(config), backend, std::move(executor));
}

void access_manager::start()
{
	retry_.resume();
	sampler_.start();
	running_.store(true);

	log(log_level::info, "Access manager started with profile '" + config().profile + "'");
}

void access_manager::stop()
{
	if (!running_.exchange(false))
	{
		// Still abort backoffs of calls made without start()
		retry_.request_shutdown();
		return;
	}

	retry_.request_shutdown();
	sampler_.stop();

	log(log_level::info, "Access manager stopped");
}

bool access_manager::is_running() const
{
	return running_.load();
}

kcenon::common::Result<database::core::database_result> access_manager::execute_query(
	const std::string& query_string)
{
	if (!backend_)
	{
		return make_guard_error(guard_error::no_backend,
								"No database backend configured for query execution",
								"access_manager");
	}

	return execute("select_query",
				   [this, &query_string]() { return backend_->select_query(query_string); });
}

health::health_report access_manager::health() const
{
	return retry_.observe(
		[this]()
		{
			return evaluator_.evaluate(sampler_.current(), sampler_.recent_error_rate(),
									   breaker_.state());
		});
}

pool_statistics access_manager::statistics() const
{
	auto window = static_cast<size_t>(std::max<int64_t>(config().statistics_window, 1));

	pool_statistics stats;
	retry_.observe(
		[this, &stats, window]()
		{
			stats.current = sampler_.current();
			stats.historical = sampler_.recent(window);
			stats.breaker = breaker_.stats();
		});
	stats.trends = analyzer_.analyze(stats.historical);
	return stats;
}

performance_review access_manager::review_performance() const
{
	performance_review review;
	review.health = health();
	review.optimizations = health::health_evaluator::optimization_recommendations(
		review.health.metrics);

	review.recommendations = review.health.recommendations;
	health::append_unique(review.recommendations, review.optimizations);
	return review;
}

kcenon::common::VoidResult access_manager::configure_profile(const std::string& name)
{
	auto profile = guard_config::for_profile(name);
	if (profile.is_err())
	{
		log(log_level::warning, "Profile change rejected: " + profile.error().message);
		return profile.error();
	}

	apply_config(profile.value());
	log(log_level::info, "Switched to profile '" + name + "'");
	return kcenon::common::ok();
}

kcenon::common::VoidResult access_manager::configure(const guard_config& config)
{
	auto valid = config.check();
	if (valid.is_err())
	{
		return valid.error();
	}

	apply_config(config);
	log(log_level::info, "Configuration updated (profile '" + config.profile + "')");
	return kcenon::common::ok();
}

void access_manager::reset_circuit_breaker()
{
	breaker_.reset();
	log(log_level::info, "Circuit breaker manually reset");
}

guard_config access_manager::config() const
{
	std::lock_guard<std::mutex> lock(config_mutex_);
	return config_;
}

executor_pool_settings access_manager::executor_settings() const
{
	return config().executor_settings();
}

resilience::breaker_stats access_manager::breaker_statistics() const
{
	return breaker_.stats();
}

std::map<std::string, resilience::operation_stats> access_manager::operation_statistics() const
{
	return retry_.operation_statistics();
}

void access_manager::set_active_connection_source(metrics::active_connection_source source)
{
	sampler_.set_active_connection_source(std::move(source));
}

std::shared_ptr<kcenon::common::interfaces::ILogger> access_manager::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

void access_manager::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	sampler_.set_logger(logger);
	breaker_.set_logger(logger);
	retry_.set_logger(logger);

	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

void access_manager::apply_config(const guard_config& config)
{
	std::lock_guard<std::mutex> lock(config_mutex_);
	config_ = config;

	breaker_.configure(resilience::breaker_settings::from(config_));
	retry_.configure(resilience::retry_policy::from(config_));
	sampler_.configure(config_);

	// A profile that re-enables monitoring needs the loop back
	if (running_.load() && config_.monitoring_enabled && !sampler_.is_running())
	{
		sampler_.start();
	}
}

void access_manager::log(log_level level, const std::string& message) const
{
	auto logger = get_logger();
	if (logger)
	{
		(void)logger->log(level, "[access_manager] " + message);
	}
}

} // namespace connection_guard
