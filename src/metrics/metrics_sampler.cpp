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

#include <kcenon/connection_guard/metrics/metrics_sampler.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace connection_guard::metrics
{

/**
 * @brief Job running the sampling loop on an IExecutor
 */
class sampler_job : public kcenon::common::interfaces::IJob
{
public:
	explicit sampler_job(metrics_sampler* sampler) : sampler_(sampler) {}

	kcenon::common::VoidResult execute() override
	{
		if (sampler_)
		{
			sampler_->sampling_loop();
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "metrics_sampler_loop"; }
	int get_priority() const override { return 0; }

private:
	metrics_sampler* sampler_;
};

metrics_sampler::metrics_sampler(
	const guard_config& config,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: executor_(std::move(executor))
	, history_(static_cast<size_t>(std::max<int64_t>(config.history_capacity, 1)))
	, max_connections_(config.max_connections)
	, monitoring_enabled_(config.monitoring_enabled)
	, interval_(config.sample_interval)
	, latency_window_(static_cast<size_t>(std::max<int64_t>(config.latency_window, 1)))
	, error_rate_window_(static_cast<size_t>(std::max<int64_t>(config.error_rate_window, 1)))
{
}

metrics_sampler::~metrics_sampler()
{
	stop();
}

void metrics_sampler::configure(const guard_config& config)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		history_.set_capacity(static_cast<size_t>(std::max<int64_t>(config.history_capacity, 1)));
		max_connections_ = config.max_connections;
		monitoring_enabled_ = config.monitoring_enabled;
		interval_ = config.sample_interval;
		latency_window_ = static_cast<size_t>(std::max<int64_t>(config.latency_window, 1));
		error_rate_window_
			= static_cast<size_t>(std::max<int64_t>(config.error_rate_window, 1));

		while (latencies_.size() > latency_window_)
		{
			latency_sum_ -= latencies_.front();
			latencies_.pop_front();
		}
	}

	if (!config.monitoring_enabled)
	{
		stop();
	}
}

void metrics_sampler::start()
{
	std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

	bool enabled = false;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		enabled = monitoring_enabled_;
	}

	if (!enabled)
	{
		log(kcenon::common::interfaces::log_level::debug,
			"Monitoring disabled, sampler not started");
		return;
	}

	if (is_running_.load())
	{
		return; // Already running
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		stop_requested_ = false;
	}
	is_running_.store(true);

	if (executor_)
	{
		auto job = std::make_unique<sampler_job>(this);
		auto result = executor_->execute(std::move(job));
		if (result.is_ok())
		{
			loop_future_ = std::move(result.value());
		}
		else
		{
			log(kcenon::common::interfaces::log_level::warning,
				"Executor rejected sampling job, falling back to std::async: "
					+ result.error().message);
			loop_future_ = std::async(std::launch::async, [this] { sampling_loop(); });
		}
	}
	else
	{
		loop_future_ = std::async(std::launch::async, [this] { sampling_loop(); });
	}

	log(kcenon::common::interfaces::log_level::debug, "Metrics sampler started");
}

void metrics_sampler::stop()
{
	std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

	if (!is_running_.exchange(false))
	{
		return; // Not running
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		stop_requested_ = true;
	}
	stop_cv_.notify_all();

	if (loop_future_.valid())
	{
		loop_future_.wait();
	}

	log(kcenon::common::interfaces::log_level::debug, "Metrics sampler stopped");
}

bool metrics_sampler::is_running() const noexcept
{
	return is_running_.load();
}

pool_snapshot metrics_sampler::sample()
{
	auto reported = query_active_source();

	pool_snapshot snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		snapshot = build_snapshot_locked(reported);
		history_.push(snapshot);
	}

	if (snapshot.utilization > HIGH_UTILIZATION_ALERT)
	{
		std::ostringstream oss;
		oss << "High pool utilization: " << std::fixed << std::setprecision(1)
			<< snapshot.utilization * 100.0 << "%";
		log(kcenon::common::interfaces::log_level::warning, oss.str());
	}

	return snapshot;
}

pool_snapshot metrics_sampler::current() const
{
	auto reported = query_active_source();

	std::lock_guard<std::mutex> lock(mutex_);
	return build_snapshot_locked(reported);
}

void metrics_sampler::record_outcome(double latency_ms, bool success)
{
	std::lock_guard<std::mutex> lock(mutex_);

	++cumulative_attempts_;
	if (!success)
	{
		++cumulative_errors_;
	}

	latencies_.push_back(std::max(latency_ms, 0.0));
	latency_sum_ += latencies_.back();
	while (latencies_.size() > latency_window_)
	{
		latency_sum_ -= latencies_.front();
		latencies_.pop_front();
	}
}

void metrics_sampler::begin_operation() noexcept
{
	in_flight_.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sampler::end_operation() noexcept
{
	in_flight_.fetch_sub(1, std::memory_order_relaxed);
}

std::vector<pool_snapshot> metrics_sampler::history() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return history_.all();
}

std::vector<pool_snapshot> metrics_sampler::recent(size_t count) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return history_.tail(count);
}

std::optional<pool_snapshot> metrics_sampler::latest() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return history_.latest();
}

double metrics_sampler::recent_error_rate() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return error_rate_locked();
}

double metrics_sampler::error_rate_locked() const
{
	auto window = std::min(error_rate_window_, history_.size());
	if (window == 0)
	{
		return 0.0;
	}

	// Counter value just before the first sample in the window
	uint64_t base_errors = 0;
	if (auto before = history_.from_back(window))
	{
		base_errors = before->cumulative_errors;
	}
	else if (auto evicted = history_.last_evicted())
	{
		base_errors = evicted->cumulative_errors;
	}

	uint64_t newest = history_.latest()->cumulative_errors;
	uint64_t errors = newest >= base_errors ? newest - base_errors : 0;
	return static_cast<double>(errors) / static_cast<double>(window);
}

uint64_t metrics_sampler::cumulative_errors() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return cumulative_errors_;
}

uint64_t metrics_sampler::cumulative_attempts() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return cumulative_attempts_;
}

int64_t metrics_sampler::in_flight() const noexcept
{
	return in_flight_.load(std::memory_order_relaxed);
}

void metrics_sampler::set_active_connection_source(active_connection_source source)
{
	std::lock_guard<std::mutex> lock(mutex_);
	active_source_ = std::move(source);
}

std::shared_ptr<kcenon::common::interfaces::ILogger> metrics_sampler::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

void metrics_sampler::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

pool_snapshot metrics_sampler::build_snapshot_locked(std::optional<int64_t> reported) const
{
	bool estimated = !reported.has_value();
	int64_t active = estimated ? in_flight_.load(std::memory_order_relaxed) : *reported;

	double average = latencies_.empty()
						 ? 0.0
						 : latency_sum_ / static_cast<double>(latencies_.size());

	return make_snapshot(std::chrono::system_clock::now(), active, max_connections_,
						 cumulative_errors_, cumulative_attempts_, average, estimated);
}

std::optional<int64_t> metrics_sampler::query_active_source() const
{
	active_connection_source source;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		source = active_source_;
	}

	if (!source)
	{
		return std::nullopt;
	}
	return source();
}

void metrics_sampler::sampling_loop()
{
	std::unique_lock<std::mutex> lock(mutex_);
	while (!stop_requested_)
	{
		auto interval = interval_;
		if (stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; }))
		{
			break;
		}

		lock.unlock();
		sample();
		lock.lock();
	}
}

void metrics_sampler::log(kcenon::common::interfaces::log_level level,
						  const std::string& message) const
{
	auto logger = get_logger();
	if (logger)
	{
		(void)logger->log(level, "[metrics_sampler] " + message);
	}
}

} // namespace connection_guard::metrics
