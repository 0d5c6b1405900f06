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
 * @file guard_benchmarks.cpp
 * @brief Performance benchmarks for the connection guard
 *
 * Benchmarks cover:
 * - Circuit breaker admission overhead
 * - Retry executor overhead on the success path
 * - Metrics sampling and error-rate computation
 * - Health evaluation and trend analysis
 * - Concurrent calls through one access manager
 */

#include <benchmark/benchmark.h>

#include <chrono>
#include <thread>
#include <vector>

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/health/health_evaluator.h>
#include <kcenon/connection_guard/health/trend_analyzer.h>
#include <kcenon/connection_guard/metrics/metrics_sampler.h>
#include <kcenon/connection_guard/resilience/circuit_breaker.h>
#include <kcenon/connection_guard/resilience/retry_executor.h>

using namespace connection_guard;

// ============================================================================
// Benchmark Fixtures
// ============================================================================

class GuardBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& /*state*/) override
	{
		config_ = guard_config::defaults();
		config_.monitoring_enabled = false;
		config_.history_capacity = 100;
	}

	void TearDown(const benchmark::State& /*state*/) override {}

protected:
	guard_config config_;
};

// ============================================================================
// Circuit Breaker Benchmarks
// ============================================================================

BENCHMARK_F(GuardBenchmarkFixture, BM_BreakerClosedAdmission)(benchmark::State& state)
{
	resilience::circuit_breaker breaker(resilience::breaker_settings::from(config_));

	for (auto _ : state)
	{
		benchmark::DoNotOptimize(breaker.can_execute());
		breaker.on_success();
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(GuardBenchmarkFixture, BM_BreakerOpenRejection)(benchmark::State& state)
{
	resilience::breaker_settings settings;
	settings.threshold = 1;
	settings.cooldown = std::chrono::hours(1);
	resilience::circuit_breaker breaker(settings);
	breaker.on_failure();

	for (auto _ : state)
	{
		benchmark::DoNotOptimize(breaker.can_execute());
	}

	state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Retry Executor Benchmarks
// ============================================================================

BENCHMARK_F(GuardBenchmarkFixture, BM_RetryExecutorSuccessPath)(benchmark::State& state)
{
	metrics::metrics_sampler sampler(config_);
	resilience::circuit_breaker breaker(resilience::breaker_settings::from(config_));
	resilience::retry_executor executor(breaker, sampler, resilience::retry_policy::from(config_));

	for (auto _ : state)
	{
		auto result = executor.execute("noop",
			[]() -> kcenon::common::Result<int> { return 1; });
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Metrics Benchmarks
// ============================================================================

BENCHMARK_F(GuardBenchmarkFixture, BM_RecordOutcome)(benchmark::State& state)
{
	metrics::metrics_sampler sampler(config_);
	bool success = true;

	for (auto _ : state)
	{
		sampler.record_outcome(5.0, success);
		success = !success;
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(GuardBenchmarkFixture, BM_SampleWithFullHistory)(benchmark::State& state)
{
	metrics::metrics_sampler sampler(config_);
	for (int i = 0; i < 100; ++i)
	{
		sampler.record_outcome(5.0, i % 10 != 0);
		(void)sampler.sample();
	}

	for (auto _ : state)
	{
		benchmark::DoNotOptimize(sampler.sample());
		benchmark::DoNotOptimize(sampler.recent_error_rate());
	}

	state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Health Benchmarks
// ============================================================================

BENCHMARK_F(GuardBenchmarkFixture, BM_HealthEvaluation)(benchmark::State& state)
{
	health::health_evaluator evaluator;
	auto snapshot = metrics::make_snapshot(std::chrono::system_clock::now(), 97, 100, 12, 100,
										   250.0, false);

	for (auto _ : state)
	{
		auto report = evaluator.evaluate(snapshot, 0.12, resilience::breaker_state::open);
		benchmark::DoNotOptimize(report);
	}

	state.SetItemsProcessed(state.iterations());
}

static void BM_TrendAnalysis(benchmark::State& state)
{
	health::trend_analyzer analyzer;
	std::vector<metrics::pool_snapshot> history;
	for (int64_t i = 0; i < state.range(0); ++i)
	{
		history.push_back(metrics::make_snapshot(std::chrono::system_clock::now(), i % 20, 20,
												 static_cast<uint64_t>(i), static_cast<uint64_t>(i * 4),
												 10.0 + static_cast<double>(i % 7), true));
	}

	for (auto _ : state)
	{
		benchmark::DoNotOptimize(analyzer.analyze(history));
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TrendAnalysis)->Arg(10)->Arg(50)->Arg(100);

// ============================================================================
// Concurrency Benchmarks
// ============================================================================

static void BM_ConcurrentManagerCalls(benchmark::State& state)
{
	auto config = guard_config::defaults();
	config.monitoring_enabled = false;
	access_manager manager(config);

	const auto thread_count = static_cast<int>(state.range(0));
	constexpr int calls_per_thread = 1000;

	for (auto _ : state)
	{
		std::vector<std::thread> threads;
		threads.reserve(static_cast<size_t>(thread_count));

		for (int t = 0; t < thread_count; ++t)
		{
			threads.emplace_back(
				[&manager]()
				{
					for (int i = 0; i < calls_per_thread; ++i)
					{
						auto result = manager.execute("concurrent",
							[]() -> kcenon::common::Result<int> { return 1; });
						benchmark::DoNotOptimize(result);
					}
				});
		}

		for (auto& thread : threads)
		{
			thread.join();
		}
	}

	state.SetItemsProcessed(state.iterations() * thread_count * calls_per_thread);
}
BENCHMARK(BM_ConcurrentManagerCalls)
	->Arg(1)
	->Arg(4)
	->Arg(8)
	->Unit(benchmark::kMillisecond)
	->UseRealTime();

BENCHMARK_MAIN();
