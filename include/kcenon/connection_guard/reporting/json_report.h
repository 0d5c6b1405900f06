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
 * @file json_report.h
 * @brief nlohmann::json conversions for health and statistics reports
 *
 * The to_json overloads live in the namespaces of the reported types so
 * that `nlohmann::json j = report;` finds them.
 */

#pragma once

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/core/guard_config.h>
#include <kcenon/connection_guard/health/health_evaluator.h>
#include <kcenon/connection_guard/health/trend_analyzer.h>
#include <kcenon/connection_guard/metrics/pool_snapshot.h>
#include <kcenon/connection_guard/resilience/circuit_breaker.h>
#include <kcenon/connection_guard/resilience/retry_executor.h>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace connection_guard::reporting
{

/**
 * @brief Format a time point as ISO-8601 UTC with milliseconds
 * @return e.g. "2024-05-01T12:30:00.250Z"
 */
std::string format_timestamp(std::chrono::system_clock::time_point time);

} // namespace connection_guard::reporting

namespace connection_guard::metrics
{

void to_json(nlohmann::json& j, const pool_snapshot& snapshot);

} // namespace connection_guard::metrics

namespace connection_guard::health
{

void to_json(nlohmann::json& j, const health_report& report);
void to_json(nlohmann::json& j, const trend_report& trends);

} // namespace connection_guard::health

namespace connection_guard::resilience
{

void to_json(nlohmann::json& j, const breaker_stats& stats);
void to_json(nlohmann::json& j, const operation_stats& stats);

} // namespace connection_guard::resilience

namespace connection_guard
{

void to_json(nlohmann::json& j, const guard_config& config);
void to_json(nlohmann::json& j, const executor_pool_settings& settings);
void to_json(nlohmann::json& j, const pool_statistics& stats);
void to_json(nlohmann::json& j, const performance_review& review);

} // namespace connection_guard
