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

#include <kcenon/connection_guard/reporting/admin_router.h>
#include <kcenon/connection_guard/reporting/json_report.h>

#include <chrono>

namespace connection_guard::reporting
{

namespace
{

std::string strip_query(const std::string& path)
{
	auto pos = path.find('?');
	auto stripped = pos == std::string::npos ? path : path.substr(0, pos);
	while (stripped.size() > 1 && stripped.back() == '/')
	{
		stripped.pop_back();
	}
	return stripped;
}

std::string now_timestamp()
{
	return format_timestamp(std::chrono::system_clock::now());
}

} // namespace

// ============================================================================
// admin_router
// ============================================================================

admin_router::admin_router(access_manager& manager) : manager_(manager) {}

admin_response admin_router::handle(const std::string& method, const std::string& path)
{
	auto route = strip_query(path);

	if (route == "/health" || route == "/stats" || route == "/performance"
		|| route == "/config")
	{
		if (method != "GET")
		{
			return error_response(405, "Method not allowed: " + method + " " + route);
		}

		if (route == "/health")
			return handle_health();
		if (route == "/stats")
			return handle_stats();
		if (route == "/performance")
			return handle_performance();
		return handle_config();
	}

	if (route == "/admin/reset-breaker")
	{
		if (method != "POST")
		{
			return error_response(405, "Method not allowed: " + method + " " + route);
		}
		return handle_reset_breaker();
	}

	std::string prefix(PROFILE_PREFIX);
	if (route.compare(0, prefix.size(), prefix) == 0 && route.size() > prefix.size())
	{
		if (method != "POST")
		{
			return error_response(405, "Method not allowed: " + method + " " + route);
		}
		return handle_profile(route.substr(prefix.size()));
	}

	return error_response(404, "Unknown route: " + method + " " + route);
}

admin_response admin_router::handle_health() const
{
	admin_response response;
	response.body = manager_.health();
	response.body["timestamp"] = now_timestamp();
	return response;
}

admin_response admin_router::handle_stats() const
{
	admin_response response;
	response.body = manager_.statistics();
	response.body["operations"] = manager_.operation_statistics();
	response.body["timestamp"] = now_timestamp();
	return response;
}

admin_response admin_router::handle_performance() const
{
	admin_response response;
	response.body = manager_.review_performance();
	response.body["timestamp"] = now_timestamp();
	return response;
}

admin_response admin_router::handle_config() const
{
	admin_response response;
	response.body = nlohmann::json{ { "config", manager_.config() },
									{ "executor_settings", manager_.executor_settings() } };
	return response;
}

admin_response admin_router::handle_reset_breaker()
{
	manager_.reset_circuit_breaker();

	admin_response response;
	response.body = nlohmann::json{
		{ "success", true },
		{ "message", "Circuit breaker reset" },
		{ "state", resilience::to_string(manager_.breaker_statistics().state) },
		{ "timestamp", now_timestamp() }
	};
	return response;
}

admin_response admin_router::handle_profile(const std::string& name)
{
	auto result = manager_.configure_profile(name);
	if (result.is_err())
	{
		return error_response(400, result.error().message);
	}

	admin_response response;
	response.body = nlohmann::json{ { "success", true },
									{ "profile", name },
									{ "config", manager_.config() },
									{ "timestamp", now_timestamp() } };
	return response;
}

admin_response admin_router::error_response(int status, const std::string& message)
{
	admin_response response;
	response.status = status;
	response.body = nlohmann::json{ { "success", false }, { "error", message } };
	return response;
}

} // namespace connection_guard::reporting
