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
 * @file admin_router.h
 * @brief Maps administrative HTTP-style requests onto an access_manager
 *
 * Routes:
 * - GET  /health                 health report
 * - GET  /stats                  current snapshot, history, trends
 * - GET  /performance            health report plus tuning suggestions
 * - GET  /config                 active configuration and executor settings
 * - POST /admin/reset-breaker    force the breaker closed
 * - POST /admin/profile/{name}   switch configuration profile
 *
 * Known routes answer 200 even when the pool is unhealthy; degradation is
 * reported in the body. The router has no transport of its own.
 */

#pragma once

#include <kcenon/connection_guard/access_manager.h>

#include <string>

#include <nlohmann/json.hpp>

namespace connection_guard::reporting
{

/**
 * @struct admin_response
 */
struct admin_response
{
	int status{ 200 };
	nlohmann::json body;

	[[nodiscard]] std::string content_type() const { return "application/json"; }
	[[nodiscard]] std::string serialize() const { return body.dump(); }
};

/**
 * @class admin_router
 * @brief Transport-less router for health and admin endpoints
 */
class admin_router
{
public:
	explicit admin_router(access_manager& manager);

	/**
	 * @brief Dispatch a request
	 * @param method HTTP method (case-sensitive, e.g. "GET")
	 * @param path Request path; a query string is ignored
	 * @return 200 for known routes, 400 for a rejected profile, 404 unknown
	 *         route, 405 known route with the wrong method
	 */
	[[nodiscard]] admin_response handle(const std::string& method, const std::string& path);

	static constexpr const char* PROFILE_PREFIX = "/admin/profile/";

private:
	admin_response handle_health() const;
	admin_response handle_stats() const;
	admin_response handle_performance() const;
	admin_response handle_config() const;
	admin_response handle_reset_breaker();
	admin_response handle_profile(const std::string& name);

	static admin_response error_response(int status, const std::string& message);

	access_manager& manager_;
};

} // namespace connection_guard::reporting
