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
 * @file command_line.h
 * @brief Argument parsing and route execution for the connection_guard tool
 */

#pragma once

#include <kcenon/connection_guard/core/guard_config.h>
#include <kcenon/connection_guard/reporting/admin_router.h>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace connection_guard::cli
{

using route = std::pair<std::string, std::string>; ///< METHOD, path

/**
 * @struct command_line_options
 * @brief Parsed command-line options
 */
struct command_line_options
{
	std::string config_path;
	std::string profile;
	std::vector<route> routes; ///< GET /config and GET /health when none given
	kcenon::common::interfaces::log_level level{ kcenon::common::interfaces::log_level::info };
	bool show_help{ false };
	bool show_version{ false };
};

/**
 * @brief Parse the tool's arguments
 * @return Options, or config_invalid naming the offending argument
 */
kcenon::common::Result<command_line_options> parse_command_line(int argc,
																 const char* const argv[]);

/**
 * @brief Build the configuration the options ask for
 *
 * With a file, the profile (if given) is the base the file's keys apply
 * to, so every key in the file still takes effect. Without a file, the
 * profile alone is used; with neither, the defaults.
 */
kcenon::common::Result<guard_config> resolve_config(const command_line_options& options);

/**
 * @brief Answer each route and print status and JSON body
 * @return 0 if every route answered 200, 1 otherwise
 */
int run_routes(reporting::admin_router& router,
			   const std::vector<route>& routes,
			   std::ostream& out);

void print_usage(const char* program_name, std::ostream& out);
void print_version(std::ostream& out);

} // namespace connection_guard::cli
