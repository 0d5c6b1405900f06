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

#include <kcenon/connection_guard/cli/command_line.h>

#include <kcenon/connection_guard/core/guard_error.h>

#include <cstring>

namespace connection_guard::cli
{

namespace
{

constexpr const char* VERSION = "0.1.0";

bool matches(const char* arg, const char* short_name, const char* long_name)
{
	return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

kcenon::common::error_info usage_error(const std::string& message)
{
	return make_guard_error(guard_error::config_invalid, message, "command_line");
}

} // namespace

kcenon::common::Result<command_line_options> parse_command_line(int argc,
																 const char* const argv[])
{
	command_line_options options;

	for (int i = 1; i < argc; ++i)
	{
		const char* arg = argv[i];

		if (matches(arg, "-h", "--help"))
		{
			options.show_help = true;
			return options;
		}

		if (matches(arg, "-v", "--version"))
		{
			options.show_version = true;
			return options;
		}

		if (matches(arg, "-c", "--config"))
		{
			if (i + 1 >= argc)
			{
				return usage_error(std::string("Missing value for ") + arg);
			}
			options.config_path = argv[++i];
			continue;
		}

		if (matches(arg, "-p", "--profile"))
		{
			if (i + 1 >= argc)
			{
				return usage_error(std::string("Missing value for ") + arg);
			}
			options.profile = argv[++i];
			continue;
		}

		if (matches(arg, "-r", "--route"))
		{
			if (i + 2 >= argc)
			{
				return usage_error(std::string(arg) + " expects METHOD and path");
			}
			std::string method = argv[++i];
			std::string path = argv[++i];
			options.routes.emplace_back(method, path);
			continue;
		}

		if (std::strcmp(arg, "--debug") == 0)
		{
			options.level = kcenon::common::interfaces::log_level::debug;
			continue;
		}

		return usage_error(std::string("Unknown option: ") + arg);
	}

	if (options.routes.empty())
	{
		options.routes.emplace_back("GET", "/config");
		options.routes.emplace_back("GET", "/health");
	}

	return options;
}

kcenon::common::Result<guard_config> resolve_config(const command_line_options& options)
{
	if (!options.config_path.empty())
	{
		std::optional<std::string> base;
		if (!options.profile.empty())
		{
			base = options.profile;
		}
		return guard_config::load_from_file(options.config_path, base);
	}

	if (!options.profile.empty())
	{
		return guard_config::for_profile(options.profile);
	}

	return guard_config::defaults();
}

int run_routes(reporting::admin_router& router,
			   const std::vector<route>& routes,
			   std::ostream& out)
{
	int exit_code = 0;
	for (const auto& [method, path] : routes)
	{
		auto response = router.handle(method, path);
		out << method << " " << path << " -> " << response.status << "\n";
		out << response.body.dump(2) << "\n";
		if (response.status != 200)
		{
			exit_code = 1;
		}
	}
	return exit_code;
}

void print_usage(const char* program_name, std::ostream& out)
{
	out << "Connection Guard v" << VERSION << "\n\n";
	out << "Usage: " << program_name << " [options]\n\n";
	out << "Options:\n";
	out << "  -c, --config <file>      Load configuration from file\n";
	out << "  -p, --profile <name>     Use a named profile (default, development, production);\n";
	out << "                           with --config, the base the file's keys apply to\n";
	out << "  -r, --route <METHOD> <path>  Answer an admin route (repeatable)\n";
	out << "      --debug              Enable debug logging\n";
	out << "  -h, --help               Show this help message\n";
	out << "  -v, --version            Show version information\n";
	out << "\n";
	out << "Without --route, prints GET /config and GET /health.\n";
	out << "\n";
	out << "Configuration file format (key=value):\n";
	out << "  profile=production\n";
	out << "  pool.max_connections=20\n";
	out << "  retry.max_retries=5\n";
	out << "  breaker.cooldown_ms=300000\n";
}

void print_version(std::ostream& out)
{
	out << "Connection Guard v" << VERSION << "\n";
	out << "Part of the kcenon unified system\n";
}

} // namespace connection_guard::cli
