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
 * @file main.cpp
 * @brief Connection guard command-line tool
 *
 * Loads a configuration (file and/or profile), builds an access manager
 * without a backend and answers administrative routes on stdout. Useful
 * to check a configuration file and to see the executor settings and
 * reports a deployment would produce.
 */

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/cli/command_line.h>
#include <kcenon/connection_guard/logging/console_logger.h>
#include <kcenon/connection_guard/reporting/admin_router.h>

#include <iostream>
#include <utility>

int main(int argc, char* argv[])
{
	namespace cli = connection_guard::cli;

	// Parse command-line arguments
	auto parsed = cli::parse_command_line(argc, argv);
	if (parsed.is_err())
	{
		std::cerr << parsed.error().message << "\n";
		std::cerr << "Use --help for usage information.\n";
		return 1;
	}

	const auto& options = parsed.value();
	if (options.show_help)
	{
		cli::print_usage(argv[0], std::cout);
		return 0;
	}
	if (options.show_version)
	{
		cli::print_version(std::cout);
		return 0;
	}

	auto logger = connection_guard::logging::create_console_logger("connection_guard",
																	 options.level);

	auto config = cli::resolve_config(options);
	if (config.is_err())
	{
		std::cerr << "Failed to load configuration: " << config.error().message << "\n";
		return 1;
	}

	auto created = connection_guard::access_manager::create(config.value());
	if (created.is_err())
	{
		std::cerr << "Failed to initialize: " << created.error().message << "\n";
		return 1;
	}

	auto manager = std::move(created.value());
	manager->set_logger(logger);
	manager->start();

	connection_guard::reporting::admin_router router(*manager);
	int exit_code = cli::run_routes(router, options.routes, std::cout);

	manager->stop();
	return exit_code;
}
