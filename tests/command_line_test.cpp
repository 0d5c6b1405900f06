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
 * @file command_line_test.cpp
 * @brief Unit tests for the connection_guard tool's argument handling
 *
 * Tests cover:
 * - Option parsing and usage errors
 * - Configuration resolution from file and profile
 * - Route execution and exit code
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <kcenon/connection_guard/access_manager.h>
#include <kcenon/connection_guard/cli/command_line.h>
#include <kcenon/connection_guard/core/guard_error.h>
#include <kcenon/connection_guard/reporting/admin_router.h>

using namespace connection_guard;
using namespace connection_guard::cli;
using namespace std::chrono_literals;

namespace
{

kcenon::common::Result<command_line_options> parse(std::vector<const char*> args)
{
	args.insert(args.begin(), "connection_guard");
	return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

class CommandLineParseTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(CommandLineParseTest, DefaultsToConfigAndHealthRoutes)
{
	auto result = parse({});
	ASSERT_TRUE(result.is_ok());

	const auto& options = result.value();
	EXPECT_TRUE(options.config_path.empty());
	EXPECT_TRUE(options.profile.empty());
	ASSERT_EQ(options.routes.size(), 2u);
	EXPECT_EQ(options.routes[0], route("GET", "/config"));
	EXPECT_EQ(options.routes[1], route("GET", "/health"));
	EXPECT_EQ(options.level, kcenon::common::interfaces::log_level::info);
}

TEST_F(CommandLineParseTest, ParsesAllOptions)
{
	auto result = parse({ "--config", "guard.conf", "-p", "production", "-r", "POST",
						  "/admin/reset-breaker", "--route", "GET", "/stats", "--debug" });
	ASSERT_TRUE(result.is_ok());

	const auto& options = result.value();
	EXPECT_EQ(options.config_path, "guard.conf");
	EXPECT_EQ(options.profile, "production");
	ASSERT_EQ(options.routes.size(), 2u);
	EXPECT_EQ(options.routes[0], route("POST", "/admin/reset-breaker"));
	EXPECT_EQ(options.routes[1], route("GET", "/stats"));
	EXPECT_EQ(options.level, kcenon::common::interfaces::log_level::debug);
}

TEST_F(CommandLineParseTest, HelpAndVersion)
{
	EXPECT_TRUE(parse({ "-h" }).value().show_help);
	EXPECT_TRUE(parse({ "--version" }).value().show_version);
}

TEST_F(CommandLineParseTest, UnknownOptionRejected)
{
	auto result = parse({ "--verbose" });
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), guard_error::config_invalid));
	EXPECT_NE(result.error().message.find("--verbose"), std::string::npos);
}

TEST_F(CommandLineParseTest, MissingValuesRejected)
{
	EXPECT_TRUE(parse({ "--config" }).is_err());
	EXPECT_TRUE(parse({ "-p" }).is_err());
	EXPECT_TRUE(parse({ "-r", "GET" }).is_err());
}

// ============================================================================
// Configuration Resolution
// ============================================================================

class CommandLineConfigTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = std::filesystem::temp_directory_path()
				/ ("command_line_test_"
				   + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_"
				   + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove(path_, ec);
	}

	void write(const std::string& content)
	{
		std::ofstream out(path_);
		out << content;
	}

	std::filesystem::path path_;
};

TEST_F(CommandLineConfigTest, NoOptionsGivesDefaults)
{
	auto config = resolve_config(command_line_options{});
	ASSERT_TRUE(config.is_ok());
	EXPECT_EQ(config.value().profile, "default");
	EXPECT_EQ(config.value().max_connections, 10);
}

TEST_F(CommandLineConfigTest, ProfileOnly)
{
	command_line_options options;
	options.profile = "development";

	auto config = resolve_config(options);
	ASSERT_TRUE(config.is_ok());
	EXPECT_EQ(config.value().max_connections, 5);
}

TEST_F(CommandLineConfigTest, ProfileIsBaseForFileOverrides)
{
	write("profile=development\n"
		  "pool.max_connections=42\n"
		  "retry.base_delay_ms=250\n");

	command_line_options options;
	options.config_path = path_.string();
	options.profile = "production";

	auto result = resolve_config(options);
	ASSERT_TRUE(result.is_ok()) << result.error().message;

	const auto& config = result.value();
	// Base profile from the command line
	EXPECT_EQ(config.profile, "production");
	EXPECT_EQ(config.max_retries, 5);
	EXPECT_EQ(config.circuit_breaker_cooldown, 300000ms);
	// Every key from the file still applies
	EXPECT_EQ(config.max_connections, 42);
	EXPECT_EQ(config.retry_base_delay, 250ms);
}

TEST_F(CommandLineConfigTest, UnknownProfileWithFile)
{
	write("pool.max_connections=42\n");

	command_line_options options;
	options.config_path = path_.string();
	options.profile = "staging";

	auto result = resolve_config(options);
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), guard_error::unknown_profile));
}

// ============================================================================
// Route Execution
// ============================================================================

class CommandLineRoutesTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		manager_ = std::make_unique<access_manager>(guard_config::defaults());
		router_ = std::make_unique<reporting::admin_router>(*manager_);
	}

	void TearDown() override
	{
		router_.reset();
		manager_.reset();
	}

	std::unique_ptr<access_manager> manager_;
	std::unique_ptr<reporting::admin_router> router_;
};

TEST_F(CommandLineRoutesTest, AllRoutesAnsweredGivesZero)
{
	std::ostringstream out;
	int exit_code = run_routes(*router_, { { "GET", "/config" }, { "GET", "/health" } }, out);

	EXPECT_EQ(exit_code, 0);
	EXPECT_NE(out.str().find("GET /config -> 200"), std::string::npos);
	EXPECT_NE(out.str().find("GET /health -> 200"), std::string::npos);
}

TEST_F(CommandLineRoutesTest, FailedRouteGivesOne)
{
	std::ostringstream out;
	int exit_code = run_routes(*router_,
							   { { "GET", "/health" }, { "GET", "/missing" },
								 { "POST", "/admin/profile/staging" } },
							   out);

	EXPECT_EQ(exit_code, 1);
	EXPECT_NE(out.str().find("GET /missing -> 404"), std::string::npos);
	EXPECT_NE(out.str().find("POST /admin/profile/staging -> 400"), std::string::npos);
}
