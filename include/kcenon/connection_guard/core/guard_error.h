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
 * @file guard_error.h
 * @brief Error codes reported by the connection guard
 *
 * All fallible calls return kcenon::common::Result / VoidResult. The codes
 * below identify which part of the access layer produced the error so that
 * callers can tell load shedding (circuit_open) apart from a database that
 * is actually failing (operation_failed).
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <string>

namespace connection_guard
{

/// Module of every guard error; components append "/<component>"
constexpr const char* GUARD_ERROR_MODULE = "connection_guard";

/**
 * @enum guard_error
 * @brief Error codes for the connection guard (module "connection_guard")
 */
enum class guard_error : int
{
	config_invalid = -700,   ///< Configuration rejected at construction
	unknown_profile = -701,  ///< Named profile does not exist
	circuit_open = -702,     ///< Breaker is open, no attempt was made
	operation_failed = -703, ///< All attempts failed, cause kept in details
	aborted = -704,          ///< Executor shut down before the call finished
	no_backend = -705        ///< Query helper used without a backend
};

/**
 * @brief Converts guard_error to its string name.
 */
constexpr const char* to_string(guard_error code) noexcept
{
	switch (code)
	{
	case guard_error::config_invalid:
		return "config_invalid";
	case guard_error::unknown_profile:
		return "unknown_profile";
	case guard_error::circuit_open:
		return "circuit_open";
	case guard_error::operation_failed:
		return "operation_failed";
	case guard_error::aborted:
		return "aborted";
	case guard_error::no_backend:
		return "no_backend";
	default:
		return "unknown";
	}
}

/**
 * @brief Build an error_info for a guard error
 * @param code Error code
 * @param message Human readable message
 * @param component Reporting component; the module becomes
 *        "connection_guard/<component>"
 */
kcenon::common::error_info make_guard_error(guard_error code,
											const std::string& message,
											const std::string& component = "");

/**
 * @brief Wrap the last underlying failure into an operation_failed error
 * @param operation_name Logical operation name
 * @param attempts Number of attempts made
 * @param cause Error of the final attempt
 *
 * The cause's module, code and message are kept in the details field.
 */
kcenon::common::error_info make_operation_failure(const std::string& operation_name,
												  uint32_t attempts,
												  const kcenon::common::error_info& cause);

/**
 * @brief Whether error was produced by the connection guard
 */
[[nodiscard]] bool is_guard_error(const kcenon::common::error_info& error) noexcept;

/**
 * @brief Whether error is the guard error code
 *
 * Both code and module must match, so a backend error that happens to use
 * the same number is not mistaken for a guard error.
 */
[[nodiscard]] bool has_code(const kcenon::common::error_info& error,
							guard_error code) noexcept;

[[nodiscard]] inline bool is_circuit_open(const kcenon::common::error_info& error) noexcept
{
	return has_code(error, guard_error::circuit_open);
}

[[nodiscard]] inline bool is_aborted(const kcenon::common::error_info& error) noexcept
{
	return has_code(error, guard_error::aborted);
}

[[nodiscard]] inline bool is_operation_failure(
	const kcenon::common::error_info& error) noexcept
{
	return has_code(error, guard_error::operation_failed);
}

} // namespace connection_guard
