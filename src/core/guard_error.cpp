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

#include <kcenon/connection_guard/core/guard_error.h>

#include <sstream>
#include <string_view>

namespace connection_guard
{

kcenon::common::error_info make_guard_error(guard_error code,
											const std::string& message,
											const std::string& component)
{
	std::string module = GUARD_ERROR_MODULE;
	if (!component.empty())
	{
		module += "/" + component;
	}
	return kcenon::common::error_info{ static_cast<int>(code), message, module };
}

kcenon::common::error_info make_operation_failure(const std::string& operation_name,
												  uint32_t attempts,
												  const kcenon::common::error_info& cause)
{
	std::ostringstream message;
	message << "Operation '" << operation_name << "' failed after " << attempts
			<< (attempts == 1 ? " attempt: " : " attempts: ") << cause.message;

	std::ostringstream details;
	details << "cause[module=" << (cause.module.empty() ? "unknown" : cause.module)
			<< ", code=" << cause.code << "]: " << cause.message;

	auto error = make_guard_error(guard_error::operation_failed, message.str(),
								  "retry_executor");
	error.details = details.str();
	return error;
}

bool is_guard_error(const kcenon::common::error_info& error) noexcept
{
	const std::string_view prefix(GUARD_ERROR_MODULE);
	const std::string_view module(error.module);

	if (module.substr(0, prefix.size()) != prefix)
	{
		return false;
	}
	return module.size() == prefix.size() || module[prefix.size()] == '/';
}

bool has_code(const kcenon::common::error_info& error, guard_error code) noexcept
{
	return error.code == static_cast<int>(code) && is_guard_error(error);
}

} // namespace connection_guard
