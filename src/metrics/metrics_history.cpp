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

#include <kcenon/connection_guard/metrics/metrics_history.h>

#include <algorithm>

namespace connection_guard::metrics
{

metrics_history::metrics_history(size_t capacity) : capacity_(std::max<size_t>(capacity, 1))
{
}

void metrics_history::push(const pool_snapshot& snapshot)
{
	entries_.push_back(snapshot);
	evict();
}

void metrics_history::set_capacity(size_t capacity)
{
	capacity_ = std::max<size_t>(capacity, 1);
	evict();
}

std::vector<pool_snapshot> metrics_history::all() const
{
	return { entries_.begin(), entries_.end() };
}

std::vector<pool_snapshot> metrics_history::tail(size_t count) const
{
	auto n = std::min(count, entries_.size());
	return { entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end() };
}

std::optional<pool_snapshot> metrics_history::latest() const
{
	return from_back(0);
}

std::optional<pool_snapshot> metrics_history::from_back(size_t offset) const
{
	if (offset >= entries_.size())
	{
		return std::nullopt;
	}
	return entries_[entries_.size() - 1 - offset];
}

void metrics_history::evict()
{
	while (entries_.size() > capacity_)
	{
		last_evicted_ = entries_.front();
		entries_.pop_front();
	}
}

} // namespace connection_guard::metrics
