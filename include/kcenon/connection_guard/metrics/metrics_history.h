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
 * @file metrics_history.h
 * @brief Bounded FIFO of pool snapshots
 */

#pragma once

#include "pool_snapshot.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace connection_guard::metrics
{

/**
 * @class metrics_history
 * @brief Ring buffer keeping the most recent N snapshots
 *
 * Not synchronized: the owning metrics_sampler serializes access.
 * Readers receive copies, ordered oldest first (most recent last).
 */
class metrics_history
{
public:
	explicit metrics_history(size_t capacity = 100);

	/**
	 * @brief Append a snapshot, evicting the oldest when full
	 */
	void push(const pool_snapshot& snapshot);

	/**
	 * @brief Change capacity, evicting the oldest entries if it shrinks
	 * @param capacity New capacity (0 is treated as 1)
	 */
	void set_capacity(size_t capacity);

	[[nodiscard]] std::vector<pool_snapshot> all() const;

	/**
	 * @brief The last count snapshots (fewer if not available)
	 */
	[[nodiscard]] std::vector<pool_snapshot> tail(size_t count) const;

	[[nodiscard]] std::optional<pool_snapshot> latest() const;

	/**
	 * @brief Snapshot count back from the newest (0 = newest)
	 */
	[[nodiscard]] std::optional<pool_snapshot> from_back(size_t offset) const;

	/**
	 * @brief The most recently evicted snapshot, if any was evicted
	 *
	 * Serves as the baseline for counter deltas over the whole history.
	 */
	[[nodiscard]] std::optional<pool_snapshot> last_evicted() const { return last_evicted_; }

	[[nodiscard]] size_t size() const noexcept { return entries_.size(); }
	[[nodiscard]] size_t capacity() const noexcept { return capacity_; }
	[[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

	void clear() noexcept
	{
		entries_.clear();
		last_evicted_.reset();
	}

private:
	void evict();

	size_t capacity_;
	std::deque<pool_snapshot> entries_;
	std::optional<pool_snapshot> last_evicted_;
};

} // namespace connection_guard::metrics
