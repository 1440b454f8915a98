/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher UploadCore Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <cstdint>

namespace VideoPublisher::UploadCore {

inline constexpr std::uint64_t kMiB = 1024 * 1024;

/**
 * Chunk constraints imposed by the remote API.
 *
 * Files up to `singleChunkLimit` go up in one request. Larger files are split
 * into `defaultChunkSize` pieces, growing the piece size when that would need
 * more than `maxChunkCount` requests.
 */
struct ChunkPlanLimits {
	std::uint64_t minChunkSize = 5 * kMiB;
	std::uint64_t maxChunkSize = 64 * kMiB;
	std::uint64_t defaultChunkSize = 10 * kMiB;
	std::uint64_t maxChunkCount = 1000;
	std::uint64_t hardChunkCeiling = 128 * kMiB;
	std::uint64_t singleChunkLimit = 64 * kMiB;
};

struct UploadPlan {
	std::uint64_t totalSize = 0;
	std::uint64_t chunkSize = 0;
	std::uint64_t chunkCount = 0;

	[[nodiscard]]
	std::uint64_t lastChunkSize() const noexcept
	{
		return totalSize - chunkSize * (chunkCount - 1);
	}

	bool operator==(const UploadPlan &) const = default;
};

struct ChunkRange {
	std::uint64_t index = 0;
	std::uint64_t firstByte = 0;
	std::uint64_t lastByte = 0;

	[[nodiscard]]
	std::uint64_t length() const noexcept
	{
		return lastByte - firstByte + 1;
	}

	bool operator==(const ChunkRange &) const = default;
};

// Throws UploadError(InvalidInput) when the limits contradict each other.
void validateChunkPlanLimits(const ChunkPlanLimits &limits);

/**
 * Maps a file size to the chunk size and exact chunk count that must be
 * declared when a session is opened.
 *
 * The count is floor(totalSize / chunkSize) and the remainder rides along with
 * the last chunk, which is how the server computes it.
 *
 * @throw UploadError InvalidInput when totalSize is zero or the file cannot be
 * expressed within the limits.
 */
[[nodiscard]]
UploadPlan planChunks(std::uint64_t totalSize, const ChunkPlanLimits &limits = {});

/**
 * Byte range of chunk `index`. The final chunk always ends at totalSize - 1.
 *
 * @throw UploadError InvalidInput when index is outside the plan.
 */
[[nodiscard]]
ChunkRange chunkRangeAt(const UploadPlan &plan, std::uint64_t index);

} // namespace VideoPublisher::UploadCore
