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

#include "ChunkPlanner.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "UploadError.hpp"

namespace VideoPublisher::UploadCore {

namespace {

constexpr std::uint64_t ceilDiv(std::uint64_t numerator, std::uint64_t denominator) noexcept
{
	return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

} // anonymous namespace

void validateChunkPlanLimits(const ChunkPlanLimits &limits)
{
	const bool ordered = limits.minChunkSize > 0 && limits.minChunkSize <= limits.defaultChunkSize &&
			     limits.defaultChunkSize <= limits.maxChunkSize &&
			     limits.maxChunkSize <= limits.hardChunkCeiling;
	if (!ordered) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::validateChunkPlanLimits",
				  fmt::format("ChunkSizeLimitsUnordered min={} default={} max={} ceiling={}",
					      limits.minChunkSize, limits.defaultChunkSize, limits.maxChunkSize,
					      limits.hardChunkCeiling));
	}
	if (limits.maxChunkCount == 0) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::validateChunkPlanLimits",
				  "MaxChunkCountIsZero");
	}
	if (limits.singleChunkLimit == 0 || limits.singleChunkLimit > limits.hardChunkCeiling) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::validateChunkPlanLimits",
				  fmt::format("SingleChunkLimitOutOfRange limit={} ceiling={}", limits.singleChunkLimit,
					      limits.hardChunkCeiling));
	}
}

UploadPlan planChunks(std::uint64_t totalSize, const ChunkPlanLimits &limits)
{
	validateChunkPlanLimits(limits);

	if (totalSize == 0) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::planChunks", "TotalSizeIsZero");
	}

	if (totalSize <= limits.singleChunkLimit) {
		return UploadPlan{totalSize, totalSize, 1};
	}

	std::uint64_t chunkSize = limits.defaultChunkSize;
	std::uint64_t chunkCount = totalSize / chunkSize;

	if (chunkCount > limits.maxChunkCount) {
		chunkSize = std::clamp(ceilDiv(totalSize, limits.maxChunkCount), limits.minChunkSize,
				       limits.maxChunkSize);
		chunkCount = totalSize / chunkSize;
		if (chunkCount > limits.maxChunkCount) {
			throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::planChunks",
					  fmt::format("FileTooLarge size={} maxChunkSize={} maxChunkCount={}", totalSize,
						      limits.maxChunkSize, limits.maxChunkCount));
		}
	}

	if (chunkCount == 0) {
		// Only reachable when singleChunkLimit is below defaultChunkSize.
		return UploadPlan{totalSize, totalSize, 1};
	}

	UploadPlan plan{totalSize, chunkSize, chunkCount};
	if (plan.lastChunkSize() > limits.hardChunkCeiling) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::planChunks",
				  fmt::format("FinalChunkExceedsCeiling size={} lastChunk={} ceiling={}", totalSize,
					      plan.lastChunkSize(), limits.hardChunkCeiling));
	}

	return plan;
}

ChunkRange chunkRangeAt(const UploadPlan &plan, std::uint64_t index)
{
	if (plan.chunkCount == 0 || index >= plan.chunkCount) {
		throw UploadError(UploadErrorKind::InvalidInput, "ChunkPlanner::chunkRangeAt",
				  fmt::format("ChunkIndexOutOfRange index={} count={}", index, plan.chunkCount));
	}

	const std::uint64_t firstByte = index * plan.chunkSize;
	const bool isLast = index + 1 == plan.chunkCount;
	const std::uint64_t lastByte = isLast ? plan.totalSize - 1 : firstByte + plan.chunkSize - 1;

	return ChunkRange{index, firstByte, lastByte};
}

} // namespace VideoPublisher::UploadCore
