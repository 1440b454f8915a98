/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <functional>

#include <VideoPublisher/UploadCore/ChunkPlanner.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

using namespace VideoPublisher::UploadCore;

namespace {

UploadErrorKind kindOf(const std::function<void()> &fn)
{
	try {
		fn();
	} catch (const UploadError &e) {
		return e.kind();
	}
	ADD_FAILURE() << "expected UploadError";
	return UploadErrorKind::ProtocolViolation;
}

void expectContiguousCover(const UploadPlan &plan)
{
	std::uint64_t expectedFirst = 0;
	for (std::uint64_t i = 0; i < plan.chunkCount; ++i) {
		ChunkRange range = chunkRangeAt(plan, i);
		EXPECT_EQ(range.index, i);
		EXPECT_EQ(range.firstByte, expectedFirst);
		EXPECT_GE(range.lastByte, range.firstByte);
		expectedFirst = range.lastByte + 1;
	}
	EXPECT_EQ(expectedFirst, plan.totalSize);
}

} // namespace

TEST(ChunkPlannerTest, SmallFileIsSingleChunk)
{
	UploadPlan plan = planChunks(3 * kMiB);
	EXPECT_EQ(plan.chunkSize, 3 * kMiB);
	EXPECT_EQ(plan.chunkCount, 1u);
	EXPECT_EQ(plan.lastChunkSize(), 3 * kMiB);
}

TEST(ChunkPlannerTest, OneByteFileIsSingleChunk)
{
	UploadPlan plan = planChunks(1);
	EXPECT_EQ(plan, (UploadPlan{1, 1, 1}));
	EXPECT_EQ(chunkRangeAt(plan, 0), (ChunkRange{0, 0, 0}));
}

TEST(ChunkPlannerTest, FileAtSingleChunkLimitIsSingleChunk)
{
	UploadPlan plan = planChunks(64 * kMiB);
	EXPECT_EQ(plan.chunkCount, 1u);
	EXPECT_EQ(plan.chunkSize, 64 * kMiB);
}

TEST(ChunkPlannerTest, FileAboveSingleChunkLimitUsesDefaultChunkSize)
{
	const std::uint64_t total = 64 * kMiB + 1;
	UploadPlan plan = planChunks(total);
	EXPECT_EQ(plan.chunkSize, 10 * kMiB);
	EXPECT_EQ(plan.chunkCount, 6u);
	EXPECT_EQ(plan.lastChunkSize(), 14 * kMiB + 1);
	expectContiguousCover(plan);
}

TEST(ChunkPlannerTest, RemainderIsAbsorbedIntoLastChunk)
{
	ChunkPlanLimits limits;
	limits.singleChunkLimit = 5 * kMiB;

	UploadPlan plan = planChunks(25 * kMiB, limits);
	EXPECT_EQ(plan.chunkSize, 10 * kMiB);
	EXPECT_EQ(plan.chunkCount, 2u);
	EXPECT_EQ(plan.lastChunkSize(), 15 * kMiB);

	EXPECT_EQ(chunkRangeAt(plan, 0), (ChunkRange{0, 0, 10 * kMiB - 1}));
	EXPECT_EQ(chunkRangeAt(plan, 1), (ChunkRange{1, 10 * kMiB, 25 * kMiB - 1}));
}

TEST(ChunkPlannerTest, LastChunkStaysBelowTwiceTheChunkSize)
{
	for (std::uint64_t total : {65 * kMiB, 99 * kMiB + 12345, 1000 * kMiB, 4096 * kMiB + 7}) {
		UploadPlan plan = planChunks(total);
		EXPECT_LE(plan.chunkSize * plan.chunkCount, total);
		EXPECT_LT(total, plan.chunkSize * (plan.chunkCount + 1));
		EXPECT_GE(plan.lastChunkSize(), plan.chunkSize);
		EXPECT_LT(plan.lastChunkSize(), 2 * plan.chunkSize);
		expectContiguousCover(plan);
	}
}

TEST(ChunkPlannerTest, ChunkSizeGrowsWhenCountWouldExceedLimit)
{
	const std::uint64_t total = 20000 * kMiB;
	UploadPlan plan = planChunks(total);
	EXPECT_EQ(plan.chunkSize, 20 * kMiB);
	EXPECT_EQ(plan.chunkCount, 1000u);
	expectContiguousCover(plan);
}

TEST(ChunkPlannerTest, FileTooLargeForLimitsIsRejected)
{
	const std::uint64_t total = 64 * kMiB * 1001;
	EXPECT_EQ(kindOf([&] { (void)planChunks(total); }), UploadErrorKind::InvalidInput);
}

TEST(ChunkPlannerTest, ZeroSizeIsInvalidInput)
{
	EXPECT_EQ(kindOf([] { (void)planChunks(0); }), UploadErrorKind::InvalidInput);
}

TEST(ChunkPlannerTest, PlanningIsDeterministic)
{
	EXPECT_EQ(planChunks(123 * kMiB + 45), planChunks(123 * kMiB + 45));
}

TEST(ChunkPlannerTest, UnorderedLimitsAreRejected)
{
	ChunkPlanLimits limits;
	limits.minChunkSize = 20 * kMiB;
	EXPECT_EQ(kindOf([&] { validateChunkPlanLimits(limits); }), UploadErrorKind::InvalidInput);

	ChunkPlanLimits zeroCount;
	zeroCount.maxChunkCount = 0;
	EXPECT_EQ(kindOf([&] { (void)planChunks(100 * kMiB, zeroCount); }), UploadErrorKind::InvalidInput);
}

TEST(ChunkPlannerTest, ChunkRangeOutsidePlanIsRejected)
{
	UploadPlan plan = planChunks(100 * kMiB);
	EXPECT_EQ(kindOf([&] { (void)chunkRangeAt(plan, plan.chunkCount); }), UploadErrorKind::InvalidInput);
}
