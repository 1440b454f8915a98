/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <string>

#include <VideoPublisher/ContentPostingApi/ContentRange.hpp>
#include <VideoPublisher/ContentPostingApi/FailureClassifier.hpp>

using namespace VideoPublisher::ContentPostingApi;
using VideoPublisher::UploadCore::UploadErrorKind;

TEST(FailureClassifierTest, TokenKeywordsMeanAuthExpired)
{
	EXPECT_EQ(classifyFailure(400, "access_token_invalid"), UploadErrorKind::AuthExpired);
	EXPECT_EQ(classifyFailure(400, "ACCESS_TOKEN_EXPIRED"), UploadErrorKind::AuthExpired);
	EXPECT_EQ(classifyFailure(200, "scope_not_authorized_token"), UploadErrorKind::AuthExpired);
	EXPECT_EQ(classifyFailure(400, "invalid_params"), UploadErrorKind::AuthExpired);
}

TEST(FailureClassifierTest, Status401IsAlwaysAuthExpired)
{
	EXPECT_EQ(classifyFailure(401, ""), UploadErrorKind::AuthExpired);
	EXPECT_EQ(classifyFailure(401, "internal_error"), UploadErrorKind::AuthExpired);
}

TEST(FailureClassifierTest, OtherFailuresAreServerRejected)
{
	EXPECT_EQ(classifyFailure(500, "internal_error"), UploadErrorKind::ServerRejected);
	EXPECT_EQ(classifyFailure(429, "rate_limit_exceeded"), UploadErrorKind::ServerRejected);
	EXPECT_EQ(classifyFailure(403, "spam_risk_too_many_posts"), UploadErrorKind::ServerRejected);
}

TEST(FailureClassifierTest, ExtractsStructuredError)
{
	ApiError error = extractApiError(
		R"({"error":{"code":"access_token_invalid","message":"The access token is invalid","log_id":"LOG1"}})");
	EXPECT_EQ(error.code, "access_token_invalid");
	EXPECT_EQ(error.message, "The access token is invalid");
	EXPECT_EQ(error.logId, "LOG1");
}

TEST(FailureClassifierTest, FallsBackToTruncatedRawBody)
{
	const std::string body(2000, 'x');
	ApiError error = extractApiError(body);
	EXPECT_TRUE(error.code.empty());
	EXPECT_EQ(error.message.size(), kMaxErrorBodyLength);

	ApiError html = extractApiError("<html>Bad Gateway</html>");
	EXPECT_EQ(html.message, "<html>Bad Gateway</html>");
}

TEST(FailureClassifierTest, RawBodyIsClassifiedWhenThereIsNoCode)
{
	auto expired = makeRejectionError("ChunkTransmitter::send", 403, extractApiError("upload url expired"));
	EXPECT_EQ(expired.kind(), UploadErrorKind::AuthExpired);

	auto rejected = makeRejectionError("ChunkTransmitter::send", 500, extractApiError("Internal Server Error"));
	EXPECT_EQ(rejected.kind(), UploadErrorKind::ServerRejected);
	EXPECT_EQ(rejected.context().httpStatus, 500);
	EXPECT_EQ(rejected.context().serverMessage, "Internal Server Error");
}

TEST(ContentRangeTest, FormatsInclusiveRange)
{
	EXPECT_EQ(formatContentRange(0, 10485759, 26214400), "bytes 0-10485759/26214400");
}

TEST(ContentRangeTest, ParsesEchoedRange)
{
	auto range = parseContentRange("bytes 0-10485759/26214400");
	ASSERT_TRUE(range.has_value());
	EXPECT_EQ(range->firstByte, 0u);
	EXPECT_EQ(range->lastByte, 10485759u);
	EXPECT_EQ(range->totalSize, 26214400u);

	auto unknownTotal = parseContentRange(" bytes=100-199/* ");
	ASSERT_TRUE(unknownTotal.has_value());
	EXPECT_EQ(unknownTotal->lastByte, 199u);
	EXPECT_FALSE(unknownTotal->totalSize.has_value());

	auto withoutTotal = parseContentRange("bytes 0-12345");
	ASSERT_TRUE(withoutTotal.has_value());
	EXPECT_EQ(withoutTotal->firstByte, 0u);
	EXPECT_EQ(withoutTotal->lastByte, 12345u);
	EXPECT_FALSE(withoutTotal->totalSize.has_value());
}

TEST(ContentRangeTest, RejectsMalformedRanges)
{
	EXPECT_FALSE(parseContentRange("").has_value());
	EXPECT_FALSE(parseContentRange("bytes").has_value());
	EXPECT_FALSE(parseContentRange("items 0-1/2").has_value());
	EXPECT_FALSE(parseContentRange("bytes 10-5/20").has_value());
	EXPECT_FALSE(parseContentRange("bytes a-b/c").has_value());
	EXPECT_FALSE(parseContentRange("bytes 0-").has_value());
	EXPECT_FALSE(parseContentRange("bytes 0/5-9").has_value());
	EXPECT_FALSE(parseContentRange("bytes 0-5/12x").has_value());
}
