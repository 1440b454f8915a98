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

#include <VideoPublisher/UploadCore/UploadError.hpp>

using namespace VideoPublisher::UploadCore;

TEST(UploadErrorTest, MessageCarriesKindAndOperation)
{
	UploadError e(UploadErrorKind::EmptyFile, "UploadOrchestrator::run", "FileIsEmpty /tmp/a.mp4");
	EXPECT_STREQ(e.what(), "EmptyFile(UploadOrchestrator::run): FileIsEmpty /tmp/a.mp4");
	EXPECT_EQ(e.kind(), UploadErrorKind::EmptyFile);
	EXPECT_EQ(e.where(), "UploadOrchestrator::run");
	EXPECT_EQ(e.detail(), "FileIsEmpty /tmp/a.mp4");
}

TEST(UploadErrorTest, MessageCarriesServerContext)
{
	UploadErrorContext context;
	context.httpStatus = 401;
	context.serverCode = "access_token_invalid";
	context.serverMessage = "The access token is invalid";
	context.logId = "20250101ABCDEF";

	UploadError e(UploadErrorKind::AuthExpired, "SessionInitiator::open", "AccessTokenRejected", context);
	const std::string message = e.what();
	EXPECT_NE(message.find("AuthExpired(SessionInitiator::open)"), std::string::npos);
	EXPECT_NE(message.find("[http_status=401]"), std::string::npos);
	EXPECT_NE(message.find("[code=access_token_invalid]"), std::string::npos);
	EXPECT_NE(message.find("[log_id=20250101ABCDEF]"), std::string::npos);
}

TEST(UploadErrorTest, WithChunkAddsRangeAndKeepsEverythingElse)
{
	UploadErrorContext context;
	context.httpStatus = 500;
	UploadError base(UploadErrorKind::ServerRejected, "ChunkTransmitter::send", "RequestRejected", context);

	UploadError annotated = base.withChunk(2, 20971520, 31457279);
	EXPECT_EQ(annotated.kind(), UploadErrorKind::ServerRejected);
	EXPECT_EQ(annotated.where(), "ChunkTransmitter::send");
	EXPECT_EQ(annotated.context().httpStatus, 500);
	EXPECT_EQ(annotated.context().chunkIndex, 2u);
	EXPECT_EQ(annotated.context().firstByte, 20971520u);
	EXPECT_EQ(annotated.context().lastByte, 31457279u);
	EXPECT_NE(std::string(annotated.what()).find("[chunk=2] [bytes=20971520-31457279]"), std::string::npos);

	EXPECT_FALSE(base.context().chunkIndex.has_value());
}

TEST(UploadErrorTest, WithKindReplacesKindAndOperation)
{
	UploadErrorContext context;
	context.serverCode = "access_token_invalid";
	UploadError base(UploadErrorKind::AuthExpired, "SessionInitiator::open", "AccessTokenRejected", context);

	UploadError converted = base.withKind(UploadErrorKind::CredentialsExpired, "UploadOrchestrator::openSession");
	EXPECT_EQ(converted.kind(), UploadErrorKind::CredentialsExpired);
	EXPECT_EQ(converted.where(), "UploadOrchestrator::openSession");
	EXPECT_EQ(converted.detail(), "AccessTokenRejected");
	EXPECT_EQ(converted.context().serverCode, "access_token_invalid");
}

TEST(UploadErrorTest, IsARuntimeError)
{
	try {
		throw UploadError(UploadErrorKind::NetworkError, "CurlHttpTransport::put", "Timeout after 120s");
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "NetworkError(CurlHttpTransport::put): Timeout after 120s");
	}
}

TEST(UploadErrorTest, KindNames)
{
	EXPECT_EQ(toString(UploadErrorKind::InvalidInput), "InvalidInput");
	EXPECT_EQ(toString(UploadErrorKind::NotFound), "NotFound");
	EXPECT_EQ(toString(UploadErrorKind::CredentialsExpired), "CredentialsExpired");
	EXPECT_EQ(toString(UploadErrorKind::ProtocolViolation), "ProtocolViolation");
}
