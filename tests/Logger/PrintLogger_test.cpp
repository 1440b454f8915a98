/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include <VideoPublisher/Logger/NullLogger.hpp>
#include <VideoPublisher/Logger/PrintLogger.hpp>

using namespace VideoPublisher::Logger;

TEST(PrintLoggerTest, WritesNameAndFieldsAsTabSeparatedPairs)
{
	std::ostringstream out;
	PrintLogger logger(out);

	logger.info("UploadSessionOpened", {{"publishId", "v_pub_1"}, {"logId", "L"}});

	const std::string line = out.str();
	EXPECT_EQ(line.rfind("level=INFO\tname=UploadSessionOpened\tlocation=", 0), 0u);
	EXPECT_NE(line.find("\tpublishId=v_pub_1\tlogId=L\n"), std::string::npos);
}

TEST(PrintLoggerTest, DropsEntriesBelowMinimumLevel)
{
	std::ostringstream out;
	PrintLogger logger(out, LogLevel::Warn);

	logger.debug("ChunkAccepted");
	logger.info("ChunkAcknowledged");
	logger.warn("RefreshRejected");
	logger.error("ChunkRejected");

	const std::string text = out.str();
	EXPECT_EQ(text.find("ChunkAccepted"), std::string::npos);
	EXPECT_EQ(text.find("ChunkAcknowledged"), std::string::npos);
	EXPECT_NE(text.find("level=WARN\tname=RefreshRejected"), std::string::npos);
	EXPECT_NE(text.find("level=ERROR\tname=ChunkRejected"), std::string::npos);
}

TEST(PrintLoggerTest, LogsExceptionMessage)
{
	std::ostringstream out;
	PrintLogger logger(out);

	logger.logException(std::runtime_error("boom"), "RefreshFailedError");

	EXPECT_NE(out.str().find("name=RefreshFailedError"), std::string::npos);
	EXPECT_NE(out.str().find("\texception=boom"), std::string::npos);
}

TEST(NullLoggerTest, FallbackIsSharedInstance)
{
	auto fallback = orNullLogger(nullptr);
	ASSERT_NE(fallback, nullptr);
	EXPECT_EQ(fallback, NullLogger::instance());
	fallback->error("Ignored", {{"key", "value"}});

	auto printLogger = std::make_shared<PrintLogger>();
	EXPECT_EQ(orNullLogger(printLogger), printLogger);
}
