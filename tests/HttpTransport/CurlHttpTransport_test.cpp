/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

#include <VideoPublisher/CurlHelper/CurlHandle.hpp>
#include <VideoPublisher/CurlHelper/CurlHeaderCallback.hpp>
#include <VideoPublisher/HttpTransport/CurlHttpTransport.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

using namespace VideoPublisher::HttpTransport;
using VideoPublisher::CurlHelper::CurlHandle;
using VideoPublisher::UploadCore::UploadError;
using VideoPublisher::UploadCore::UploadErrorKind;

class CurlHttpTransportTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(CurlHttpTransportTest, NullCurlIsRejected)
{
	EXPECT_THROW({ CurlHttpTransport transport(nullptr); }, std::invalid_argument);
}

TEST_F(CurlHttpTransportTest, EmptyUrlIsInvalidInput)
{
	CurlHttpTransport transport(std::make_shared<CurlHandle>());
	try {
		(void)transport.post("", {}, "{}", HttpTimeouts{});
		FAIL() << "expected UploadError";
	} catch (const UploadError &e) {
		EXPECT_EQ(e.kind(), UploadErrorKind::InvalidInput);
	}
}

TEST_F(CurlHttpTransportTest, RefusedConnectionIsNetworkError)
{
	CurlHttpTransport transport(std::make_shared<CurlHandle>());
	const std::array<std::string, 1> headers{"Content-Type: video/mp4"};
	const std::string body(16, 'x');

	try {
		(void)transport.put("http://127.0.0.1:1/upload", headers, body, HttpTimeouts{std::chrono::seconds{2},
											   std::chrono::seconds{5}});
		FAIL() << "expected UploadError";
	} catch (const UploadError &e) {
		EXPECT_EQ(e.kind(), UploadErrorKind::NetworkError);
		EXPECT_EQ(e.where(), "CurlHttpTransport::put");
	}
}

TEST(HttpResponseTest, HeaderLookupIgnoresCase)
{
	HttpResponse response{206, {{"Content-Range", "bytes 0-9/20"}, {"X-Tt-Logid", "abc"}}, ""};
	EXPECT_EQ(response.header("content-range"), "bytes 0-9/20");
	EXPECT_EQ(response.header("X-TT-LOGID"), "abc");
	EXPECT_FALSE(response.header("Location").has_value());
}

TEST(CurlHeaderCallbackTest, CollectsTrimmedHeadersOfFinalResponse)
{
	VideoPublisher::CurlHelper::CurlHeaderList headers;
	auto feed = [&headers](std::string line) {
		return VideoPublisher::CurlHelper::CurlHeaderListCallback(line.data(), 1, line.size(), &headers);
	};

	feed("HTTP/1.1 100 Continue\r\n");
	feed("X-Interim: yes\r\n");
	feed("HTTP/1.1 206 Partial Content\r\n");
	feed("Content-Range:  bytes 0-9/20 \r\n");
	feed("\r\n");

	ASSERT_EQ(headers.size(), 1u);
	EXPECT_EQ(headers[0].first, "Content-Range");
	EXPECT_EQ(headers[0].second, "bytes 0-9/20");
}
