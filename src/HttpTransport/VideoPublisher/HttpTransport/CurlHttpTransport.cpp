/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher HttpTransport Library
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

#include "CurlHttpTransport.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <VideoPublisher/CurlHelper/CurlHeaderCallback.hpp>
#include <VideoPublisher/CurlHelper/CurlSlistHandle.hpp>
#include <VideoPublisher/CurlHelper/CurlWriteCallback.hpp>
#include <VideoPublisher/Logger/NullLogger.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

namespace VideoPublisher::HttpTransport {

namespace {

using UploadCore::UploadError;
using UploadCore::UploadErrorKind;

CurlHelper::CurlSlistHandle makeHeaderList(std::span<const std::string> headers)
{
	CurlHelper::CurlSlistHandle list;
	for (const std::string &line : headers) {
		list.append(line);
	}
	return list;
}

HttpResponse doRequest(CURL *curl, const char *where, const std::string &url, curl_slist *headers,
		       std::span<const char> body, bool isPut, const HttpTimeouts &timeouts,
		       const Logger::ILogger &logger)
{
	if (url.empty()) {
		logger.error("UrlIsEmptyError", {{"where", where}});
		throw UploadError(UploadErrorKind::InvalidInput, where, "UrlIsEmpty");
	}

	CurlHelper::CurlStringWriteBuffer responseBody;
	CurlHelper::CurlHeaderList responseHeaders;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	if (isPut) {
		curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
	} else {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
	}
	// A null POSTFIELDS would make libcurl fall back to the read callback.
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.empty() ? "" : body.data());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderListCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeouts.connect.count()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeouts.total.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

	CURLcode res = curl_easy_perform(curl);

	if (res == CURLE_OPERATION_TIMEDOUT) {
		logger.error("CurlTimeoutError", {{"where", where}, {"error", curl_easy_strerror(res)}});
		throw UploadError(UploadErrorKind::NetworkError, where,
				  fmt::format("Timeout after {}s", timeouts.total.count()));
	}
	if (res != CURLE_OK) {
		logger.error("CurlPerformError", {{"where", where}, {"error", curl_easy_strerror(res)}});
		throw UploadError(UploadErrorKind::NetworkError, where,
				  fmt::format("CurlPerformError: {}", curl_easy_strerror(res)));
	}

	long statusCode = 0;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);

	if (responseBody.discarded > 0) {
		logger.warn("ResponseBodyTruncated", {{"where", where},
						      {"discardedBytes", std::to_string(responseBody.discarded)}});
	}

	return HttpResponse{statusCode, std::move(responseHeaders), std::move(responseBody.data)};
}

} // anonymous namespace

CurlHttpTransport::CurlHttpTransport(std::shared_ptr<CurlHelper::CurlHandle> curl,
				     std::shared_ptr<const Logger::ILogger> logger)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(CurlHttpTransport)")),
	  logger_(Logger::orNullLogger(std::move(logger)))
{
}

CurlHttpTransport::~CurlHttpTransport() noexcept = default;

HttpResponse CurlHttpTransport::post(const std::string &url, std::span<const std::string> headers,
				     std::string_view body, const HttpTimeouts &timeouts)
{
	CurlHelper::CurlSlistHandle headerList = makeHeaderList(headers);

	return doRequest(curl_->reset(), "CurlHttpTransport::post", url, headerList.get(),
			 std::span<const char>(body.data(), body.size()), false, timeouts, *logger_);
}

HttpResponse CurlHttpTransport::put(const std::string &url, std::span<const std::string> headers,
				    std::span<const char> body, const HttpTimeouts &timeouts)
{
	CurlHelper::CurlSlistHandle headerList = makeHeaderList(headers);
	headerList.append("Expect:"); // no 100-continue round trip per chunk

	return doRequest(curl_->reset(), "CurlHttpTransport::put", url, headerList.get(), body, true, timeouts,
			 *logger_);
}

} // namespace VideoPublisher::HttpTransport
