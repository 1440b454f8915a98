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

#pragma once

#include <span>
#include <string>
#include <string_view>

#include "HttpTypes.hpp"

namespace VideoPublisher::HttpTransport {

/**
 * Blocking HTTP client used by the upload protocol.
 *
 * Implementations return every response that reached the client, whatever
 * its status code, and throw UploadCore::UploadError(NetworkError) when no
 * response arrived (connection failure, timeout, aborted body).
 *
 * Header lines are passed verbatim, e.g. "Content-Type: video/mp4".
 */
class IHttpTransport {
public:
	IHttpTransport() noexcept = default;
	virtual ~IHttpTransport() = default;

	IHttpTransport(const IHttpTransport &) = delete;
	IHttpTransport &operator=(const IHttpTransport &) = delete;
	IHttpTransport(IHttpTransport &&) = delete;
	IHttpTransport &operator=(IHttpTransport &&) = delete;

	virtual HttpResponse post(const std::string &url, std::span<const std::string> headers, std::string_view body,
				  const HttpTimeouts &timeouts) = 0;

	virtual HttpResponse put(const std::string &url, std::span<const std::string> headers,
				 std::span<const char> body, const HttpTimeouts &timeouts) = 0;
};

} // namespace VideoPublisher::HttpTransport
