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

#include <memory>

#include <VideoPublisher/CurlHelper/CurlHandle.hpp>
#include <VideoPublisher/Logger/ILogger.hpp>

#include "IHttpTransport.hpp"

namespace VideoPublisher::HttpTransport {

/**
 * IHttpTransport on top of one libcurl easy handle.
 *
 * The caller must run curl_global_init once at startup. An instance is not
 * thread-safe; give each concurrent upload its own transport.
 */
class CurlHttpTransport final : public IHttpTransport {
public:
	explicit CurlHttpTransport(std::shared_ptr<CurlHelper::CurlHandle> curl,
				   std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~CurlHttpTransport() noexcept override;

	HttpResponse post(const std::string &url, std::span<const std::string> headers, std::string_view body,
			  const HttpTimeouts &timeouts) override;

	HttpResponse put(const std::string &url, std::span<const std::string> headers, std::span<const char> body,
			 const HttpTimeouts &timeouts) override;

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace VideoPublisher::HttpTransport
