/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher ContentPostingAuth Library
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
#include <optional>
#include <string>

#include <VideoPublisher/HttpTransport/IHttpTransport.hpp>
#include <VideoPublisher/Logger/ILogger.hpp>

#include "Credentials.hpp"

namespace VideoPublisher::ContentPostingAuth {

/**
 * Mints a new access token from a refresh token using the standard
 * refresh_token grant against the authorization server's token endpoint.
 *
 * Persisting the result is left to the caller.
 */
class CredentialRefresher {
public:
	CredentialRefresher(std::shared_ptr<HttpTransport::IHttpTransport> transport, std::string tokenUrl,
			    HttpTransport::HttpTimeouts timeouts, std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~CredentialRefresher() noexcept;

	CredentialRefresher(const CredentialRefresher &) = delete;
	CredentialRefresher &operator=(const CredentialRefresher &) = delete;
	CredentialRefresher(CredentialRefresher &&) = delete;
	CredentialRefresher &operator=(CredentialRefresher &&) = delete;

	/**
	 * @return New credentials, or std::nullopt when the server answered
	 * without an access token (revoked or expired refresh token). When the
	 * server does not rotate the refresh token the old one is carried over.
	 * @throw UploadError InvalidInput for empty arguments, NetworkError when
	 * no parseable answer arrived.
	 */
	[[nodiscard]]
	std::optional<Credentials> refresh(const std::string &clientKey, const std::string &clientSecret,
					   const std::string &refreshToken) const;

private:
	const std::shared_ptr<HttpTransport::IHttpTransport> transport_;
	const std::string tokenUrl_;
	const HttpTransport::HttpTimeouts timeouts_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace VideoPublisher::ContentPostingAuth
