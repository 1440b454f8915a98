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

#include "CredentialRefresher.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <VideoPublisher/CurlHelper/CurlHandle.hpp>
#include <VideoPublisher/CurlHelper/CurlUrlSearchParams.hpp>
#include <VideoPublisher/Logger/NullLogger.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

#include "TokenResponse.hpp"

namespace VideoPublisher::ContentPostingAuth {

using UploadCore::UploadError;
using UploadCore::UploadErrorKind;

CredentialRefresher::CredentialRefresher(std::shared_ptr<HttpTransport::IHttpTransport> transport,
					 std::string tokenUrl, HttpTransport::HttpTimeouts timeouts,
					 std::shared_ptr<const Logger::ILogger> logger)
	: transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(CredentialRefresher)")),
	  tokenUrl_(!tokenUrl.empty() ? std::move(tokenUrl)
				      : throw std::invalid_argument("TokenUrlIsEmptyError(CredentialRefresher)")),
	  timeouts_(timeouts),
	  logger_(Logger::orNullLogger(std::move(logger)))
{
}

CredentialRefresher::~CredentialRefresher() noexcept = default;

std::optional<Credentials> CredentialRefresher::refresh(const std::string &clientKey,
							 const std::string &clientSecret,
							 const std::string &refreshToken) const
{
	if (clientKey.empty() || clientSecret.empty()) {
		logger_->error("ClientCredentialsMissingError");
		throw UploadError(UploadErrorKind::InvalidInput, "CredentialRefresher::refresh",
				  "ClientCredentialsMissing");
	}
	if (refreshToken.empty()) {
		logger_->error("RefreshTokenIsEmptyError");
		throw UploadError(UploadErrorKind::InvalidInput, "CredentialRefresher::refresh", "RefreshTokenIsEmpty");
	}

	// Only used for percent-encoding; no transfer runs on this handle.
	CurlHelper::CurlHandle escaper;
	CurlHelper::CurlUrlSearchParams form(escaper.get());
	form.append("client_key", clientKey);
	form.append("client_secret", clientSecret);
	form.append("grant_type", "refresh_token");
	form.append("refresh_token", refreshToken);
	const std::string body = form.toString();

	const std::array<std::string, 2> headers{
		"Content-Type: application/x-www-form-urlencoded",
		"Cache-Control: no-cache",
	};

	logger_->info("RefreshingAccessToken", {{"tokenUrl", tokenUrl_}});
	HttpTransport::HttpResponse response = transport_->post(tokenUrl_, headers, body, timeouts_);

	nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		logger_->error("TokenResponseParseError", {{"status", std::to_string(response.statusCode)}});
		throw UploadError(UploadErrorKind::NetworkError, "CredentialRefresher::refresh",
				  "MalformedTokenResponse", {.httpStatus = response.statusCode});
	}

	TokenResponse token;
	try {
		token = j.get<TokenResponse>();
	} catch (const nlohmann::json::exception &e) {
		logger_->logException(e, "TokenResponseShapeError");
		throw UploadError(UploadErrorKind::NetworkError, "CredentialRefresher::refresh",
				  fmt::format("MalformedTokenResponse: {}", e.what()), {.httpStatus = response.statusCode});
	}

	if (!token.access_token.has_value() || token.access_token->empty()) {
		logger_->warn("RefreshRejected", {{"status", std::to_string(response.statusCode)},
						  {"error", token.error.value_or("")},
						  {"description", token.error_description.value_or("")},
						  {"logId", token.log_id.value_or("")}});
		return std::nullopt;
	}

	Credentials refreshed;
	refreshed.accessToken = std::move(*token.access_token);
	if (token.refresh_token.has_value() && !token.refresh_token->empty()) {
		refreshed.refreshToken = std::move(*token.refresh_token);
	} else {
		refreshed.refreshToken = refreshToken;
	}

	logger_->info("AccessTokenRefreshed", {{"rotatedRefreshToken", token.refresh_token ? "true" : "false"},
					       {"expiresIn", std::to_string(token.expires_in.value_or(0))}});
	return refreshed;
}

} // namespace VideoPublisher::ContentPostingAuth
