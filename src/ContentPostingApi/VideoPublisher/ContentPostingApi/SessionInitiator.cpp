/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher ContentPostingApi Library
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

#include "SessionInitiator.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <VideoPublisher/Logger/NullLogger.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

#include "FailureClassifier.hpp"

namespace VideoPublisher::ContentPostingApi {

using UploadCore::UploadError;
using UploadCore::UploadErrorKind;

SessionInitiator::SessionInitiator(std::shared_ptr<HttpTransport::IHttpTransport> transport,
				   ContentPostingEndpoints endpoints, HttpTransport::HttpTimeouts timeouts,
				   std::shared_ptr<const Logger::ILogger> logger)
	: transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(SessionInitiator)")),
	  endpoints_(std::move(endpoints)),
	  timeouts_(timeouts),
	  logger_(Logger::orNullLogger(std::move(logger)))
{
}

SessionInitiator::~SessionInitiator() noexcept = default;

const std::string &SessionInitiator::initUrlFor(UploadMode mode) const noexcept
{
	return mode == UploadMode::DirectPost ? endpoints_.directPostInitUrl : endpoints_.inboxInitUrl;
}

UploadSession SessionInitiator::open(const ContentPostingAuth::Credentials &credentials,
				     const UploadCore::UploadPlan &plan, UploadMode mode,
				     const std::optional<PostMetadata> &metadata) const
{
	constexpr const char *where = "SessionInitiator::open";

	if (credentials.accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "AccessTokenIsEmpty");
	}
	if (plan.totalSize == 0 || plan.chunkSize == 0 || plan.chunkCount == 0) {
		logger_->error("UploadPlanIsEmptyError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "UploadPlanIsEmpty");
	}
	if (mode == UploadMode::DirectPost && !metadata.has_value()) {
		logger_->error("PostMetadataIsMissingError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "DirectPostRequiresMetadata");
	}
	if (mode == UploadMode::Inbox && metadata.has_value()) {
		logger_->error("PostMetadataNotAllowedError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "InboxDoesNotAcceptMetadata");
	}
	if (metadata.has_value()) {
		validatePostMetadata(*metadata);
	}

	const std::string &url = initUrlFor(mode);
	const std::string body = nlohmann::json(InitRequest{plan, metadata}).dump();

	const std::array<std::string, 2> headers{
		fmt::format("Authorization: Bearer {}", credentials.accessToken),
		"Content-Type: application/json; charset=UTF-8",
	};

	logger_->info("OpeningUploadSession", {{"mode", toString(mode)},
					       {"videoSize", std::to_string(plan.totalSize)},
					       {"chunkSize", std::to_string(plan.chunkSize)},
					       {"chunkCount", std::to_string(plan.chunkCount)}});

	HttpTransport::HttpResponse response = transport_->post(url, headers, body, timeouts_);

	nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		if (response.statusCode >= 200 && response.statusCode < 300) {
			logger_->error("InitResponseParseError", {{"status", std::to_string(response.statusCode)}});
			throw UploadError(UploadErrorKind::NetworkError, where, "MalformedInitResponse",
					  {.httpStatus = response.statusCode});
		}
		throw makeRejectionError(where, response.statusCode, extractApiError(response.body));
	}

	InitResponse init;
	try {
		init = j.get<InitResponse>();
	} catch (const nlohmann::json::exception &e) {
		logger_->logException(e, "InitResponseShapeError");
		throw UploadError(UploadErrorKind::NetworkError, where,
				  fmt::format("MalformedInitResponse: {}", e.what()), {.httpStatus = response.statusCode});
	}

	if (!init.error.isOk()) {
		logger_->error("InitRejected", {{"status", std::to_string(response.statusCode)},
						{"code", init.error.code},
						{"message", init.error.message},
						{"logId", init.error.logId}});
		ApiError apiError = init.error;
		if (apiError.code.empty() && apiError.message.empty()) {
			apiError = extractApiError(response.body);
		}
		throw makeRejectionError(where, response.statusCode, apiError);
	}

	if (init.publishId.empty() || init.uploadUrl.empty()) {
		logger_->error("InitResponseIncompleteError", {{"logId", init.error.logId}});
		UploadCore::UploadErrorContext context;
		context.httpStatus = response.statusCode;
		context.serverCode = init.error.code;
		context.logId = init.error.logId;
		throw UploadError(UploadErrorKind::ProtocolViolation, where, "InitResponseMissingPublishIdOrUploadUrl",
				  std::move(context));
	}

	logger_->info("UploadSessionOpened", {{"publishId", init.publishId}, {"logId", init.error.logId}});

	UploadSession session;
	session.publishId = std::move(init.publishId);
	session.uploadUrl = std::move(init.uploadUrl);
	session.plan = plan;
	session.bytesAcknowledged = 0;
	session.mode = mode;
	session.postMetadata = metadata;
	return session;
}

} // namespace VideoPublisher::ContentPostingApi
