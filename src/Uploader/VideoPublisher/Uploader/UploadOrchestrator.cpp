/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher Uploader Library
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

#include "UploadOrchestrator.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <VideoPublisher/Logger/NullLogger.hpp>

namespace VideoPublisher::Uploader {

using ContentPostingApi::PostMetadata;
using ContentPostingApi::UploadMode;
using ContentPostingApi::UploadSession;
using ContentPostingAuth::Credentials;
using UploadCore::UploadError;
using UploadCore::UploadErrorKind;

namespace {

UploaderConfig validatedConfig(UploaderConfig config)
{
	validateUploaderConfig(config);
	return config;
}

UploadCore::ChunkPlanLimits validatedLimits(UploadCore::ChunkPlanLimits limits)
{
	UploadCore::validateChunkPlanLimits(limits);
	return limits;
}

} // anonymous namespace

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<HttpTransport::IHttpTransport> transport,
				       UploaderConfig config, UploadOrchestratorCallback callback,
				       std::shared_ptr<const Logger::ILogger> logger, UploadCore::ChunkPlanLimits limits)
	: config_(validatedConfig(std::move(config))),
	  callback_(std::move(callback)),
	  logger_(Logger::orNullLogger(std::move(logger))),
	  limits_(validatedLimits(limits)),
	  initiator_(transport, config_.endpoints, config_.sessionTimeouts(), logger_),
	  transmitter_(transport, config_.chunkTimeoutPolicy(), logger_),
	  refresher_(std::move(transport), config_.endpoints.tokenUrl, config_.sessionTimeouts(), logger_)
{
}

UploadOrchestrator::~UploadOrchestrator() noexcept = default;

std::string UploadOrchestrator::run(const Credentials &credentials, const std::filesystem::path &filePath,
				    UploadMode mode, const std::optional<PostMetadata> &metadata) const
{
	constexpr const char *where = "UploadOrchestrator::run";

	if (mode == UploadMode::DirectPost && !metadata.has_value()) {
		logger_->error("PostMetadataIsMissingError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "DirectPostRequiresMetadata");
	}
	if (mode == UploadMode::Inbox && metadata.has_value()) {
		logger_->error("PostMetadataNotAllowedError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "InboxDoesNotAcceptMetadata");
	}
	if (credentials.accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "AccessTokenIsEmpty");
	}

	std::error_code ec;
	if (!std::filesystem::is_regular_file(filePath, ec)) {
		logger_->error("FileNotFoundError", {{"path", filePath.string()}});
		throw UploadError(UploadErrorKind::NotFound, where, fmt::format("FileNotFound {}", filePath.string()));
	}

	const std::uintmax_t fileSize = std::filesystem::file_size(filePath, ec);
	if (ec) {
		logger_->error("FileSizeError", {{"path", filePath.string()}, {"error", ec.message()}});
		throw UploadError(UploadErrorKind::NotFound, where,
				  fmt::format("FileSizeUnavailable {}: {}", filePath.string(), ec.message()));
	}
	if (fileSize == 0) {
		logger_->error("FileIsEmptyError", {{"path", filePath.string()}});
		throw UploadError(UploadErrorKind::EmptyFile, where, fmt::format("FileIsEmpty {}", filePath.string()));
	}

	const UploadCore::UploadPlan plan = UploadCore::planChunks(fileSize, limits_);
	logger_->info("UploadPlanned", {{"path", filePath.string()},
					{"totalSize", std::to_string(plan.totalSize)},
					{"chunkSize", std::to_string(plan.chunkSize)},
					{"chunkCount", std::to_string(plan.chunkCount)}});

	UploadSession session = openSession(credentials, plan, mode, metadata);
	reportProgress(session, 0);

	transmitChunks(session, filePath);
	if (!session.isComplete()) {
		logger_->error("UploadIncompleteError", {{"publishId", session.publishId},
							 {"bytesAcknowledged", std::to_string(session.bytesAcknowledged)},
							 {"totalSize", std::to_string(session.plan.totalSize)}});
		throw UploadError(UploadErrorKind::ProtocolViolation, where,
				  fmt::format("UploadIncomplete acknowledged={} total={}", session.bytesAcknowledged,
					      session.plan.totalSize));
	}

	logger_->info("UploadCompleted", {{"publishId", session.publishId},
					  {"bytesAcknowledged", std::to_string(session.bytesAcknowledged)}});
	return session.publishId;
}

UploadSession UploadOrchestrator::openSession(const Credentials &credentials, const UploadCore::UploadPlan &plan,
					      UploadMode mode, const std::optional<PostMetadata> &metadata) const
{
	std::optional<UploadError> authFailure;
	try {
		return initiator_.open(credentials, plan, mode, metadata);
	} catch (const UploadError &e) {
		if (e.kind() != UploadErrorKind::AuthExpired) {
			throw;
		}
		logger_->warn("SessionAuthExpired", {{"code", e.context().serverCode}, {"logId", e.context().logId}});
		authFailure.emplace(e);
	}

	const Credentials refreshed = refreshCredentials(credentials, *authFailure);

	try {
		return initiator_.open(refreshed, plan, mode, metadata);
	} catch (const UploadError &e) {
		if (e.kind() != UploadErrorKind::AuthExpired) {
			throw;
		}
		logger_->error("RefreshedTokenRejected", {{"code", e.context().serverCode}});
		throw e.withKind(UploadErrorKind::CredentialsExpired, "UploadOrchestrator::openSession");
	}
}

Credentials UploadOrchestrator::refreshCredentials(const Credentials &current, const UploadError &cause) const
{
	constexpr const char *where = "UploadOrchestrator::refreshCredentials";

	if (!current.canRefresh()) {
		logger_->error("RefreshTokenMissingError");
		throw UploadError(UploadErrorKind::CredentialsExpired, where, "NoRefreshToken", cause.context());
	}
	if (!config_.clientCredentials.has_value() || !config_.clientCredentials->isComplete()) {
		logger_->error("ClientCredentialsMissingError");
		throw UploadError(UploadErrorKind::CredentialsExpired, where, "ClientCredentialsMissing",
				  cause.context());
	}

	std::optional<Credentials> refreshed;
	try {
		refreshed = refresher_.refresh(config_.clientCredentials->clientKey,
					       config_.clientCredentials->clientSecret, *current.refreshToken);
	} catch (const UploadError &e) {
		logger_->logException(e, "RefreshFailedError");
		throw e.withKind(UploadErrorKind::CredentialsExpired, where);
	}

	if (!refreshed.has_value()) {
		logger_->error("RefreshRejectedError");
		throw UploadError(UploadErrorKind::CredentialsExpired, where, "RefreshRejected", cause.context());
	}

	if (callback_.onCredentialStore) {
		callback_.onCredentialStore(ContentPostingAuth::kAccessTokenKey, refreshed->accessToken);
		if (refreshed->refreshToken.has_value()) {
			callback_.onCredentialStore(ContentPostingAuth::kRefreshTokenKey, *refreshed->refreshToken);
		}
	}

	logger_->info("CredentialsRefreshed");
	return *std::move(refreshed);
}

void UploadOrchestrator::transmitChunks(UploadSession &session, const std::filesystem::path &filePath) const
{
	constexpr const char *where = "UploadOrchestrator::transmitChunks";

	std::ifstream ifs(filePath, std::ios::binary);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", filePath.string()}});
		throw UploadError(UploadErrorKind::NotFound, where, fmt::format("FileOpenFailed {}", filePath.string()));
	}

	std::vector<char> buffer;

	for (std::uint64_t index = 0; index < session.plan.chunkCount; ++index) {
		const UploadCore::ChunkRange range = UploadCore::chunkRangeAt(session.plan, index);
		const std::uint64_t length = range.length();

		buffer.resize(static_cast<std::size_t>(length));
		ifs.read(buffer.data(), static_cast<std::streamsize>(length));
		const std::uint64_t bytesRead = static_cast<std::uint64_t>(ifs.gcount());
		if (bytesRead != length) {
			logger_->error("ShortReadError", {{"chunkIndex", std::to_string(index)},
							  {"expected", std::to_string(length)},
							  {"actual", std::to_string(bytesRead)}});
			throw UploadError(UploadErrorKind::InvalidInput, where,
					  fmt::format("FileShrankDuringUpload expected={} read={}", length, bytesRead))
				.withChunk(index, range.firstByte, range.lastByte);
		}

		std::uint64_t acknowledged = 0;
		try {
			acknowledged = transmitter_.send(session.uploadUrl, buffer, range.firstByte, range.lastByte,
							 session.plan.totalSize);
		} catch (const UploadError &e) {
			logger_->error("ChunkFailed", {{"publishId", session.publishId},
						       {"chunkIndex", std::to_string(index)},
						       {"kind", toString(e.kind())}});
			throw e.withChunk(index, range.firstByte, range.lastByte);
		}

		if (acknowledged < range.lastByte + 1) {
			logger_->error("AcknowledgedFewerBytesError", {{"chunkIndex", std::to_string(index)},
								       {"acknowledged", std::to_string(acknowledged)}});
			throw UploadError(UploadErrorKind::ProtocolViolation, where,
					  fmt::format("AcknowledgedFewerBytesThanSent acknowledged={} sent={}", acknowledged,
						      range.lastByte + 1))
				.withChunk(index, range.firstByte, range.lastByte);
		}

		session.bytesAcknowledged = acknowledged;
		logger_->info("ChunkAcknowledged", {{"publishId", session.publishId},
						    {"chunk", fmt::format("{}/{}", index + 1, session.plan.chunkCount)},
						    {"bytesAcknowledged", std::to_string(acknowledged)}});
		reportProgress(session, index + 1);
	}
}

void UploadOrchestrator::reportProgress(const UploadSession &session, std::uint64_t chunksDone) const
{
	if (!callback_.onProgress)
		return;

	callback_.onProgress(UploadProgress{.publishId = session.publishId,
					    .chunkIndex = chunksDone,
					    .chunkCount = session.plan.chunkCount,
					    .bytesAcknowledged = session.bytesAcknowledged,
					    .totalSize = session.plan.totalSize});
}

} // namespace VideoPublisher::Uploader
