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

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <VideoPublisher/ContentPostingApi/ChunkTransmitter.hpp>
#include <VideoPublisher/ContentPostingApi/ContentPostingTypes.hpp>
#include <VideoPublisher/ContentPostingApi/SessionInitiator.hpp>
#include <VideoPublisher/ContentPostingAuth/CredentialRefresher.hpp>
#include <VideoPublisher/ContentPostingAuth/Credentials.hpp>
#include <VideoPublisher/HttpTransport/IHttpTransport.hpp>
#include <VideoPublisher/Logger/ILogger.hpp>
#include <VideoPublisher/UploadCore/ChunkPlanner.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

#include "UploadProgress.hpp"
#include "UploaderConfig.hpp"

namespace VideoPublisher::Uploader {

/**
 * Drives one upload from a file on disk to a publish id:
 * plan the chunks, open a session, then PUT every chunk in order.
 *
 * An AuthExpired answer to the session request triggers one credential
 * refresh and one more attempt. Nothing else is retried; every other failure
 * reaches the caller as an UploadError, annotated with the chunk index and
 * byte range when it happened during transmission.
 *
 * The instance keeps no per-upload state, so run() may be called repeatedly.
 * It is not thread-safe because the transport is not.
 */
class UploadOrchestrator {
public:
	UploadOrchestrator(std::shared_ptr<HttpTransport::IHttpTransport> transport, UploaderConfig config,
			   UploadOrchestratorCallback callback = {},
			   std::shared_ptr<const Logger::ILogger> logger = nullptr,
			   UploadCore::ChunkPlanLimits limits = {});

	~UploadOrchestrator() noexcept;

	UploadOrchestrator(const UploadOrchestrator &) = delete;
	UploadOrchestrator &operator=(const UploadOrchestrator &) = delete;
	UploadOrchestrator(UploadOrchestrator &&) = delete;
	UploadOrchestrator &operator=(UploadOrchestrator &&) = delete;

	/**
	 * @return The publish id assigned by the server.
	 * @throw UploadError of any kind; see UploadErrorKind.
	 */
	[[nodiscard]]
	std::string run(const ContentPostingAuth::Credentials &credentials, const std::filesystem::path &filePath,
			ContentPostingApi::UploadMode mode,
			const std::optional<ContentPostingApi::PostMetadata> &metadata) const;

private:
	ContentPostingApi::UploadSession openSession(const ContentPostingAuth::Credentials &credentials,
						     const UploadCore::UploadPlan &plan,
						     ContentPostingApi::UploadMode mode,
						     const std::optional<ContentPostingApi::PostMetadata> &metadata) const;

	ContentPostingAuth::Credentials refreshCredentials(const ContentPostingAuth::Credentials &current,
							   const UploadCore::UploadError &cause) const;

	void transmitChunks(ContentPostingApi::UploadSession &session, const std::filesystem::path &filePath) const;

	void reportProgress(const ContentPostingApi::UploadSession &session, std::uint64_t chunksDone) const;

	const UploaderConfig config_;
	const UploadOrchestratorCallback callback_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const UploadCore::ChunkPlanLimits limits_;

	const ContentPostingApi::SessionInitiator initiator_;
	const ContentPostingApi::ChunkTransmitter transmitter_;
	const ContentPostingAuth::CredentialRefresher refresher_;
};

} // namespace VideoPublisher::Uploader
