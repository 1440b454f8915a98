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

#pragma once

#include <memory>
#include <optional>

#include <VideoPublisher/ContentPostingAuth/Credentials.hpp>
#include <VideoPublisher/HttpTransport/IHttpTransport.hpp>
#include <VideoPublisher/Logger/ILogger.hpp>
#include <VideoPublisher/UploadCore/ChunkPlanner.hpp>

#include "ContentPostingTypes.hpp"

namespace VideoPublisher::ContentPostingApi {

/**
 * Opens an upload session by declaring the video size and chunk layout to
 * the init endpoint of the chosen mode, and receives the publish id and the
 * upload URL every chunk is sent to.
 */
class SessionInitiator {
public:
	SessionInitiator(std::shared_ptr<HttpTransport::IHttpTransport> transport, ContentPostingEndpoints endpoints,
			 HttpTransport::HttpTimeouts timeouts, std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~SessionInitiator() noexcept;

	SessionInitiator(const SessionInitiator &) = delete;
	SessionInitiator &operator=(const SessionInitiator &) = delete;
	SessionInitiator(SessionInitiator &&) = delete;
	SessionInitiator &operator=(SessionInitiator &&) = delete;

	/**
	 * DirectPost requires metadata and Inbox rejects it.
	 *
	 * @throw UploadError InvalidInput before any request is made when the
	 * arguments do not fit the mode; AuthExpired or ServerRejected when the
	 * server answered with an error; ProtocolViolation when an accepted
	 * answer lacks publish_id or upload_url; NetworkError from the transport
	 * or when an accepted answer cannot be parsed.
	 */
	[[nodiscard]]
	UploadSession open(const ContentPostingAuth::Credentials &credentials, const UploadCore::UploadPlan &plan,
			   UploadMode mode, const std::optional<PostMetadata> &metadata) const;

	[[nodiscard]]
	const std::string &initUrlFor(UploadMode mode) const noexcept;

private:
	const std::shared_ptr<HttpTransport::IHttpTransport> transport_;
	const ContentPostingEndpoints endpoints_;
	const HttpTransport::HttpTimeouts timeouts_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace VideoPublisher::ContentPostingApi
