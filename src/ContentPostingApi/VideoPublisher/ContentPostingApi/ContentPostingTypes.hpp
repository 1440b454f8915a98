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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <VideoPublisher/UploadCore/ChunkPlanner.hpp>

namespace VideoPublisher::ContentPostingApi {

struct ContentPostingEndpoints {
	std::string inboxInitUrl = "https://open.tiktokapis.com/v2/post/publish/inbox/video/init/";
	std::string directPostInitUrl = "https://open.tiktokapis.com/v2/post/publish/video/init/";
	std::string tokenUrl = "https://open.tiktokapis.com/v2/oauth/token/";
};

void to_json(nlohmann::json &j, const ContentPostingEndpoints &p);
void from_json(const nlohmann::json &j, ContentPostingEndpoints &p);

// Inbox drops the video into the creator's drafts; DirectPost publishes it.
enum class UploadMode { Inbox, DirectPost };

[[nodiscard]]
std::string_view toString(UploadMode mode) noexcept;

enum class PrivacyLevel { PublicToEveryone, MutualFollowFriends, FollowerOfCreator, SelfOnly };

[[nodiscard]]
std::string_view toString(PrivacyLevel level) noexcept;

[[nodiscard]]
std::optional<PrivacyLevel> parsePrivacyLevel(std::string_view text) noexcept;

struct PostMetadata {
	std::string title;
	PrivacyLevel privacyLevel = PrivacyLevel::SelfOnly;
	bool disableDuet = false;
	bool disableStitch = false;
	bool disableComment = false;
	std::optional<std::uint64_t> videoCoverTimestampMs;
	bool brandContentToggle = false;
	bool brandOrganicToggle = false;
};

void to_json(nlohmann::json &j, const PostMetadata &p);
void from_json(const nlohmann::json &j, PostMetadata &p);

inline constexpr std::size_t kMaxTitleCodePoints = 2200;

// Throws UploadError(InvalidInput) for metadata the server is known to refuse.
void validatePostMetadata(const PostMetadata &metadata);

struct InitRequest {
	UploadCore::UploadPlan plan;
	std::optional<PostMetadata> postInfo;
};

void to_json(nlohmann::json &j, const InitRequest &p);

struct ApiError {
	std::string code;
	std::string message;
	std::string logId;

	[[nodiscard]]
	bool isOk() const noexcept
	{
		return code == "ok";
	}
};

void from_json(const nlohmann::json &j, ApiError &p);

struct InitResponse {
	std::string publishId;
	std::string uploadUrl;
	ApiError error;
};

void from_json(const nlohmann::json &j, InitResponse &p);

struct UploadSession {
	std::string publishId;
	std::string uploadUrl;
	UploadCore::UploadPlan plan;
	std::uint64_t bytesAcknowledged = 0;
	UploadMode mode = UploadMode::Inbox;
	std::optional<PostMetadata> postMetadata;

	[[nodiscard]]
	bool isComplete() const noexcept
	{
		return bytesAcknowledged == plan.totalSize;
	}
};

} // namespace VideoPublisher::ContentPostingApi
