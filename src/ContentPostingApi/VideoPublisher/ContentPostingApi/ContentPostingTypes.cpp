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

#include "ContentPostingTypes.hpp"

#include <optional>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <VideoPublisher/UploadCore/UploadError.hpp>

namespace VideoPublisher::ContentPostingApi {

namespace {

// Counts code points of well-formed UTF-8. Overlong forms, surrogates and
// truncated sequences yield nullopt.
std::optional<std::size_t> countUtf8CodePoints(std::string_view text) noexcept
{
	std::size_t count = 0;
	std::size_t i = 0;
	while (i < text.size()) {
		const auto lead = static_cast<unsigned char>(text[i]);
		std::size_t trailing = 0;
		unsigned char secondMin = 0x80;
		unsigned char secondMax = 0xBF;

		if (lead < 0x80) {
			trailing = 0;
		} else if (lead >= 0xC2 && lead <= 0xDF) {
			trailing = 1;
		} else if (lead >= 0xE0 && lead <= 0xEF) {
			trailing = 2;
			if (lead == 0xE0)
				secondMin = 0xA0;
			else if (lead == 0xED)
				secondMax = 0x9F;
		} else if (lead >= 0xF0 && lead <= 0xF4) {
			trailing = 3;
			if (lead == 0xF0)
				secondMin = 0x90;
			else if (lead == 0xF4)
				secondMax = 0x8F;
		} else {
			return std::nullopt;
		}

		if (text.size() - i - 1 < trailing)
			return std::nullopt;

		for (std::size_t k = 1; k <= trailing; ++k) {
			const auto c = static_cast<unsigned char>(text[i + k]);
			const unsigned char min = k == 1 ? secondMin : 0x80;
			const unsigned char max = k == 1 ? secondMax : 0xBF;
			if (c < min || c > max)
				return std::nullopt;
		}

		i += trailing + 1;
		++count;
	}
	return count;
}

} // anonymous namespace

void to_json(nlohmann::json &j, const ContentPostingEndpoints &p)
{
	j = nlohmann::json{{"inbox_init_url", p.inboxInitUrl},
			   {"direct_post_init_url", p.directPostInitUrl},
			   {"token_url", p.tokenUrl}};
}

void from_json(const nlohmann::json &j, ContentPostingEndpoints &p)
{
	p.inboxInitUrl = j.value("inbox_init_url", p.inboxInitUrl);
	p.directPostInitUrl = j.value("direct_post_init_url", p.directPostInitUrl);
	p.tokenUrl = j.value("token_url", p.tokenUrl);
}

std::string_view toString(UploadMode mode) noexcept
{
	switch (mode) {
	case UploadMode::Inbox:
		return "inbox";
	case UploadMode::DirectPost:
		return "direct_post";
	}
	return "unknown";
}

std::string_view toString(PrivacyLevel level) noexcept
{
	switch (level) {
	case PrivacyLevel::PublicToEveryone:
		return "PUBLIC_TO_EVERYONE";
	case PrivacyLevel::MutualFollowFriends:
		return "MUTUAL_FOLLOW_FRIENDS";
	case PrivacyLevel::FollowerOfCreator:
		return "FOLLOWER_OF_CREATOR";
	case PrivacyLevel::SelfOnly:
		return "SELF_ONLY";
	}
	return "SELF_ONLY";
}

std::optional<PrivacyLevel> parsePrivacyLevel(std::string_view text) noexcept
{
	for (PrivacyLevel level : {PrivacyLevel::PublicToEveryone, PrivacyLevel::MutualFollowFriends,
				   PrivacyLevel::FollowerOfCreator, PrivacyLevel::SelfOnly}) {
		if (toString(level) == text) {
			return level;
		}
	}
	return std::nullopt;
}

void to_json(nlohmann::json &j, const PostMetadata &p)
{
	j = nlohmann::json{
		{"title", p.title},
		{"privacy_level", std::string(toString(p.privacyLevel))},
		{"disable_duet", p.disableDuet},
		{"disable_stitch", p.disableStitch},
		{"disable_comment", p.disableComment},
		{"brand_content_toggle", p.brandContentToggle},
		{"brand_organic_toggle", p.brandOrganicToggle},
	};

	if (p.videoCoverTimestampMs.has_value())
		j["video_cover_timestamp_ms"] = *p.videoCoverTimestampMs;
}

void from_json(const nlohmann::json &j, PostMetadata &p)
{
	p.title = j.value("title", std::string{});

	const std::string privacy = j.value("privacy_level", std::string{toString(PrivacyLevel::SelfOnly)});
	if (auto level = parsePrivacyLevel(privacy)) {
		p.privacyLevel = *level;
	} else {
		throw std::invalid_argument(fmt::format("UnknownPrivacyLevelError(from_json): {}", privacy));
	}

	p.disableDuet = j.value("disable_duet", false);
	p.disableStitch = j.value("disable_stitch", false);
	p.disableComment = j.value("disable_comment", false);
	p.brandContentToggle = j.value("brand_content_toggle", false);
	p.brandOrganicToggle = j.value("brand_organic_toggle", false);

	if (auto it = j.find("video_cover_timestamp_ms"); it != j.end() && !it->is_null()) {
		it->get_to(p.videoCoverTimestampMs.emplace());
	} else {
		p.videoCoverTimestampMs = std::nullopt;
	}
}

void validatePostMetadata(const PostMetadata &metadata)
{
	using UploadCore::UploadError;
	using UploadCore::UploadErrorKind;

	const std::optional<std::size_t> length = countUtf8CodePoints(metadata.title);
	if (!length.has_value()) {
		throw UploadError(UploadErrorKind::InvalidInput, "ContentPostingApi::validatePostMetadata",
				  "TitleIsNotValidUtf8");
	}
	if (*length > kMaxTitleCodePoints) {
		throw UploadError(UploadErrorKind::InvalidInput, "ContentPostingApi::validatePostMetadata",
				  fmt::format("TitleTooLong length={} max={}", *length, kMaxTitleCodePoints));
	}

	// Branded content cannot be restricted to the creator alone.
	if (metadata.brandContentToggle && metadata.privacyLevel == PrivacyLevel::SelfOnly) {
		throw UploadError(UploadErrorKind::InvalidInput, "ContentPostingApi::validatePostMetadata",
				  "BrandedContentCannotBeSelfOnly");
	}
}

void to_json(nlohmann::json &j, const InitRequest &p)
{
	j = nlohmann::json{{"source_info",
			    {{"source", "FILE_UPLOAD"},
			     {"video_size", p.plan.totalSize},
			     {"chunk_size", p.plan.chunkSize},
			     {"total_chunk_count", p.plan.chunkCount}}}};

	if (p.postInfo.has_value())
		j["post_info"] = *p.postInfo;
}

void from_json(const nlohmann::json &j, ApiError &p)
{
	p.code = j.value("code", std::string{});
	p.message = j.value("message", std::string{});
	p.logId = j.value("log_id", std::string{});
}

void from_json(const nlohmann::json &j, InitResponse &p)
{
	if (auto it = j.find("error"); it != j.end() && it->is_object()) {
		it->get_to(p.error);
	} else {
		p.error = ApiError{};
	}

	p.publishId.clear();
	p.uploadUrl.clear();
	if (auto it = j.find("data"); it != j.end() && it->is_object()) {
		p.publishId = it->value("publish_id", std::string{});
		p.uploadUrl = it->value("upload_url", std::string{});
	}
}

} // namespace VideoPublisher::ContentPostingApi
