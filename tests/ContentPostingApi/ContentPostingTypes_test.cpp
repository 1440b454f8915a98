/*
 * Video Publisher
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include <VideoPublisher/ContentPostingApi/ContentPostingTypes.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

using namespace VideoPublisher::ContentPostingApi;
using VideoPublisher::UploadCore::UploadError;
using VideoPublisher::UploadCore::UploadErrorKind;
using VideoPublisher::UploadCore::UploadPlan;

TEST(ContentPostingTypesTest, InitRequestWithoutPostInfo)
{
	nlohmann::json j = InitRequest{UploadPlan{26214400, 10485760, 2}, std::nullopt};

	EXPECT_EQ(j["source_info"]["source"], "FILE_UPLOAD");
	EXPECT_EQ(j["source_info"]["video_size"], 26214400);
	EXPECT_EQ(j["source_info"]["chunk_size"], 10485760);
	EXPECT_EQ(j["source_info"]["total_chunk_count"], 2);
	EXPECT_FALSE(j.contains("post_info"));
}

TEST(ContentPostingTypesTest, InitRequestWithPostInfo)
{
	PostMetadata metadata;
	metadata.title = "Sunset #travel";
	metadata.privacyLevel = PrivacyLevel::MutualFollowFriends;
	metadata.disableComment = true;
	metadata.videoCoverTimestampMs = 1500;

	nlohmann::json j = InitRequest{UploadPlan{1000, 1000, 1}, metadata};

	const auto &postInfo = j.at("post_info");
	EXPECT_EQ(postInfo["title"], "Sunset #travel");
	EXPECT_EQ(postInfo["privacy_level"], "MUTUAL_FOLLOW_FRIENDS");
	EXPECT_EQ(postInfo["disable_duet"], false);
	EXPECT_EQ(postInfo["disable_stitch"], false);
	EXPECT_EQ(postInfo["disable_comment"], true);
	EXPECT_EQ(postInfo["video_cover_timestamp_ms"], 1500);
	EXPECT_EQ(postInfo["brand_content_toggle"], false);
	EXPECT_EQ(postInfo["brand_organic_toggle"], false);
}

TEST(ContentPostingTypesTest, PostMetadataFromJsonDefaults)
{
	PostMetadata metadata = nlohmann::json::parse(R"({"title":"hello"})").get<PostMetadata>();
	EXPECT_EQ(metadata.title, "hello");
	EXPECT_EQ(metadata.privacyLevel, PrivacyLevel::SelfOnly);
	EXPECT_FALSE(metadata.videoCoverTimestampMs.has_value());
}

TEST(ContentPostingTypesTest, UnknownPrivacyLevelIsRejected)
{
	EXPECT_THROW((void)nlohmann::json::parse(R"({"privacy_level":"EVERYONE"})").get<PostMetadata>(),
		     std::invalid_argument);
}

TEST(ContentPostingTypesTest, PrivacyLevelNamesRoundTrip)
{
	for (PrivacyLevel level : {PrivacyLevel::PublicToEveryone, PrivacyLevel::MutualFollowFriends,
				   PrivacyLevel::FollowerOfCreator, PrivacyLevel::SelfOnly}) {
		EXPECT_EQ(parsePrivacyLevel(toString(level)), level);
	}
	EXPECT_FALSE(parsePrivacyLevel("public").has_value());
}

TEST(ContentPostingTypesTest, OverlongTitleIsInvalidInput)
{
	PostMetadata metadata;
	metadata.title = std::string(kMaxTitleCodePoints, 'a');
	EXPECT_NO_THROW(validatePostMetadata(metadata));

	metadata.title += "a";
	try {
		validatePostMetadata(metadata);
		FAIL() << "expected UploadError";
	} catch (const UploadError &e) {
		EXPECT_EQ(e.kind(), UploadErrorKind::InvalidInput);
	}
}

TEST(ContentPostingTypesTest, TitleLengthCountsCodePoints)
{
	PostMetadata metadata;
	metadata.title.clear();
	for (std::size_t i = 0; i < kMaxTitleCodePoints; ++i) {
		metadata.title += "\xE3\x81\x82";
	}
	EXPECT_NO_THROW(validatePostMetadata(metadata));
}

TEST(ContentPostingTypesTest, MalformedUtf8TitleIsInvalidInput)
{
	for (const char *title : {"bad\xff\xfe title", "\xC0\xAF", "\xED\xA0\x80", "cut \xE3\x81", "\xF4\x90\x80\x80"}) {
		PostMetadata metadata;
		metadata.title = title;
		try {
			validatePostMetadata(metadata);
			ADD_FAILURE() << "expected UploadError";
		} catch (const UploadError &e) {
			EXPECT_EQ(e.kind(), UploadErrorKind::InvalidInput);
		}
	}

	PostMetadata emoji;
	emoji.title = "\xF0\x9F\x8E\xA5 clip";
	EXPECT_NO_THROW(validatePostMetadata(emoji));
}

TEST(ContentPostingTypesTest, BrandedContentCannotBeSelfOnly)
{
	PostMetadata metadata;
	metadata.brandContentToggle = true;
	metadata.privacyLevel = PrivacyLevel::SelfOnly;
	EXPECT_THROW(validatePostMetadata(metadata), UploadError);

	metadata.privacyLevel = PrivacyLevel::PublicToEveryone;
	EXPECT_NO_THROW(validatePostMetadata(metadata));
}

TEST(ContentPostingTypesTest, InitResponseParsesDataAndError)
{
	InitResponse response = nlohmann::json::parse(R"({
		"data": {"publish_id": "v_inbox_file~v2.123", "upload_url": "https://open-upload.tiktokapis.com/video/?upload_id=1"},
		"error": {"code": "ok", "message": "", "log_id": "LOG"}
	})").get<InitResponse>();

	EXPECT_EQ(response.publishId, "v_inbox_file~v2.123");
	EXPECT_EQ(response.uploadUrl, "https://open-upload.tiktokapis.com/video/?upload_id=1");
	EXPECT_TRUE(response.error.isOk());
	EXPECT_EQ(response.error.logId, "LOG");
}

TEST(ContentPostingTypesTest, EndpointsFromJsonKeepDefaults)
{
	ContentPostingEndpoints endpoints =
		nlohmann::json::parse(R"({"token_url":"http://127.0.0.1:8080/token"})").get<ContentPostingEndpoints>();
	EXPECT_EQ(endpoints.tokenUrl, "http://127.0.0.1:8080/token");
	EXPECT_EQ(endpoints.inboxInitUrl, ContentPostingEndpoints{}.inboxInitUrl);
}

TEST(ContentPostingTypesTest, SessionIsCompleteOnlyWhenEveryByteIsAcknowledged)
{
	UploadSession session;
	session.plan = UploadPlan{25, 10, 2};
	session.bytesAcknowledged = 10;
	EXPECT_FALSE(session.isComplete());

	session.bytesAcknowledged = 25;
	EXPECT_TRUE(session.isComplete());
}
