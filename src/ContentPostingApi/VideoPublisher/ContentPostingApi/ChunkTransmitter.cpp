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

#include "ChunkTransmitter.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <VideoPublisher/Logger/NullLogger.hpp>
#include <VideoPublisher/UploadCore/UploadError.hpp>

#include "ContentRange.hpp"
#include "FailureClassifier.hpp"

namespace VideoPublisher::ContentPostingApi {

using UploadCore::UploadError;
using UploadCore::UploadErrorKind;

HttpTransport::HttpTimeouts ChunkTimeoutPolicy::timeoutsFor(std::uint64_t chunkLength) const noexcept
{
	std::chrono::seconds total = floor;
	if (minThroughputBytesPerSecond > 0) {
		const std::uint64_t seconds =
			(chunkLength + minThroughputBytesPerSecond - 1) / minThroughputBytesPerSecond;
		total = std::max(total, std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds)));
	}
	return HttpTransport::HttpTimeouts{.connect = connect, .total = total};
}

ChunkTransmitter::ChunkTransmitter(std::shared_ptr<HttpTransport::IHttpTransport> transport,
				   ChunkTimeoutPolicy policy, std::shared_ptr<const Logger::ILogger> logger)
	: transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(ChunkTransmitter)")),
	  policy_(policy),
	  logger_(Logger::orNullLogger(std::move(logger)))
{
}

ChunkTransmitter::~ChunkTransmitter() noexcept = default;

std::uint64_t ChunkTransmitter::send(const std::string &uploadUrl, std::span<const char> bytes,
				     std::uint64_t rangeStart, std::uint64_t rangeEndInclusive,
				     std::uint64_t totalSize) const
{
	constexpr const char *where = "ChunkTransmitter::send";

	if (uploadUrl.empty()) {
		logger_->error("UploadUrlIsEmptyError");
		throw UploadError(UploadErrorKind::InvalidInput, where, "UploadUrlIsEmpty");
	}
	if (rangeEndInclusive < rangeStart || rangeEndInclusive >= totalSize) {
		logger_->error("InvalidByteRangeError", {{"rangeStart", std::to_string(rangeStart)},
							 {"rangeEnd", std::to_string(rangeEndInclusive)},
							 {"totalSize", std::to_string(totalSize)}});
		throw UploadError(UploadErrorKind::InvalidInput, where,
				  fmt::format("InvalidByteRange {}-{}/{}", rangeStart, rangeEndInclusive, totalSize));
	}
	if (bytes.size() != rangeEndInclusive - rangeStart + 1) {
		logger_->error("ChunkLengthMismatchError", {{"expected", std::to_string(rangeEndInclusive - rangeStart + 1)},
							    {"actual", std::to_string(bytes.size())}});
		throw UploadError(UploadErrorKind::InvalidInput, where,
				  fmt::format("ChunkLengthMismatch expected={} actual={}",
					      rangeEndInclusive - rangeStart + 1, bytes.size()));
	}

	const std::array<std::string, 3> headers{
		"Content-Type: video/mp4",
		fmt::format("Content-Length: {}", bytes.size()),
		fmt::format("Content-Range: {}", formatContentRange(rangeStart, rangeEndInclusive, totalSize)),
	};

	HttpTransport::HttpResponse response =
		transport_->put(uploadUrl, headers, bytes, policy_.timeoutsFor(bytes.size()));

	if (response.statusCode != 206 && response.statusCode != 201) {
		ApiError apiError = extractApiError(response.body);
		logger_->error("ChunkRejected", {{"status", std::to_string(response.statusCode)},
						 {"code", apiError.code},
						 {"logId", apiError.logId}});
		throw makeRejectionError(where, response.statusCode, apiError);
	}

	std::uint64_t acknowledged = rangeEndInclusive + 1;

	if (std::optional<std::string> echoed = response.header("Content-Range")) {
		std::optional<ContentRange> range = parseContentRange(*echoed);
		if (!range.has_value()) {
			logger_->warn("UnparseableContentRange", {{"value", *echoed}});
		} else if (range->lastByte >= totalSize) {
			logger_->error("ContentRangeBeyondTotalError", {{"value", *echoed}});
			throw UploadError(UploadErrorKind::ProtocolViolation, where,
					  fmt::format("AcknowledgedRangeBeyondTotal {} total={}", *echoed, totalSize),
					  {.httpStatus = response.statusCode});
		} else {
			acknowledged = range->lastByte + 1;
		}
	}

	logger_->debug("ChunkAccepted", {{"status", std::to_string(response.statusCode)},
					 {"acknowledged", std::to_string(acknowledged)},
					 {"totalSize", std::to_string(totalSize)}});
	return acknowledged;
}

} // namespace VideoPublisher::ContentPostingApi
