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

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include <VideoPublisher/HttpTransport/IHttpTransport.hpp>
#include <VideoPublisher/Logger/ILogger.hpp>

namespace VideoPublisher::ContentPostingApi {

// Chunk requests get max(floor, length / minThroughput) to complete.
struct ChunkTimeoutPolicy {
	std::chrono::seconds connect{10};
	std::chrono::seconds floor{120};
	std::uint64_t minThroughputBytesPerSecond = 256 * 1024;

	[[nodiscard]]
	HttpTransport::HttpTimeouts timeoutsFor(std::uint64_t chunkLength) const noexcept;
};

class ChunkTransmitter {
public:
	ChunkTransmitter(std::shared_ptr<HttpTransport::IHttpTransport> transport, ChunkTimeoutPolicy policy = {},
			 std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~ChunkTransmitter() noexcept;

	ChunkTransmitter(const ChunkTransmitter &) = delete;
	ChunkTransmitter &operator=(const ChunkTransmitter &) = delete;
	ChunkTransmitter(ChunkTransmitter &&) = delete;
	ChunkTransmitter &operator=(ChunkTransmitter &&) = delete;

	/**
	 * PUTs one chunk with `Content-Range: bytes {rangeStart}-{rangeEndInclusive}/{totalSize}`.
	 *
	 * The server answers 206 for an intermediate chunk and 201 once the
	 * whole file is in.
	 *
	 * @return Bytes the server holds after this request. Taken from the
	 * echoed Content-Range when present, else rangeEndInclusive + 1.
	 * @throw UploadError InvalidInput when bytes does not match the range;
	 * AuthExpired or ServerRejected for any other status; ProtocolViolation
	 * when the echoed range goes past totalSize; NetworkError from the
	 * transport.
	 */
	[[nodiscard]]
	std::uint64_t send(const std::string &uploadUrl, std::span<const char> bytes, std::uint64_t rangeStart,
			   std::uint64_t rangeEndInclusive, std::uint64_t totalSize) const;

private:
	const std::shared_ptr<HttpTransport::IHttpTransport> transport_;
	const ChunkTimeoutPolicy policy_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace VideoPublisher::ContentPostingApi
