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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include <VideoPublisher/ContentPostingApi/ChunkTransmitter.hpp>
#include <VideoPublisher/ContentPostingApi/ContentPostingTypes.hpp>
#include <VideoPublisher/ContentPostingAuth/Credentials.hpp>
#include <VideoPublisher/HttpTransport/HttpTypes.hpp>

namespace VideoPublisher::Uploader {

/**
 * Settings of an UploadOrchestrator. Every field has a production default,
 * so an empty JSON object is a valid configuration.
 *
 * JSON keys: endpoints, client_credentials, connect_timeout_seconds,
 * session_timeout_seconds, chunk_timeout_floor_seconds,
 * min_throughput_bytes_per_second.
 */
struct UploaderConfig {
	ContentPostingApi::ContentPostingEndpoints endpoints;
	std::optional<ContentPostingAuth::ClientCredentials> clientCredentials;
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds sessionTimeout{30};
	std::chrono::seconds chunkTimeoutFloor{120};
	std::uint64_t minThroughputBytesPerSecond = 256 * 1024;

	[[nodiscard]]
	HttpTransport::HttpTimeouts sessionTimeouts() const noexcept
	{
		return HttpTransport::HttpTimeouts{.connect = connectTimeout, .total = sessionTimeout};
	}

	[[nodiscard]]
	ContentPostingApi::ChunkTimeoutPolicy chunkTimeoutPolicy() const noexcept
	{
		return ContentPostingApi::ChunkTimeoutPolicy{.connect = connectTimeout,
							     .floor = chunkTimeoutFloor,
							     .minThroughputBytesPerSecond = minThroughputBytesPerSecond};
	}
};

void to_json(nlohmann::json &j, const UploaderConfig &p);
void from_json(const nlohmann::json &j, UploaderConfig &p);

// Throws std::invalid_argument for non-positive timeouts or an empty endpoint URL.
void validateUploaderConfig(const UploaderConfig &config);

/**
 * Reads and validates a JSON configuration file.
 *
 * @throw std::runtime_error when the file cannot be read or parsed.
 * @throw std::invalid_argument when a value is out of range.
 */
[[nodiscard]]
UploaderConfig loadUploaderConfig(const std::filesystem::path &path);

} // namespace VideoPublisher::Uploader
