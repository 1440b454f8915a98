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

#include "UploaderConfig.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace VideoPublisher::Uploader {

namespace {

std::chrono::seconds readSeconds(const nlohmann::json &j, const char *key, std::chrono::seconds fallback)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		return std::chrono::seconds(it->get<std::int64_t>());
	}
	return fallback;
}

} // anonymous namespace

void to_json(nlohmann::json &j, const UploaderConfig &p)
{
	j = nlohmann::json{
		{"endpoints", p.endpoints},
		{"connect_timeout_seconds", p.connectTimeout.count()},
		{"session_timeout_seconds", p.sessionTimeout.count()},
		{"chunk_timeout_floor_seconds", p.chunkTimeoutFloor.count()},
		{"min_throughput_bytes_per_second", p.minThroughputBytesPerSecond},
	};

	if (p.clientCredentials.has_value())
		j["client_credentials"] = *p.clientCredentials;
}

void from_json(const nlohmann::json &j, UploaderConfig &p)
{
	if (!j.is_object()) {
		throw std::invalid_argument("ConfigIsNotObjectError(from_json)");
	}

	p = UploaderConfig{};

	if (auto it = j.find("endpoints"); it != j.end() && !it->is_null()) {
		it->get_to(p.endpoints);
	}
	if (auto it = j.find("client_credentials"); it != j.end() && !it->is_null()) {
		it->get_to(p.clientCredentials.emplace());
	}

	p.connectTimeout = readSeconds(j, "connect_timeout_seconds", p.connectTimeout);
	p.sessionTimeout = readSeconds(j, "session_timeout_seconds", p.sessionTimeout);
	p.chunkTimeoutFloor = readSeconds(j, "chunk_timeout_floor_seconds", p.chunkTimeoutFloor);
	p.minThroughputBytesPerSecond = j.value("min_throughput_bytes_per_second", p.minThroughputBytesPerSecond);
}

void validateUploaderConfig(const UploaderConfig &config)
{
	if (config.endpoints.inboxInitUrl.empty() || config.endpoints.directPostInitUrl.empty() ||
	    config.endpoints.tokenUrl.empty()) {
		throw std::invalid_argument("EndpointUrlIsEmptyError(validateUploaderConfig)");
	}
	if (config.connectTimeout.count() <= 0 || config.sessionTimeout.count() <= 0 ||
	    config.chunkTimeoutFloor.count() <= 0) {
		throw std::invalid_argument("TimeoutNotPositiveError(validateUploaderConfig)");
	}
	if (config.minThroughputBytesPerSecond == 0) {
		throw std::invalid_argument("MinThroughputIsZeroError(validateUploaderConfig)");
	}
}

UploaderConfig loadUploaderConfig(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	if (!ifs.is_open()) {
		throw std::runtime_error(fmt::format("ConfigOpenError(loadUploaderConfig): {}", path.string()));
	}

	nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded()) {
		throw std::runtime_error(fmt::format("ConfigParseError(loadUploaderConfig): {}", path.string()));
	}

	UploaderConfig config;
	try {
		config = j.get<UploaderConfig>();
	} catch (const nlohmann::json::exception &e) {
		throw std::runtime_error(fmt::format("ConfigShapeError(loadUploaderConfig): {}", e.what()));
	}

	validateUploaderConfig(config);
	return config;
}

} // namespace VideoPublisher::Uploader
