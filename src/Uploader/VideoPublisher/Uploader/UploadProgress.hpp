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

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace VideoPublisher::Uploader {

/**
 * Snapshot handed to the progress callback. The first report comes right
 * after the session opens with chunkIndex 0 and no bytes acknowledged; every
 * later report follows an acknowledged chunk, chunkIndex being the number of
 * chunks the server now holds.
 */
struct UploadProgress {
	std::string publishId;
	std::uint64_t chunkIndex = 0;
	std::uint64_t chunkCount = 0;
	std::uint64_t bytesAcknowledged = 0;
	std::uint64_t totalSize = 0;

	[[nodiscard]]
	double fraction() const noexcept
	{
		return totalSize == 0 ? 0.0 : static_cast<double>(bytesAcknowledged) / static_cast<double>(totalSize);
	}

	bool operator==(const UploadProgress &) const = default;
};

struct UploadOrchestratorCallback {
	std::function<void(const UploadProgress &)> onProgress;

	// Receives ("access_token", value) and ("refresh_token", value) after a refresh.
	std::function<void(std::string_view key, const std::string &value)> onCredentialStore;
};

} // namespace VideoPublisher::Uploader
