/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher CurlHelper Library
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

#include <cstddef>
#include <limits>
#include <string>

#include <curl/curl.h>

namespace VideoPublisher::CurlHelper {

/**
 * Response body sink. Bytes beyond `limit` are counted but dropped so that an
 * unexpectedly large error page cannot exhaust memory.
 */
struct CurlStringWriteBuffer {
	std::string data;
	std::size_t limit = 4 * 1024 * 1024;
	std::size_t discarded = 0;
};

inline std::size_t CurlStringWriteCallback(char *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	std::size_t totalSize = size * nmemb;

	try {
		auto *buffer = static_cast<CurlStringWriteBuffer *>(userp);
		std::size_t room = buffer->limit > buffer->data.size() ? buffer->limit - buffer->data.size() : 0;
		std::size_t kept = totalSize < room ? totalSize : room;
		buffer->data.append(contents, kept);
		buffer->discarded += totalSize - kept;
	} catch (...) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

} // namespace VideoPublisher::CurlHelper
