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
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace VideoPublisher::CurlHelper {

using CurlHeaderList = std::vector<std::pair<std::string, std::string>>;

namespace Detail {

inline std::string_view trimHeaderWhitespace(std::string_view s) noexcept
{
	while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
		s.remove_prefix(1);
	}
	while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
		s.remove_suffix(1);
	}
	return s;
}

} // namespace Detail

/**
 * Collects "Name: value" response headers into a CurlHeaderList.
 *
 * A new status line (for example after "100 Continue") clears what was
 * collected, so only the headers of the final response remain.
 */
inline std::size_t CurlHeaderListCallback(char *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nmemb;

	try {
		auto *headers = static_cast<CurlHeaderList *>(userp);
		std::string_view line(contents, totalSize);

		if (line.starts_with("HTTP/")) {
			headers->clear();
			return totalSize;
		}

		std::size_t colon = line.find(':');
		if (colon == std::string_view::npos) {
			return totalSize;
		}

		std::string_view name = Detail::trimHeaderWhitespace(line.substr(0, colon));
		std::string_view value = Detail::trimHeaderWhitespace(line.substr(colon + 1));
		headers->emplace_back(std::string(name), std::string(value));
	} catch (...) {
		return 0;
	}

	return totalSize;
}

} // namespace VideoPublisher::CurlHelper
