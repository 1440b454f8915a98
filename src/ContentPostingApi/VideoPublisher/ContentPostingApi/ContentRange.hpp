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

namespace VideoPublisher::ContentPostingApi {

// Inclusive byte range as carried by a Content-Range header.
struct ContentRange {
	std::uint64_t firstByte = 0;
	std::uint64_t lastByte = 0;
	std::optional<std::uint64_t> totalSize;

	bool operator==(const ContentRange &) const = default;
};

// "bytes {first}-{last}/{total}"
[[nodiscard]]
std::string formatContentRange(std::uint64_t firstByte, std::uint64_t lastByte, std::uint64_t totalSize);

// Accepts "bytes a-b/total", "bytes a-b/*" and "bytes a-b". Returns std::nullopt otherwise.
[[nodiscard]]
std::optional<ContentRange> parseContentRange(std::string_view value) noexcept;

} // namespace VideoPublisher::ContentPostingApi
