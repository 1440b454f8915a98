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

#include "ContentRange.hpp"

#include <charconv>

#include <fmt/format.h>

namespace VideoPublisher::ContentPostingApi {

namespace {

std::string_view trim(std::string_view s) noexcept
{
	while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
		s.remove_prefix(1);
	while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
		s.remove_suffix(1);
	return s;
}

std::optional<std::uint64_t> parseNumber(std::string_view s) noexcept
{
	if (s.empty())
		return std::nullopt;

	std::uint64_t value = 0;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		return std::nullopt;
	return value;
}

} // anonymous namespace

std::string formatContentRange(std::uint64_t firstByte, std::uint64_t lastByte, std::uint64_t totalSize)
{
	return fmt::format("bytes {}-{}/{}", firstByte, lastByte, totalSize);
}

std::optional<ContentRange> parseContentRange(std::string_view value) noexcept
{
	value = trim(value);

	constexpr std::string_view unit = "bytes";
	if (!value.starts_with(unit))
		return std::nullopt;
	value.remove_prefix(unit.size());

	const std::size_t unitSeparator = value.find_first_not_of(" =");
	if (unitSeparator == 0 || unitSeparator == std::string_view::npos)
		return std::nullopt;
	value.remove_prefix(unitSeparator);

	const std::size_t dash = value.find('-');
	const std::size_t slash = value.find('/');
	if (dash == std::string_view::npos || (slash != std::string_view::npos && slash < dash))
		return std::nullopt;

	// The "/total" part is optional.
	const std::size_t lastEnd = slash == std::string_view::npos ? value.size() : slash;
	const auto first = parseNumber(value.substr(0, dash));
	const auto last = parseNumber(value.substr(dash + 1, lastEnd - dash - 1));
	if (!first || !last || *last < *first)
		return std::nullopt;

	ContentRange range{.firstByte = *first, .lastByte = *last, .totalSize = std::nullopt};
	if (slash == std::string_view::npos)
		return range;

	const std::string_view total = value.substr(slash + 1);
	if (total != "*") {
		const auto parsedTotal = parseNumber(total);
		if (!parsedTotal)
			return std::nullopt;
		range.totalSize = *parsedTotal;
	}

	return range;
}

} // namespace VideoPublisher::ContentPostingApi
