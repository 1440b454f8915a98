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

#include "FailureClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

namespace VideoPublisher::ContentPostingApi {

namespace {

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept
{
	const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
				    [](char a, char b) {
					    return std::tolower(static_cast<unsigned char>(a)) ==
						   std::tolower(static_cast<unsigned char>(b));
				    });
	return it != haystack.end();
}

std::string truncateBody(std::string_view body)
{
	return std::string(body.substr(0, kMaxErrorBodyLength));
}

} // anonymous namespace

bool looksLikeAuthFailure(std::string_view text) noexcept
{
	constexpr std::array<std::string_view, 3> keywords{"token", "invalid", "expired"};
	return std::any_of(keywords.begin(), keywords.end(),
			   [text](std::string_view keyword) { return containsIgnoreCase(text, keyword); });
}

UploadCore::UploadErrorKind classifyFailure(long httpStatus, std::string_view errorCode) noexcept
{
	if (httpStatus == 401 || looksLikeAuthFailure(errorCode)) {
		return UploadCore::UploadErrorKind::AuthExpired;
	}
	return UploadCore::UploadErrorKind::ServerRejected;
}

ApiError extractApiError(std::string_view body)
{
	nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
	if (!j.is_discarded() && j.is_object()) {
		if (auto it = j.find("error"); it != j.end() && it->is_object()) {
			try {
				ApiError error = it->get<ApiError>();
				if (!error.code.empty() || !error.message.empty()) {
					return error;
				}
			} catch (const nlohmann::json::exception &) {
				// Wrong field types; fall through to the raw body.
			}
		}
	}

	ApiError error;
	error.message = truncateBody(body);
	return error;
}

UploadCore::UploadError makeRejectionError(std::string where, long httpStatus, const ApiError &apiError)
{
	const std::string_view classifiedText = apiError.code.empty() ? apiError.message : apiError.code;
	const UploadCore::UploadErrorKind kind = classifyFailure(httpStatus, classifiedText);

	UploadCore::UploadErrorContext context;
	context.httpStatus = httpStatus;
	context.serverCode = apiError.code;
	context.serverMessage = truncateBody(apiError.message);
	context.logId = apiError.logId;

	std::string detail = kind == UploadCore::UploadErrorKind::AuthExpired ? "AccessTokenRejected"
									      : "RequestRejected";
	return UploadCore::UploadError(kind, std::move(where), std::move(detail), std::move(context));
}

} // namespace VideoPublisher::ContentPostingApi
