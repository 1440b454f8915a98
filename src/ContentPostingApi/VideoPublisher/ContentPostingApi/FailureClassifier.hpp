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

#include <string>
#include <string_view>

#include <VideoPublisher/UploadCore/UploadError.hpp>

#include "ContentPostingTypes.hpp"

namespace VideoPublisher::ContentPostingApi {

inline constexpr std::size_t kMaxErrorBodyLength = 500;

// True when the text names a token problem ("token", "invalid" or "expired").
[[nodiscard]]
bool looksLikeAuthFailure(std::string_view text) noexcept;

/**
 * Maps a rejected response to AuthExpired or ServerRejected.
 *
 * A 401 is always AuthExpired. Otherwise the server-supplied error code, or
 * the raw body when there is no code, decides.
 */
[[nodiscard]]
UploadCore::UploadErrorKind classifyFailure(long httpStatus, std::string_view errorCode) noexcept;

/**
 * Pulls {"error":{"code","message","log_id"}} out of a response body. When the
 * body is not in that shape the message carries the body itself, cut to
 * kMaxErrorBodyLength bytes.
 */
[[nodiscard]]
ApiError extractApiError(std::string_view body);

// Builds the classified error for a rejected response.
[[nodiscard]]
UploadCore::UploadError makeRejectionError(std::string where, long httpStatus, const ApiError &apiError);

} // namespace VideoPublisher::ContentPostingApi
