/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher UploadCore Library
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

#include "UploadError.hpp"

#include <utility>

#include <fmt/format.h>

namespace VideoPublisher::UploadCore {

namespace {

std::string formatMessage(UploadErrorKind kind, const std::string &where, const std::string &detail,
			  const UploadErrorContext &context)
{
	std::string message = fmt::format("{}({})", toString(kind), where);
	if (!detail.empty()) {
		message += fmt::format(": {}", detail);
	}

	if (context.httpStatus.has_value()) {
		message += fmt::format(" [http_status={}]", *context.httpStatus);
	}
	if (!context.serverCode.empty()) {
		message += fmt::format(" [code={}]", context.serverCode);
	}
	if (!context.serverMessage.empty()) {
		message += fmt::format(" [message={}]", context.serverMessage);
	}
	if (!context.logId.empty()) {
		message += fmt::format(" [log_id={}]", context.logId);
	}
	if (context.chunkIndex.has_value()) {
		message += fmt::format(" [chunk={}]", *context.chunkIndex);
	}
	if (context.firstByte.has_value() && context.lastByte.has_value()) {
		message += fmt::format(" [bytes={}-{}]", *context.firstByte, *context.lastByte);
	}

	return message;
}

} // anonymous namespace

std::string_view toString(UploadErrorKind kind) noexcept
{
	switch (kind) {
	case UploadErrorKind::InvalidInput:
		return "InvalidInput";
	case UploadErrorKind::NotFound:
		return "NotFound";
	case UploadErrorKind::EmptyFile:
		return "EmptyFile";
	case UploadErrorKind::ServerRejected:
		return "ServerRejected";
	case UploadErrorKind::AuthExpired:
		return "AuthExpired";
	case UploadErrorKind::CredentialsExpired:
		return "CredentialsExpired";
	case UploadErrorKind::NetworkError:
		return "NetworkError";
	case UploadErrorKind::ProtocolViolation:
		return "ProtocolViolation";
	}
	return "Unknown";
}

UploadError::UploadError(UploadErrorKind kind, std::string where, std::string detail, UploadErrorContext context)
	: std::runtime_error(formatMessage(kind, where, detail, context)),
	  kind_(kind),
	  where_(std::move(where)),
	  detail_(std::move(detail)),
	  context_(std::move(context))
{
}

UploadError UploadError::withChunk(std::size_t chunkIndex, std::uint64_t firstByte, std::uint64_t lastByte) const
{
	UploadErrorContext context = context_;
	context.chunkIndex = chunkIndex;
	context.firstByte = firstByte;
	context.lastByte = lastByte;
	return UploadError(kind_, where_, detail_, std::move(context));
}

UploadError UploadError::withKind(UploadErrorKind kind, std::string where) const
{
	return UploadError(kind, std::move(where), detail_, context_);
}

} // namespace VideoPublisher::UploadCore
