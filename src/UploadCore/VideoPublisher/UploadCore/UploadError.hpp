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

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace VideoPublisher::UploadCore {

enum class UploadErrorKind {
	InvalidInput,
	NotFound,
	EmptyFile,
	ServerRejected,
	AuthExpired,
	CredentialsExpired,
	NetworkError,
	ProtocolViolation,
};

[[nodiscard]]
std::string_view toString(UploadErrorKind kind) noexcept;

/**
 * Diagnostic context attached to an UploadError. Server fields are filled
 * when the remote API supplied them, chunk fields when the failure happened
 * while transmitting a byte range.
 */
struct UploadErrorContext {
	std::optional<long> httpStatus;
	std::string serverCode;
	std::string serverMessage;
	std::string logId;
	std::optional<std::size_t> chunkIndex;
	std::optional<std::uint64_t> firstByte;
	std::optional<std::uint64_t> lastByte;
};

/**
 * The single exception type thrown by the upload stack.
 *
 * what() reads `Kind(Component::operation): detail` followed by any server
 * and chunk context, so it can be shown to a user as-is.
 */
class UploadError : public std::runtime_error {
public:
	UploadError(UploadErrorKind kind, std::string where, std::string detail, UploadErrorContext context = {});

	[[nodiscard]]
	UploadErrorKind kind() const noexcept
	{
		return kind_;
	}

	[[nodiscard]]
	const std::string &where() const noexcept
	{
		return where_;
	}

	[[nodiscard]]
	const std::string &detail() const noexcept
	{
		return detail_;
	}

	[[nodiscard]]
	const UploadErrorContext &context() const noexcept
	{
		return context_;
	}

	// Returns a copy annotated with the chunk that was being transmitted.
	[[nodiscard]]
	UploadError withChunk(std::size_t chunkIndex, std::uint64_t firstByte, std::uint64_t lastByte) const;

	// Returns a copy with another kind, keeping detail and context.
	[[nodiscard]]
	UploadError withKind(UploadErrorKind kind, std::string where) const;

private:
	UploadErrorKind kind_;
	std::string where_;
	std::string detail_;
	UploadErrorContext context_;
};

} // namespace VideoPublisher::UploadCore
