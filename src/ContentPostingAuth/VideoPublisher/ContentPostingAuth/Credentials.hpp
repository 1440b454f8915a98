/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * VideoPublisher ContentPostingAuth Library
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

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace VideoPublisher::ContentPostingAuth {

// Keys handed to the credential store after a successful refresh.
inline constexpr std::string_view kAccessTokenKey = "access_token";
inline constexpr std::string_view kRefreshTokenKey = "refresh_token";

struct Credentials {
	std::string accessToken;
	std::optional<std::string> refreshToken;

	[[nodiscard]]
	bool canRefresh() const noexcept
	{
		return refreshToken.has_value() && !refreshToken->empty();
	}
};

void to_json(nlohmann::json &j, const Credentials &p);
void from_json(const nlohmann::json &j, Credentials &p);

// Application identity registered with the authorization server.
struct ClientCredentials {
	std::string clientKey;
	std::string clientSecret;

	[[nodiscard]]
	bool isComplete() const noexcept
	{
		return !clientKey.empty() && !clientSecret.empty();
	}
};

void to_json(nlohmann::json &j, const ClientCredentials &p);
void from_json(const nlohmann::json &j, ClientCredentials &p);

} // namespace VideoPublisher::ContentPostingAuth
