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

#include "Credentials.hpp"

#include <nlohmann/json.hpp>

namespace VideoPublisher::ContentPostingAuth {

void to_json(nlohmann::json &j, const Credentials &p)
{
	j = nlohmann::json{{"access_token", p.accessToken}};
	if (p.refreshToken.has_value())
		j["refresh_token"] = *p.refreshToken;
}

void from_json(const nlohmann::json &j, Credentials &p)
{
	j.at("access_token").get_to(p.accessToken);

	if (auto it = j.find("refresh_token"); it != j.end() && !it->is_null()) {
		it->get_to(p.refreshToken.emplace());
	} else {
		p.refreshToken = std::nullopt;
	}
}

void to_json(nlohmann::json &j, const ClientCredentials &p)
{
	j = nlohmann::json{{"client_key", p.clientKey}, {"client_secret", p.clientSecret}};
}

void from_json(const nlohmann::json &j, ClientCredentials &p)
{
	j.at("client_key").get_to(p.clientKey);
	j.at("client_secret").get_to(p.clientSecret);
}

} // namespace VideoPublisher::ContentPostingAuth
