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

#include <nlohmann/json.hpp>

namespace VideoPublisher::ContentPostingAuth {

/**
 * Body of the token endpoint. A successful exchange carries access_token;
 * a failed one carries error / error_description instead. Every field is
 * optional so both shapes parse.
 */
struct TokenResponse {
	std::optional<std::string> access_token;
	std::optional<int> expires_in;
	std::optional<std::string> open_id;
	std::optional<int> refresh_expires_in;
	std::optional<std::string> refresh_token;
	std::optional<std::string> scope;
	std::optional<std::string> token_type;
	std::optional<std::string> error;
	std::optional<std::string> error_description;
	std::optional<std::string> log_id;
};

inline void from_json(const nlohmann::json &j, TokenResponse &p)
{
	const auto set_optional = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field.emplace());
		} else {
			field = std::nullopt;
		}
	};

	set_optional("access_token", p.access_token);
	set_optional("expires_in", p.expires_in);
	set_optional("open_id", p.open_id);
	set_optional("refresh_expires_in", p.refresh_expires_in);
	set_optional("refresh_token", p.refresh_token);
	set_optional("scope", p.scope);
	set_optional("token_type", p.token_type);
	set_optional("error_description", p.error_description);
	set_optional("log_id", p.log_id);

	// Some gateways wrap failures as {"error": {"code": ..., "message": ...}}.
	if (auto it = j.find("error"); it != j.end() && !it->is_null()) {
		if (it->is_object()) {
			p.error = it->value("code", std::string{});
			if (!p.error_description.has_value() && it->contains("message")) {
				p.error_description = it->at("message").get<std::string>();
			}
		} else {
			p.error = it->get<std::string>();
		}
	} else {
		p.error = std::nullopt;
	}
}

} // namespace VideoPublisher::ContentPostingAuth
