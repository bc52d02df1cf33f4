/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit OAuth2 Library
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

#include "AccessToken.hpp"

#include <nlohmann/json.hpp>

namespace OAuthKit::OAuth2 {

void to_json(nlohmann::json &j, const AccessToken &p)
{
	j = nlohmann::json{{"access_token", p.access_token}};

	if (p.refresh_token.has_value())
		j["refresh_token"] = *p.refresh_token;

	if (p.expires_in.has_value())
		j["expires_in"] = *p.expires_in;

	if (p.token_type.has_value())
		j["token_type"] = *p.token_type;

	if (p.scope.has_value())
		j["scope"] = *p.scope;

	if (p.id_token.has_value())
		j["id_token"] = *p.id_token;
}

void from_json(const nlohmann::json &j, AccessToken &p)
{
	j.at("access_token").get_to(p.access_token);

	const auto set_optional = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field.emplace());
		} else {
			field = std::nullopt;
		}
	};

	set_optional("refresh_token", p.refresh_token);
	set_optional("expires_in", p.expires_in);
	set_optional("token_type", p.token_type);
	set_optional("scope", p.scope);
	set_optional("id_token", p.id_token);
}

} // namespace OAuthKit::OAuth2
