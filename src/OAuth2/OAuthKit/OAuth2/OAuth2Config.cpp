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

#include "OAuth2Config.hpp"

#include <nlohmann/json.hpp>

namespace OAuthKit::OAuth2 {

void to_json(nlohmann::json &j, const OAuth2Config &p)
{
	j = nlohmann::json{
		{"client_id", p.client_id},
		{"client_secret", p.client_secret},
		{"authorize_endpoint", p.authorize_endpoint},
		{"token_endpoint", p.token_endpoint},
	};

	if (p.redirect_uri.has_value())
		j["redirect_uri"] = *p.redirect_uri;
}

void from_json(const nlohmann::json &j, OAuth2Config &p)
{
	j.at("client_id").get_to(p.client_id);
	j.at("client_secret").get_to(p.client_secret);
	j.at("authorize_endpoint").get_to(p.authorize_endpoint);
	j.at("token_endpoint").get_to(p.token_endpoint);

	if (auto it = j.find("redirect_uri"); it != j.end() && !it->is_null()) {
		it->get_to(p.redirect_uri.emplace());
	} else {
		p.redirect_uri = std::nullopt;
	}
}

} // namespace OAuthKit::OAuth2
