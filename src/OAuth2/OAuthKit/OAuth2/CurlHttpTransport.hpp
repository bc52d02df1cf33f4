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

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <OAuthKit/Logger/ILogger.hpp>

#include "IHttpTransport.hpp"

namespace OAuthKit::OAuth2 {

struct CurlTransportOptions {
	std::chrono::milliseconds connectTimeout{10000};
	/// Whole-transfer limit, used when the request does not set its own.
	std::chrono::milliseconds timeout{60000};
	bool followRedirects = false;
	long maxRedirects = 5;
	bool verifyPeer = true;
	std::optional<std::string> caInfo;

	bool operator==(const CurlTransportOptions &) const = default;
};

void to_json(nlohmann::json &j, const CurlTransportOptions &p);
void from_json(const nlohmann::json &j, CurlTransportOptions &p);

/// libcurl-backed transport. Every call uses its own easy handle, so one
/// instance may be shared between threads once curl_global_init has run.
/// Only http and https are spoken, redirect targets included. Negative
/// timeouts or a maxRedirects below -1 in `options` throw
/// std::invalid_argument.
class CurlHttpTransport final : public IHttpTransport {
public:
	explicit CurlHttpTransport(CurlTransportOptions options = {},
				   std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~CurlHttpTransport() noexcept override;

	[[nodiscard]]
	Result<HttpResponse> perform(const HttpRequest &request) const override;

	[[nodiscard]]
	const CurlTransportOptions &options() const noexcept
	{
		return options_;
	}

private:
	const CurlTransportOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace OAuthKit::OAuth2
