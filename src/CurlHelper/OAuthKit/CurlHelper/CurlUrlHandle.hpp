/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit CurlHelper Library
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

#include <memory>
#include <stdexcept>

#include <curl/curl.h>

namespace OAuthKit::CurlHelper {

/// Thin owner of a CURLU. Parse failures are returned rather than thrown so
/// that callers can report them as transfer errors.
class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url())
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept { curl_url_cleanup(handle_); }

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;
	CurlUrlHandle(CurlUrlHandle &&) = delete;
	CurlUrlHandle &operator=(CurlUrlHandle &&) = delete;

	[[nodiscard]]
	CURLUcode setUrl(const char *url) noexcept
	{
		return curl_url_set(handle_, CURLUPART_URL, url, 0);
	}

	/// `query` must already be percent-encoded.
	[[nodiscard]]
	CURLUcode appendQuery(const char *query) noexcept
	{
		return curl_url_set(handle_, CURLUPART_QUERY, query, CURLU_APPENDQUERY);
	}

	[[nodiscard]]
	CURLUcode toString(std::unique_ptr<char, decltype(&curl_free)> &out) const noexcept
	{
		char *urlStr = nullptr;
		CURLUcode uc = curl_url_get(handle_, CURLUPART_URL, &urlStr, 0);
		out.reset(urlStr);
		return uc;
	}

private:
	CURLU *const handle_;
};

} // namespace OAuthKit::CurlHelper
