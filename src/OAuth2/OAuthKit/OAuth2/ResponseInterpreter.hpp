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

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "HttpTypes.hpp"
#include "Result.hpp"

namespace OAuthKit::OAuth2 {

inline constexpr std::string_view kHttpStatusErrorLabel = "Gaining token failed: ";
inline constexpr std::string_view kDecodeErrorLabel = "Could not decode JSON: ";

/// Status 200 yields the body verbatim. Any other status yields an
/// HttpStatus error whose message is kHttpStatusErrorLabel + body.
[[nodiscard]]
Result<ByteString> classify(const HttpResponse &response);

/// Decode error for `bytes`: kDecodeErrorLabel + bytes.
[[nodiscard]]
OAuth2Error makeDecodeError(const ByteString &bytes, std::optional<long> statusCode = 200);

/// Parses `bytes` as JSON and converts it with nlohmann's from_json for T.
template<typename T> [[nodiscard]] Result<T> parseJson(const ByteString &bytes)
{
	try {
		return nlohmann::json::parse(bytes).get<T>();
	} catch (const nlohmann::json::exception &) {
		return makeDecodeError(bytes);
	}
}

/// Second pipeline stage. Errors from classify() are returned as they are.
template<typename T> [[nodiscard]] Result<T> decodeJson(const Result<ByteString> &bytes)
{
	return bytes.andThen([](const ByteString &body) { return parseJson<T>(body); });
}

} // namespace OAuthKit::OAuth2
