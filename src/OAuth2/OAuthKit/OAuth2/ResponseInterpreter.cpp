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

#include "ResponseInterpreter.hpp"

#include <string>
#include <utility>

namespace OAuthKit::OAuth2 {

Result<ByteString> classify(const HttpResponse &response)
{
	if (response.statusCode == 200) {
		return response.body;
	}

	std::string message(kHttpStatusErrorLabel);
	message += response.body;
	return OAuth2Error{OAuth2ErrorKind::HttpStatus, std::move(message), response.statusCode};
}

OAuth2Error makeDecodeError(const ByteString &bytes, std::optional<long> statusCode)
{
	std::string message(kDecodeErrorLabel);
	message += bytes;
	return OAuth2Error{OAuth2ErrorKind::Decode, std::move(message), statusCode};
}

} // namespace OAuthKit::OAuth2
