/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit CurlHelper Library Tests Library
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

#include <gtest/gtest.h>

#include <curl/curl.h>

#include <OAuthKit/CurlHelper/CurlHandle.hpp>
#include <OAuthKit/CurlHelper/CurlUrlSearchParams.hpp>

using namespace OAuthKit::CurlHelper;

class CurlUrlSearchParamsTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(CurlUrlSearchParamsTest, EmptyListEncodesToEmptyString)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl);
	EXPECT_TRUE(params.empty());
	EXPECT_EQ(params.toString(), "");
}

TEST_F(CurlUrlSearchParamsTest, PreservesInsertionOrder)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl);
	params.append("z", "1");
	params.append("a", "2");
	params.append("z", "3");
	EXPECT_EQ(params.toString(), "z=1&a=2&z=3");
}

TEST_F(CurlUrlSearchParamsTest, EscapesReservedCharacters)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl, {{"redirect uri", "https://example.com/cb?x=1&y=2"}});
	EXPECT_EQ(params.toString(), "redirect%20uri=https%3A%2F%2Fexample.com%2Fcb%3Fx%3D1%26y%3D2");
}

TEST_F(CurlUrlSearchParamsTest, KeepsUnreservedCharacters)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl, {{"code", "Ab9-._~"}});
	EXPECT_EQ(params.toString(), "code=Ab9-._~");
}

TEST_F(CurlUrlSearchParamsTest, EmptyValueKeepsEqualsSign)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl, {{"state", ""}});
	EXPECT_EQ(params.toString(), "state=");
}
