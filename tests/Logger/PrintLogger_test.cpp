/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit Logger Library Tests Library
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

#include <sstream>
#include <string>

#include <OAuthKit/Logger/NullLogger.hpp>
#include <OAuthKit/Logger/PrintLogger.hpp>

using namespace OAuthKit::Logger;

TEST(PrintLoggerTest, WritesLevelNameAndFields)
{
	std::ostringstream out;
	PrintLogger logger(out);

	logger.info("TokenExchanged", {{"operation", "fetchAccessToken"}});

	const std::string line = out.str();
	EXPECT_EQ(line.rfind("level=INFO\tname=TokenExchanged\tlocation=", 0), 0u);
	EXPECT_NE(line.find("\toperation=fetchAccessToken"), std::string::npos);
	EXPECT_EQ(line.back(), '\n');
}

TEST(PrintLoggerTest, DropsEventsBelowMinimumLevel)
{
	std::ostringstream out;
	PrintLogger logger(out, LogLevel::Warn);

	logger.debug("Ignored");
	logger.info("AlsoIgnored");
	logger.error("Kept");

	const std::string text = out.str();
	EXPECT_EQ(text.find("Ignored"), std::string::npos);
	EXPECT_NE(text.find("level=ERROR\tname=Kept"), std::string::npos);
}

TEST(NullLoggerTest, InstanceIsShared)
{
	EXPECT_EQ(NullLogger::instance(), NullLogger::instance());
	NullLogger::instance()->error("Discarded", {{"key", "value"}});
}
