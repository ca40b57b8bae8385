/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include "agmark/Metadata.h"

using agmark::splitHeader;

TEST(Metadata, NoHeaderKeepsWholeSource) {
	const std::string src = "Just *text*\nwith lines";
	const auto split = splitHeader(src);
	EXPECT_EQ(src, split.body);
	EXPECT_FALSE(split.metadata.title);
	EXPECT_TRUE(split.metadata.entries.empty());
}

TEST(Metadata, KnownKeys) {
	const auto split = splitHeader("title  A Title \nauthor Jane Doe\ndate 2021-03-07\ntemplate post\n\n---\nbody");
	const auto& meta = split.metadata;
	EXPECT_EQ("body", split.body);
	EXPECT_EQ("A Title", meta.title.value());
	EXPECT_EQ("Jane Doe", meta.author.value());
	EXPECT_EQ("post", meta.templateName.value());
	ASSERT_TRUE(meta.date);
	EXPECT_EQ(2021, meta.date->year);
	EXPECT_EQ(3, meta.date->month);
	EXPECT_EQ(7, meta.date->day);
	EXPECT_EQ("March 7, 2021", meta.date->rendered);
	EXPECT_FALSE(meta.isStatic);
}

TEST(Metadata, FreeFormKeysAndFlags) {
	const auto meta = splitHeader("static\ntags one two\ntags three\n---\n").metadata;
	EXPECT_TRUE(meta.isStatic);
	ASSERT_EQ(1u, meta.entries.count("static"));
	EXPECT_FALSE(meta.entries.at("static"));
	EXPECT_EQ("three", meta.entries.at("tags").value());
}

TEST(Metadata, CrLfHeader) {
	const auto split = splitHeader("title T\r\n---\r\nbody");
	EXPECT_EQ("T", split.metadata.title.value());
	EXPECT_EQ("body", split.body);
}

TEST(Metadata, SeparatorRequired) {
	const auto split = splitHeader("title T\nbody text\n");
	EXPECT_FALSE(split.metadata.title);
	EXPECT_EQ("title T\nbody text\n", split.body);
}

TEST(Metadata, BadMonthNamesLine) {
	try {
		splitHeader("title x\ndate 2020-13-01\n---\n");
		FAIL() << "expected ParseError";
	}
	catch (const agmark::ParseError& e) {
		EXPECT_EQ("date 2020-13-01", e.line());
	}
}

TEST(Metadata, DayOutOfRange) {
	EXPECT_THROW(splitHeader("date 2021-02-29\n---\n"), agmark::ParseError);
	EXPECT_THROW(splitHeader("date 2021-04-31\n---\n"), agmark::ParseError);
	EXPECT_THROW(splitHeader("date 2021-01-00\n---\n"), agmark::ParseError);
	EXPECT_NO_THROW(splitHeader("date 2020-02-29\n---\n"));
	EXPECT_THROW(splitHeader("date 1900-02-29\n---\n"), agmark::ParseError);
	EXPECT_NO_THROW(splitHeader("date 2000-02-29\n---\n"));
}

TEST(Metadata, MalformedDate) {
	EXPECT_THROW(splitHeader("date 2021-1-123\n---\n"), agmark::ParseError);
	EXPECT_THROW(splitHeader("title x\ndate 21-01-01\n---\n"), agmark::ParseError);
	EXPECT_THROW(agmark::parseDate("2021-01", "date 2021-01"), agmark::ParseError);
}

TEST(Metadata, ProseBeforeRuleIsBody) {
	const std::string src = "Intro text\n---\nmore";
	const auto split = splitHeader(src);
	EXPECT_EQ(src, split.body);
	EXPECT_TRUE(split.metadata.entries.empty());
}

TEST(Metadata, HeadingBeforeRuleIsBody) {
	const std::string src = "# T\n\nx\n---\ny";
	EXPECT_EQ(src, splitHeader(src).body);
}

TEST(Metadata, DateWordInProseDoesNotThrow) {
	EXPECT_NO_THROW(splitHeader("date is soon\n---\n"));
	EXPECT_NO_THROW(splitHeader("date\n---\n"));
	EXPECT_EQ("date is soon\n---\n", splitHeader("date is soon\n---\n").body);
	EXPECT_FALSE(splitHeader("title T\ndate March 3rd\n---\n").metadata.title);
}

TEST(Metadata, ShortMonthAndDay) {
	const auto date = agmark::parseDate("2019-1-5", "date 2019-1-5");
	EXPECT_EQ("January 5, 2019", date.rendered);
}

// each month renders under its own name
TEST(Metadata, MonthNames) {
	const char* expected[] = {
		"January", "February", "March", "April", "May", "June",
		"July", "August", "September", "October", "November", "December"
	};
	for (int m = 1; m <= 12; ++m) {
		EXPECT_EQ(expected[m - 1], agmark::monthName(m));
	}
	EXPECT_THROW(agmark::monthName(0), std::out_of_range);
	EXPECT_THROW(agmark::monthName(13), std::out_of_range);
}

TEST(Metadata, DatesSortChronologically) {
	const auto a = agmark::parseDate("2020-12-31", "");
	const auto b = agmark::parseDate("2021-1-1", "");
	const auto c = agmark::parseDate("2021-01-02", "");
	EXPECT_LT(a.sortKey(), b.sortKey());
	EXPECT_LT(b.sortKey(), c.sortKey());
}

TEST(Metadata, ToJson) {
	const auto meta = splitHeader("title T\ndate 2022-05-09\nmood\n---\n").metadata;
	const auto j = meta.toJson();
	EXPECT_EQ("T", j["title"].get<std::string>());
	EXPECT_TRUE(j["author"].is_null());
	EXPECT_TRUE(j["template"].is_null());
	EXPECT_FALSE(j["static"].get<bool>());
	EXPECT_EQ(5, j["date"]["month"].get<int>());
	EXPECT_EQ("May 9, 2022", j["date"]["rendered"].get<std::string>());
	EXPECT_TRUE(j["entries"]["mood"].is_null());
	EXPECT_EQ("T", j["entries"]["title"].get<std::string>());
}
