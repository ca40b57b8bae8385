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
#include <sstream>
#include <string>
#include "agmark/Agmark.h"

namespace {
	size_t countOf(const std::string& haystack, const std::string& needle) {
		size_t n = 0;
		for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
			++n;
		}
		return n;
	}
}

TEST(Engine, EmptyInput) {
	EXPECT_EQ("<section></section>", agmark::agmToHtml(""));
}

TEST(Engine, Bold) {
	EXPECT_EQ("<section><p><strong>bold</strong></p></section>", agmark::agmToHtml("*bold*"));
}

TEST(Engine, ItalicInsideBold) {
	EXPECT_EQ("<section><p><strong>a <em>b</em></strong></p></section>", agmark::agmToHtml("*a /b/*"));
}

TEST(Engine, UnclosedInlineTagClosedAtEnd) {
	EXPECT_EQ("<section><p><strong>bold</strong></p></section>", agmark::agmToHtml("*bold"));
}

TEST(Engine, SoftBreakJoinsLines) {
	EXPECT_EQ("<section><p>a b</p></section>", agmark::agmToHtml("a\nb"));
}

TEST(Engine, BlankLineStartsParagraph) {
	EXPECT_EQ("<section><p>a</p><p>b</p></section>", agmark::agmToHtml("a\n\nb"));
}

TEST(Engine, CarriageReturnsIgnored) {
	EXPECT_EQ(agmark::agmToHtml("a\n\nb"), agmark::agmToHtml("a\r\n\r\nb"));
}

TEST(Engine, HorizontalRule) {
	EXPECT_EQ("<section><p>a</p><hr /><p>b</p></section>", agmark::agmToHtml("a\n---\nb"));
}

TEST(Engine, AngleBracketsEscaped) {
	EXPECT_EQ("<section><p>a&lt;b&gt;</p></section>", agmark::agmToHtml("a<b>"));
}

TEST(Engine, BackslashEscapesDelimiter) {
	EXPECT_EQ("<section><p>*x*</p></section>", agmark::agmToHtml("\\*x\\*"));
}

TEST(Engine, Link) {
	EXPECT_EQ("<section><p><a class=\"link\" href=\"http://example.com\">text</a></p></section>",
		agmark::agmToHtml("[text](http://example.com)"));
}

TEST(Engine, UrlIsNotFormatted) {
	const auto html = agmark::agmToHtml("[x](http://a/b/c)");
	EXPECT_NE(std::string::npos, html.find("href=\"http://a/b/c\""));
	EXPECT_EQ(std::string::npos, html.find("<em>"));
}

TEST(Engine, ImageWithCaption) {
	EXPECT_EQ("<section><p><img alt=\"A cat\" class=\"image\" src=\"cat.png\" /><span class=\"caption\">A cat</span></p></section>",
		agmark::agmToHtml("![A cat](cat.png)"));
}

TEST(Engine, SmallImageHasNoCaption) {
	const auto html = agmark::agmToHtml("!small[icon](i.png)");
	EXPECT_NE(std::string::npos, html.find("<img alt=\"icon\" class=\"small\" src=\"i.png\" />"));
	EXPECT_EQ(std::string::npos, html.find("caption"));
}

TEST(Engine, PixelImage) {
	const auto html = agmark::agmToHtml("!pixel[dot](d.png)");
	EXPECT_NE(std::string::npos, html.find("<img alt=\"dot\" class=\"pixel\" src=\"d.png\" />"));
	EXPECT_NE(std::string::npos, html.find("<span class=\"caption\">dot</span>"));
}

TEST(Engine, Heading) {
	EXPECT_EQ("<section><p><h1><a id=\"heading-one\">Heading One</a></h1></p></section><section></section>",
		agmark::agmToHtml("# Heading One\n"));
}

TEST(Engine, HeadingLevels) {
	EXPECT_NE(std::string::npos, agmark::agmToHtml("## Two\n").find("<h2><a id=\"two\">Two</a></h2>"));
	EXPECT_NE(std::string::npos, agmark::agmToHtml("### Three\n").find("<h3><a id=\"three\">Three</a></h3>"));
}

TEST(Engine, HashOnlyAtLineStart) {
	EXPECT_EQ("<section><p>a # b</p></section>", agmark::agmToHtml("a # b"));
}

TEST(Engine, HeadingWithLinkStaysNested) {
	const auto html = agmark::agmToHtml("# See [x](u) now\n");
	EXPECT_NE(std::string::npos, html.find("<h1><a id=\"see-x-u-now\">See <a class=\"link\" href=\"u\">x</a> now</a></h1>"));
}

TEST(Engine, List) {
	EXPECT_EQ("<section><p><ul><li>a</li><li>b</li></ul></p></section>", agmark::agmToHtml("- a\n- b\n"));
}

TEST(Engine, NestedList) {
	const auto html = agmark::agmToHtml("- a\n  - b\n- c\n");
	EXPECT_NE(std::string::npos, html.find("<ul><li>a</li><ul><li>b</li></ul><li>c</li></ul>"));
}

TEST(Engine, ListClosedAtEndOfInput) {
	const auto html = agmark::agmToHtml("- a");
	EXPECT_EQ(countOf(html, "<ul>"), countOf(html, "</ul>"));
	EXPECT_EQ(countOf(html, "<li>"), countOf(html, "</li>"));
}

TEST(Engine, CodeBlockIsLiteral) {
	EXPECT_EQ("<section><p><pre class=\"code\">\n*not bold*\n</pre></p></section>",
		agmark::agmToHtml("```\n*not bold*\n```"));
}

TEST(Engine, InlineCodeIsExclusive) {
	EXPECT_EQ("<section><p><code>*x*</code></p></section>", agmark::agmToHtml("`*x*`"));
}

TEST(Engine, TagsBalanced) {
	const auto html = agmark::agmToHtml("# Title\n\nSome *bold /and/ italic* [link](x)\n\n- one\n- two\n\n```\ncode\n```\n---\n![pic](p.png)");
	for (const std::string tag : { "section", "p", "strong", "em", "a", "ul", "li", "pre", "h1" }) {
		EXPECT_EQ(countOf(html, "<" + tag + ">") + countOf(html, "<" + tag + " "), countOf(html, "</" + tag + ">")) << tag;
	}
}

TEST(Engine, TrailingBackslashKeptLiterally) {
	EXPECT_EQ("<section><p>a\\</p></section>", agmark::agmToHtml("a\\"));
}

TEST(Engine, InlineTagClosedAtParagraphBreak) {
	EXPECT_EQ("<section><p><strong>x</strong></p><p>y</p></section>", agmark::agmToHtml("*x\n\ny"));
	EXPECT_EQ("<section><p><code>a</code></p><p>*b*</p></section>", agmark::agmToHtml("`a\n\n\\*b\\*"));
}

TEST(Engine, TabIndentCountsTwo) {
	EXPECT_EQ(agmark::agmToHtml("- a\n  - b\n"), agmark::agmToHtml("- a\n\t- b\n"));
	EXPECT_EQ("<section><p><ul><li>a</li><ul><li>b</li></ul></ul></p></section>", agmark::agmToHtml("- a\n\t- b\n"));
}

TEST(Engine, DedentClosesSeveralLevels) {
	EXPECT_EQ("<section><p><ul><li>a</li><ul><li>b</li><ul><li>c</li></ul></ul><li>d</li></ul></p></section>",
		agmark::agmToHtml("- a\n  - b\n    - c\n- d\n"));
}

TEST(Engine, MidLineBlockEndsParagraph) {
	EXPECT_EQ("<section><p>x <pre class=\"code\">y</pre></p><p> z</p></section>", agmark::agmToHtml("x ```y``` z"));
}

TEST(Engine, UrlWithoutOwnerIsDropped) {
	EXPECT_EQ("<section><p>ac</p></section>", agmark::agmToHtml("a](b)c"));
}

TEST(Engine, HeaderlessDocumentWithRule) {
	const auto doc = agmark::compileDocument("Intro text\n---\nmore");
	EXPECT_TRUE(doc.metadata.entries.empty());
	EXPECT_EQ("<section><p>Intro text</p><hr /><p>more</p></section>", doc.html);
}

TEST(Engine, ProcessCharStopsAfterFinalize) {
	const std::string src = "abc";
	agmark::Engine engine{ src.data(), src.data() + src.size() };
	while (engine.processChar()) {
	}
	engine.finalizeDocument();
	const size_t count = engine.regions().size();
	EXPECT_FALSE(engine.processChar());
	engine.finalizeDocument();
	EXPECT_EQ(count, engine.regions().size());
	EXPECT_EQ("section", engine.regions().front().tagName);
	EXPECT_EQ("section_end", engine.regions().back().tagName);
}

TEST(Engine, ExportToStream) {
	const std::string src = "hi";
	agmark::Engine engine{ src.data(), src.data() + src.size() };
	while (engine.processChar()) {
	}
	engine.finalizeDocument();
	std::ostringstream out;
	EXPECT_TRUE(agmark::htmlExport(engine, out));
	EXPECT_EQ("<section><p>hi</p></section>", out.str());
}

TEST(Engine, StreamOverload) {
	std::istringstream in{ "*x*" };
	EXPECT_EQ(agmark::agmToHtml("*x*"), agmark::agmToHtml(in));
}

TEST(Engine, CompileDocumentStripsHeader) {
	const auto doc = agmark::compileDocument("title Hello\n---\n*x*");
	EXPECT_EQ("Hello", doc.metadata.title.value());
	EXPECT_EQ("<section><p><strong>x</strong></p></section>", doc.html);
}
