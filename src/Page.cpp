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

#include "agmark/Page.h"
#include <string>
#include <string_view>

namespace {
	std::string_view trimBlanks(std::string_view str) noexcept {
		const auto first = str.find_first_not_of(" \t");
		if (first == std::string_view::npos) {
			return {};
		}
		return str.substr(first, str.find_last_not_of(" \t") - first + 1);
	}

	std::string placeholderValue(std::string_view key, const agmark::CompiledDocument& doc) {
		const agmark::Metadata& meta = doc.metadata;
		if (key == "content") {
			return doc.html;
		}
		if (key == "title") {
			return agmark::escapeText(meta.title.value_or(""));
		}
		if (key == "author") {
			return meta.isStatic ? std::string{} : agmark::escapeText(meta.author.value_or(""));
		}
		if (key == "date") {
			return meta.isStatic or not meta.date ? std::string{} : meta.date->rendered;
		}
		if (auto it = meta.entries.find(std::string{ key }); it != meta.entries.end() and it->second) {
			return agmark::escapeText(*it->second);
		}
		return {};
	}
}

auto agmark::renderPage(std::string_view pageTemplate, const CompiledDocument& doc) -> std::string {
	std::string out;
	out.reserve(pageTemplate.size() + doc.html.size());

	size_t pos = 0;
	while (pos < pageTemplate.size()) {
		const size_t open = pageTemplate.find("{{", pos);
		const size_t close = open == std::string_view::npos ? open : pageTemplate.find("}}", open + 2);
		if (close == std::string_view::npos) {
			out.append(pageTemplate.substr(pos));
			break;
		}
		out.append(pageTemplate.substr(pos, open - pos));
		out.append(placeholderValue(trimBlanks(pageTemplate.substr(open + 2, close - open - 2)), doc));
		pos = close + 2;
	}
	return out;
}

auto agmark::templateNameOf(const Metadata& metadata) -> std::string {
	return metadata.templateName.value_or("default");
}
