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

#ifndef AGMARK_GRAMMAR_IMPL_H
#define AGMARK_GRAMMAR_IMPL_H
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <tao/pegtl/memory_input.hpp>

namespace agmark_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;

	struct HeaderLine {
		std::string key;
		std::optional<std::string> value;
		std::string raw;
	};

	/**
	returns: number of bytes making up a horizontal rule line ("---" plus trailing blanks,
	without the line ending) starting at begin, or 0 when the line is something else
	*/
	auto tryThematicBreak(const char* begin, const char* end) noexcept -> size_t;

	// true when the line starting at begin opens a list item after optional indentation
	bool tryListItemAhead(const char* begin, const char* end) noexcept;

	/**
	returns: header lines and the byte length of the header including its "---" separator,
	or nothing when the source does not start with a metadata header
	*/
	auto tryHeader(std::string_view source) -> std::optional<std::pair<std::vector<HeaderLine>, size_t>>;

	bool tryDate(std::string_view text, int& year, int& month, int& day) noexcept;
}
#endif
