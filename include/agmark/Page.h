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

#ifndef AGMARK_PAGE_H
#define AGMARK_PAGE_H
#include <string>
#include <string_view>
#include "Agmark.h"
#include "agmark_export.h"

namespace agmark {
	/**
	Replaces {{content}}, {{title}}, {{author}}, {{date}} and {{<header key>}} in
	pageTemplate. A static document leaves author and date blank, as does any
	placeholder without a value.
	*/
	AGMARK_EXPORT auto renderPage(std::string_view pageTemplate, const CompiledDocument& doc) -> std::string;

	AGMARK_EXPORT auto templateNameOf(const Metadata& metadata) -> std::string;
}

#endif
