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

// Agmark.h : AGM markup to HTML compiler.
#ifndef AGMARK_H
#define AGMARK_H
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include "TagDefs.h"
#include "Metadata.h"
#include "agmark_export.h"

struct AGMRegion {
	std::string_view tagName;
	const agmark::TagDefinition* def;
	std::string inner;
	agmark::AttributeMap attributes;
	agmark::RenderMode mode;
	bool isOpen;

	inline bool innerIsEmpty() const noexcept { return inner.empty(); }
	void append(std::string_view text) { inner.append(text); }
	void prepend(std::string_view text) { inner.insert(0, text); }
};

namespace agmark {
	constexpr size_t NPOS = static_cast<size_t>(-1);
	namespace impl {
		struct Context;
	}

	class Engine {
	public:
		Engine(const Engine&) = delete;
		AGMARK_EXPORT Engine(Engine&& o) noexcept;

		AGMARK_EXPORT Engine(const char* begin, const char* end);
		AGMARK_EXPORT virtual ~Engine();

		// consumes one scanning step; false once the input is exhausted
		AGMARK_EXPORT bool processChar();

		AGMARK_EXPORT void finalizeDocument();

		AGMARK_EXPORT auto regions() const noexcept -> const std::vector<AGMRegion>&;
	private:
		impl::Context* ctx_;
	};

	struct CompiledDocument {
		std::string html;
		Metadata metadata;
	};

	AGMARK_EXPORT auto agmToHtml(std::string_view body) -> std::string;
	AGMARK_EXPORT auto agmToHtml(std::istream& in) -> std::string;
	AGMARK_EXPORT bool htmlExport(const Engine& e, std::ostream& out);

	AGMARK_EXPORT auto compileDocument(std::string_view source) -> CompiledDocument;
}

#endif
