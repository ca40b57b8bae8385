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

#ifndef AGMARK_ENGINE_IMPL_H
#define AGMARK_ENGINE_IMPL_H
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "agmark/Agmark.h"

namespace agmark {
	namespace impl {
		struct Context {
			const char* src;
			const char* end;
			size_t      pos;

			std::vector<AGMRegion> regions;
			// sequence indices of open region-tag regions, innermost last
			std::vector<size_t> openRegions;
			std::map<std::string_view, bool> active;
			const TagDefinition* exclusive;

			int escape;
			int blankLines;
			int solid;
			int indent;
			int listDepth;
			bool softBreakAllowed;
			bool finalized;
		};

		void scanStep(Context& ctx);
		void finalize(Context& ctx);

		auto makeRegion(const TagDefinition& def, RenderMode mode, bool isOpen) -> AGMRegion;
		auto appendRegion(Context& ctx, const TagDefinition& def, RenderMode mode, bool isOpen) -> size_t;
		auto insertRegion(Context& ctx, size_t beforeLast, AGMRegion region) -> size_t;
		auto currentRegion(Context& ctx) -> AGMRegion&;
		void appendText(Context& ctx, std::string_view text);
		void appendBoundary(Context& ctx, std::string_view tagName);
		void openParagraph(Context& ctx);
		void paragraphBreak(Context& ctx);

		void openTag(Context& ctx, const TagDefinition& def);
		void closeTag(Context& ctx, const TagDefinition& def);

		// HookLogic.cpp
		void runHook(Context& ctx, HookKind kind, size_t region, int nestingHint);
		void headingBegin(Context& ctx, size_t region);
		void headingEnd(Context& ctx, size_t region);
		void urlEnd(Context& ctx, size_t region);
		void listItemBegin(Context& ctx, int depth);
		void blockEnd(Context& ctx);

		auto slugify(std::string_view raw) -> std::string;
	}
}
#endif
