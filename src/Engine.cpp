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

#include "agmark/Agmark.h"
#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include "EngineImpl.h"
#include "GrammarImpl.h"

namespace ag = agmark;
namespace impl = agmark::impl;

namespace {
	bool matchesAt(const impl::Context& ctx, std::string_view delim) noexcept {
		const char* here = ctx.src + ctx.pos;
		if (static_cast<size_t>(ctx.end - here) < delim.size()) {
			return false;
		}
		return std::equal(delim.begin(), delim.end(), here);
	}

	bool preservingWhitespace(const impl::Context& ctx) noexcept {
		return not ctx.regions.empty() and ctx.regions.back().isOpen and ctx.regions.back().def->preservesWhitespace;
	}

	bool tryBeginTag(impl::Context& ctx, const bool atLineStart);
	bool tryEndTag(impl::Context& ctx);
	void appendLiteral(impl::Context& ctx, char c);
	void handleNewline(impl::Context& ctx);
	void noteLineStart(impl::Context& ctx);
	void closeSingleLineTags(impl::Context& ctx);
	void closeInlineTags(impl::Context& ctx);
	void emitRule(impl::Context& ctx);
}

ag::Engine::Engine(ag::Engine&& o) noexcept : ctx_{ o.ctx_ }
{
	o.ctx_ = nullptr;
}

ag::Engine::Engine(const char* begin, const char* end) :
	ctx_{ new impl::Context{ begin, end, 0, {}, {}, {}, nullptr, 0, 0, 0, 0, -1, false, false } }
{
	ctx_->regions.reserve(64);
	impl::appendBoundary(*ctx_, "section");
	impl::openParagraph(*ctx_);
}

ag::Engine::~Engine() { delete ctx_; }

bool ag::Engine::processChar() {
	if (ctx_->finalized or ctx_->src + ctx_->pos >= ctx_->end) {
		return false;
	}
	impl::scanStep(*ctx_);
	return ctx_->src + ctx_->pos < ctx_->end;
}

void ag::Engine::finalizeDocument() {
	impl::finalize(*ctx_);
}

auto ag::Engine::regions() const noexcept -> const std::vector<AGMRegion>& {
	return ctx_->regions;
}

void impl::scanStep(Context& ctx) {
	const char c = ctx.src[ctx.pos];
	const bool raw = preservingWhitespace(ctx);

	if (not raw) {
		if (ctx.escape == 1) {
			ctx.escape = 0;
			appendLiteral(ctx, c);
			++ctx.pos;
			return;
		}
		if (c == '\\') {
			noteLineStart(ctx);
			ctx.escape = 1;
			++ctx.solid;
			++ctx.pos;
			return;
		}
		if (c == '\n') {
			handleNewline(ctx);
			++ctx.pos;
			return;
		}
		if (c == '\r') {
			++ctx.pos;
			return;
		}
		if (ctx.solid == 0 and (c == ' ' or c == '\t')) {
			ctx.indent += c == ' ' ? 1 : 2;
			++ctx.pos;
			return;
		}
		if (ctx.solid == 0 and ctx.exclusive == nullptr) {
			if (const size_t len = agmark_impl::tryThematicBreak(ctx.src + ctx.pos, ctx.end); len != 0) {
				ctx.blankLines = 0;
				emitRule(ctx);
				ctx.pos += len;
				++ctx.solid;
				return;
			}
		}
		noteLineStart(ctx);
	}

	const bool atLineStart = ctx.solid == 0;
	if (not tryBeginTag(ctx, atLineStart) and not tryEndTag(ctx)) {
		appendLiteral(ctx, c);
		++ctx.pos;
	}
	++ctx.solid;
}

void impl::finalize(Context& ctx) {
	if (ctx.finalized) {
		return;
	}
	// a backslash as the very last character has nothing to escape
	if (ctx.escape == 1) {
		ctx.escape = 0;
		appendLiteral(ctx, '\\');
	}
	closeSingleLineTags(ctx);
	if (ctx.listDepth >= 0) {
		listItemBegin(ctx, -1);
	}
	while (!ctx.openRegions.empty()) {
		closeTag(ctx, *ctx.regions[ctx.openRegions.back()].def);
	}
	const auto& registry = tagRegistry();
	for (auto it = registry.rbegin(); it != registry.rend(); ++it) {
		if (ctx.active[it->name]) {
			closeTag(ctx, *it);
		}
	}
	appendBoundary(ctx, "paragraph_end");
	appendBoundary(ctx, "section_end");
	ctx.finalized = true;
}

auto impl::makeRegion(const TagDefinition& def, RenderMode mode, bool isOpen) -> AGMRegion {
	return { def.name, &def, {}, def.defaultAttributes, mode, isOpen };
}

auto impl::appendRegion(Context& ctx, const TagDefinition& def, RenderMode mode, bool isOpen) -> size_t {
	// whatever follows an open element must not land after its closing tag
	if (!ctx.openRegions.empty()) {
		AGMRegion& enclosing = ctx.regions[ctx.openRegions.back()];
		if (enclosing.mode == RenderMode::Both and enclosing.def->htmlTag) {
			enclosing.mode = RenderMode::BeginOnly;
		}
	}
	ctx.regions.push_back(makeRegion(def, mode, isOpen));
	return ctx.regions.size() - 1;
}

auto impl::insertRegion(Context& ctx, size_t beforeLast, AGMRegion region) -> size_t {
	const size_t at = ctx.regions.size() - std::min(beforeLast, ctx.regions.size());
	ctx.regions.insert(ctx.regions.begin() + at, std::move(region));
	for (auto& idx : ctx.openRegions) {
		if (idx >= at) {
			++idx;
		}
	}
	return at;
}

auto impl::currentRegion(Context& ctx) -> AGMRegion& {
	if (ctx.regions.empty() or not ctx.regions.back().isOpen) {
		appendRegion(ctx, requireTag("text"), RenderMode::Both, true);
	}
	return ctx.regions.back();
}

void impl::appendText(Context& ctx, std::string_view text) {
	currentRegion(ctx).append(text);
}

void impl::appendBoundary(Context& ctx, std::string_view tagName) {
	const TagDefinition& def = requireTag(tagName);
	appendRegion(ctx, def, def.renderMode, false);
}

void impl::openParagraph(Context& ctx) {
	appendRegion(ctx, requireTag("paragraph"), RenderMode::BeginOnly, true);
	ctx.softBreakAllowed = false;
}

void impl::paragraphBreak(Context& ctx) {
	appendBoundary(ctx, "paragraph_end");
	openParagraph(ctx);
}

void impl::openTag(Context& ctx, const TagDefinition& def) {
	ctx.active[def.name] = true;
	if (def.isExclusive) {
		ctx.exclusive = &def;
	}
	if (def.isRegion) {
		const size_t idx = appendRegion(ctx, def, def.renderMode, true);
		ctx.openRegions.push_back(idx);
		runHook(ctx, def.onBegin, idx, ctx.indent / 2);
	}
	else {
		runHook(ctx, def.onBegin, NPOS, ctx.indent / 2);
		appendText(ctx, def.renderHtml({}, def.defaultAttributes, RenderMode::BeginOnly));
	}
}

void impl::closeTag(Context& ctx, const TagDefinition& def) {
	ctx.active[def.name] = false;
	if (ctx.exclusive == &def) {
		ctx.exclusive = nullptr;
	}
	if (not def.isRegion) {
		appendText(ctx, def.renderHtml({}, def.defaultAttributes, RenderMode::EndOnly));
		runHook(ctx, def.onEnd, NPOS, ctx.indent / 2);
		return;
	}

	size_t target = NPOS;
	for (auto it = ctx.openRegions.rbegin(); it != ctx.openRegions.rend(); ++it) {
		if (ctx.regions[*it].def == &def) {
			target = *it;
			ctx.openRegions.erase(std::next(it).base());
			break;
		}
	}
	if (target != NPOS) {
		ctx.regions[target].isOpen = false;
		if (ctx.regions[target].mode == RenderMode::BeginOnly and def.renderMode == RenderMode::Both) {
			target = appendRegion(ctx, def, RenderMode::EndOnly, false);
		}
	}
	runHook(ctx, def.onEnd, target, ctx.indent / 2);
}

namespace {
	bool tryBeginTag(impl::Context& ctx, const bool atLineStart) {
		for (const auto& def : ag::tagRegistry()) {
			if (not def.beginDelim) {
				continue;
			}
			if (ctx.exclusive != nullptr and ctx.exclusive != &def) {
				continue;
			}
			if (ctx.active[def.name] or (def.isSingleLine() and not atLineStart)) {
				continue;
			}
			if (matchesAt(ctx, *def.beginDelim)) {
				ctx.pos += def.beginDelim->size();
				impl::openTag(ctx, def);
				return true;
			}
		}
		return false;
	}

	bool tryEndTag(impl::Context& ctx) {
		for (const auto& def : ag::tagRegistry()) {
			if (not def.endDelim) {
				continue;
			}
			if (ctx.exclusive != nullptr and ctx.exclusive != &def) {
				continue;
			}
			if (ctx.active[def.name] and matchesAt(ctx, *def.endDelim)) {
				ctx.pos += def.endDelim->size();
				impl::closeTag(ctx, def);
				return true;
			}
		}
		return false;
	}

	void appendLiteral(impl::Context& ctx, const char c) {
		switch (c) {
		case '<': impl::appendText(ctx, "&lt;");
			break;
		case '>': impl::appendText(ctx, "&gt;");
			break;
		default: impl::appendText(ctx, std::string_view{ &c, 1 });
			break;
		}
		ctx.softBreakAllowed = true;
	}

	void handleNewline(impl::Context& ctx) {
		closeSingleLineTags(ctx);
		if (ctx.listDepth >= 0 and not agmark_impl::tryListItemAhead(ctx.src + ctx.pos + 1, ctx.end)) {
			impl::listItemBegin(ctx, -1);
		}
		if (++ctx.blankLines == 2) {
			closeInlineTags(ctx);
			impl::paragraphBreak(ctx);
		}
		ctx.solid = 0;
		ctx.indent = 0;
	}

	void noteLineStart(impl::Context& ctx) {
		if (ctx.solid != 0) {
			return;
		}
		if (ctx.blankLines == 1 and ctx.softBreakAllowed) {
			impl::appendText(ctx, " ");
		}
		ctx.blankLines = 0;
	}

	void closeSingleLineTags(impl::Context& ctx) {
		const auto& registry = ag::tagRegistry();
		for (auto it = registry.rbegin(); it != registry.rend(); ++it) {
			if (it->isSingleLine() and ctx.active[it->name]) {
				impl::closeTag(ctx, *it);
				ctx.softBreakAllowed = false;
			}
		}
	}

	// inline elements never span a paragraph break
	void closeInlineTags(impl::Context& ctx) {
		const auto& registry = ag::tagRegistry();
		for (auto it = registry.rbegin(); it != registry.rend(); ++it) {
			if (not it->isRegion and ctx.active[it->name]) {
				impl::closeTag(ctx, *it);
			}
		}
	}

	void emitRule(impl::Context& ctx) {
		impl::appendBoundary(ctx, "paragraph_end");
		impl::appendBoundary(ctx, "rule");
		impl::openParagraph(ctx);
	}
}
