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

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include "EngineImpl.h"

namespace impl = agmark::impl;
using agmark::RenderMode;
using agmark::requireTag;

namespace {
	bool isUrlOwner(std::string_view tagName) noexcept {
		return tagName == "link" or tagName == "embed_image" or tagName == "embed_small" or tagName == "embed_pixel";
	}
}

void impl::runHook(Context& ctx, HookKind kind, size_t region, int nestingHint) {
	switch (kind) {
	case HookKind::HeadingBegin: headingBegin(ctx, region);
		break;
	case HookKind::HeadingEnd: headingEnd(ctx, region);
		break;
	case HookKind::UrlEnd: urlEnd(ctx, region);
		break;
	case HookKind::ListItemBegin: listItemBegin(ctx, nestingHint);
		break;
	case HookKind::BlockEnd: blockEnd(ctx);
		break;
	case HookKind::None:
		break;
	}
}

void impl::headingBegin(Context& ctx, size_t region) {
	while (ctx.src + ctx.pos < ctx.end and (ctx.src[ctx.pos] == ' ' or ctx.src[ctx.pos] == '\t')) {
		++ctx.pos;
	}
	const char* lineBegin = ctx.src + ctx.pos;
	const char* lineEnd = std::find(lineBegin, ctx.end, '\n');

	AttributeMap attrs{ { "id", std::nullopt } };
	if (auto slug = slugify({ lineBegin, static_cast<size_t>(lineEnd - lineBegin) }); !slug.empty()) {
		attrs["id"] = std::move(slug);
	}
	// the anchor opens before any inline markup of the heading text
	ctx.regions[region].append(requireTag("anchor").renderHtml({}, attrs, RenderMode::BeginOnly));
}

void impl::headingEnd(Context& ctx, size_t region) {
	if (region != NPOS) {
		ctx.regions[region].append(requireTag("anchor").renderHtml({}, {}, RenderMode::EndOnly));
	}
	appendBoundary(ctx, "paragraph_end");
	appendBoundary(ctx, "section_end");
	appendBoundary(ctx, "section");
	openParagraph(ctx);
}

void impl::blockEnd(Context& ctx) {
	paragraphBreak(ctx);
}

/**
Writes the captured URL into the nearest open link or embed preceding the URL region and
closes that owner. Embeds also take their text as alt text; all but the small variant repeat
it as a visible caption directly after the image.
*/
void impl::urlEnd(Context& ctx, size_t region) {
	if (region == NPOS) {
		return;
	}
	const std::string url = ctx.regions[region].inner;

	size_t owner = NPOS;
	for (size_t i = region; i-- > 0;) {
		if (ctx.regions[i].isOpen and isUrlOwner(ctx.regions[i].tagName)) {
			owner = i;
			break;
		}
	}
	if (owner == NPOS) {
		return;
	}

	const TagDefinition& ownerDef = *ctx.regions[owner].def;
	if (ownerDef.name == "link") {
		ctx.regions[owner].attributes["href"] = url;
	}
	else {
		const std::string text = ctx.regions[owner].inner;
		ctx.regions[owner].attributes["src"] = url;
		ctx.regions[owner].attributes["alt"] = text;
		if (ownerDef.name != "embed_small") {
			AGMRegion caption = makeRegion(requireTag("caption"), RenderMode::Both, false);
			caption.inner = text;
			insertRegion(ctx, ctx.regions.size() - (owner + 1), std::move(caption));
		}
	}
	closeTag(ctx, ownerDef);
}

void impl::listItemBegin(Context& ctx, int depth) {
	const TagDefinition& list = requireTag("list");
	int delta = std::max(depth, -1) - ctx.listDepth;
	for (; delta > 0; --delta) {
		appendText(ctx, list.renderHtml({}, list.defaultAttributes, RenderMode::BeginOnly));
	}
	for (; delta < 0; ++delta) {
		appendText(ctx, list.renderHtml({}, list.defaultAttributes, RenderMode::EndOnly));
	}
	ctx.listDepth = std::max(depth, -1);
}

auto impl::slugify(std::string_view raw) -> std::string {
	std::string slug;
	slug.reserve(raw.size());
	bool pendingSeparator = false;
	for (const char c : raw) {
		const auto uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc)) {
			if (pendingSeparator and !slug.empty()) {
				slug.push_back('-');
			}
			pendingSeparator = false;
			slug.push_back(static_cast<char>(std::tolower(uc)));
		}
		else {
			pendingSeparator = true;
		}
	}
	return slug;
}
