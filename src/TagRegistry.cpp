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

#include "agmark/TagDefs.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <fmt/format.h>

namespace ag = agmark;

namespace {
	using ag::ExportPolicy;
	using ag::RenderMode;
	using ag::HookKind;

	std::vector<ag::TagDefinition> buildRegistry() {
		return {
			// structural boundaries, never matched in the source
			{ "section", std::nullopt, std::nullopt, true, false, false, ExportPolicy::PruneIfEmpty, RenderMode::BeginOnly, "section", {}, HookKind::None, HookKind::None },
			{ "section_end", std::nullopt, std::nullopt, true, false, false, ExportPolicy::PruneIfEmpty, RenderMode::EndOnly, "section", {}, HookKind::None, HookKind::None },
			{ "paragraph", std::nullopt, std::nullopt, true, false, false, ExportPolicy::PruneIfEmpty, RenderMode::BeginOnly, "p", {}, HookKind::None, HookKind::None },
			{ "paragraph_end", std::nullopt, std::nullopt, true, false, false, ExportPolicy::PruneIfEmpty, RenderMode::EndOnly, "p", {}, HookKind::None, HookKind::None },
			{ "text", std::nullopt, std::nullopt, true, false, false, ExportPolicy::Auto, RenderMode::Both, std::nullopt, {}, HookKind::None, HookKind::None },

			{ "heading3", "###", std::nullopt, true, false, false, ExportPolicy::Always, RenderMode::Both, "h3", {}, HookKind::HeadingBegin, HookKind::HeadingEnd },
			{ "heading2", "##", std::nullopt, true, false, false, ExportPolicy::Always, RenderMode::Both, "h2", {}, HookKind::HeadingBegin, HookKind::HeadingEnd },
			{ "heading1", "#", std::nullopt, true, false, false, ExportPolicy::Always, RenderMode::Both, "h1", {}, HookKind::HeadingBegin, HookKind::HeadingEnd },

			{ "code_block", "```", "```", true, true, true, ExportPolicy::Always, RenderMode::Both, "pre", { { "class", "code" } }, HookKind::None, HookKind::BlockEnd },
			{ "code", "`", "`", false, true, false, ExportPolicy::Always, RenderMode::Both, "code", {}, HookKind::None, HookKind::None },
			{ "bold", "*", "*", false, false, false, ExportPolicy::Always, RenderMode::Both, "strong", {}, HookKind::None, HookKind::None },
			{ "italic", "/", "/", false, false, false, ExportPolicy::Always, RenderMode::Both, "em", {}, HookKind::None, HookKind::None },

			// "![" must not shadow the named variants
			{ "embed_pixel", "!pixel[", "]", true, false, false, ExportPolicy::Always, RenderMode::SelfClosing, "img", { { "class", "pixel" } }, HookKind::None, HookKind::BlockEnd },
			{ "embed_small", "!small[", "]", true, false, false, ExportPolicy::Always, RenderMode::SelfClosing, "img", { { "class", "small" } }, HookKind::None, HookKind::None },
			{ "embed_image", "![", "]", true, false, false, ExportPolicy::Always, RenderMode::SelfClosing, "img", { { "class", "image" } }, HookKind::None, HookKind::BlockEnd },
			{ "url", "](", ")", true, true, false, ExportPolicy::Never, RenderMode::Both, std::nullopt, {}, HookKind::None, HookKind::UrlEnd },
			{ "link", "[", "]", true, false, false, ExportPolicy::Always, RenderMode::Both, "a", { { "class", "link" } }, HookKind::None, HookKind::None },

			{ "list_item", "- ", std::nullopt, false, false, false, ExportPolicy::Always, RenderMode::Both, "li", {}, HookKind::ListItemBegin, HookKind::None },

			// emitted by hooks only
			{ "list", std::nullopt, std::nullopt, false, false, false, ExportPolicy::Always, RenderMode::Both, "ul", {}, HookKind::None, HookKind::None },
			{ "caption", std::nullopt, std::nullopt, true, false, false, ExportPolicy::Auto, RenderMode::Both, "span", { { "class", "caption" } }, HookKind::None, HookKind::None },
			{ "rule", std::nullopt, std::nullopt, true, false, false, ExportPolicy::Always, RenderMode::SelfClosing, "hr", {}, HookKind::None, HookKind::None },
			{ "anchor", std::nullopt, std::nullopt, false, false, false, ExportPolicy::Always, RenderMode::Both, "a", {}, HookKind::None, HookKind::None },
		};
	}

	std::string escapeAttribute(std::string_view value) {
		std::string out;
		out.reserve(value.size());
		for (const char c : value) {
			switch (c) {
			case '"': out.append("&quot;");
				break;
			case '<': out.append("&lt;");
				break;
			case '>': out.append("&gt;");
				break;
			default: out.push_back(c);
				break;
			}
		}
		return out;
	}
}

auto ag::tagRegistry() noexcept -> const std::vector<TagDefinition>& {
	static const std::vector<TagDefinition> registry = buildRegistry();
	return registry;
}

auto ag::findTag(std::string_view name) noexcept -> const TagDefinition* {
	const auto& registry = tagRegistry();
	auto it = std::find_if(registry.cbegin(), registry.cend(), [name](const TagDefinition& def) { return def.name == name; });
	return it == registry.cend() ? nullptr : &*it;
}

auto ag::requireTag(std::string_view name) -> const TagDefinition& {
	if (const TagDefinition* def = findTag(name)) {
		return *def;
	}
	throw std::out_of_range{ fmt::format("no tag definition named '{}'", name) };
}

bool ag::TagDefinition::shouldExport(const bool innerIsEmpty) const noexcept {
	switch (exportPolicy) {
	case ExportPolicy::Never: return false;
	case ExportPolicy::Auto: return not innerIsEmpty;
	default: return true;
	}
}

bool ag::TagDefinition::canPrune(const bool innerIsEmpty) const noexcept {
	return innerIsEmpty and (exportPolicy == ExportPolicy::Auto or exportPolicy == ExportPolicy::PruneIfEmpty);
}

auto ag::TagDefinition::renderHtml(std::string_view inner, const AttributeMap& attributes, RenderMode mode) const -> std::string {
	std::string out;
	if (not htmlTag) {
		if (mode != RenderMode::SelfClosing) {
			out.append(inner);
		}
		return out;
	}

	auto openingTag = [&](const bool selfClosing) {
		fmt::format_to(std::back_inserter(out), "<{}", *htmlTag);
		for (const auto& [attrName, attrValue] : attributes) {
			if (attrValue) {
				fmt::format_to(std::back_inserter(out), " {}=\"{}\"", attrName, escapeAttribute(*attrValue));
			}
		}
		out.append(selfClosing ? " />" : ">");
	};

	switch (mode) {
	case RenderMode::SelfClosing:
		openingTag(true);
		break;
	case RenderMode::BeginOnly:
		openingTag(false);
		out.append(inner);
		break;
	case RenderMode::EndOnly:
		out.append(inner);
		fmt::format_to(std::back_inserter(out), "</{}>", *htmlTag);
		break;
	case RenderMode::Both:
		openingTag(false);
		out.append(inner);
		fmt::format_to(std::back_inserter(out), "</{}>", *htmlTag);
		break;
	}
	return out;
}

auto ag::escapeText(std::string_view text) -> std::string {
	std::string out;
	out.reserve(text.size());
	for (const char c : text) {
		switch (c) {
		case '<': out.append("&lt;");
			break;
		case '>': out.append("&gt;");
			break;
		default: out.push_back(c);
			break;
		}
	}
	return out;
}
