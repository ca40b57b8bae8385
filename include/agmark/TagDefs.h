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

#ifndef AGMARK_TAG_DEFS_H
#define AGMARK_TAG_DEFS_H
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "agmark_export.h"

namespace agmark {
	enum class ExportPolicy : uint8_t {
		Always,
		Never,
		Auto,
		PruneIfEmpty
	};

	enum class RenderMode : uint8_t {
		Both,
		BeginOnly,
		EndOnly,
		SelfClosing
	};

	enum class HookKind : uint8_t {
		None,
		HeadingBegin,
		HeadingEnd,
		UrlEnd,
		ListItemBegin,
		BlockEnd
	};

	// attribute name -> value; an absent value is left out of the rendered tag
	using AttributeMap = std::map<std::string, std::optional<std::string>>;

	struct TagDefinition {
		std::string_view name;
		std::optional<std::string_view> beginDelim;
		std::optional<std::string_view> endDelim;
		bool isRegion;
		bool isExclusive;
		bool preservesWhitespace;
		ExportPolicy exportPolicy;
		RenderMode     renderMode;
		std::optional<std::string_view> htmlTag;
		AttributeMap defaultAttributes;
		HookKind onBegin;
		HookKind   onEnd;

		// begin delimiter without an end delimiter: closed by the next newline
		inline bool isSingleLine() const noexcept {
			return beginDelim.has_value() and not endDelim.has_value();
		}
		AGMARK_EXPORT bool shouldExport(bool innerIsEmpty) const noexcept;
		AGMARK_EXPORT bool canPrune(bool innerIsEmpty) const noexcept;
		AGMARK_EXPORT auto renderHtml(std::string_view inner, const AttributeMap& attributes, RenderMode mode) const -> std::string;
	};

	/**
	The registry is built once and never modified. Its order is the order in which
	begin and end delimiters are tried at a given offset; a delimiter that is a
	prefix of another one must come after it.
	*/
	AGMARK_EXPORT auto tagRegistry() noexcept -> const std::vector<TagDefinition>&;
	AGMARK_EXPORT auto findTag(std::string_view name) noexcept -> const TagDefinition*;
	AGMARK_EXPORT auto requireTag(std::string_view name) -> const TagDefinition&;

	AGMARK_EXPORT auto escapeText(std::string_view text) -> std::string;
}

#endif
