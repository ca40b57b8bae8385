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
#include <iterator>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

auto agmark::agmToHtml(std::string_view body) -> std::string {
	agmark::Engine engine{ body.data(), body.data() + body.size() };
	bool success = true;
	while (success) {
		success = engine.processChar();
	}
	engine.finalizeDocument();
	std::ostringstream sout{};
	htmlExport(engine, sout);
	return sout.str();
}
auto agmark::agmToHtml(std::istream& in) -> std::string {
	const std::string body{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
	return agmToHtml(std::string_view{ body });
}

auto agmark::compileDocument(std::string_view source) -> CompiledDocument {
	auto [metadata, body] = splitHeader(source);
	return { agmToHtml(body), std::move(metadata) };
}

namespace {
	using agmark::RenderMode;

	bool isExported(const AGMRegion& r) noexcept {
		return r.def->shouldExport(r.innerIsEmpty());
	}

	// neighbours that render nothing at all are skipped
	const AGMRegion* nextExported(const std::vector<AGMRegion>& regions, size_t i) noexcept {
		for (size_t j = i + 1; j < regions.size(); ++j) {
			if (isExported(regions[j])) {
				return &regions[j];
			}
		}
		return nullptr;
	}
	const AGMRegion* prevExported(const std::vector<AGMRegion>& regions, size_t i) noexcept {
		for (size_t j = i; j-- > 0;) {
			if (isExported(regions[j])) {
				return &regions[j];
			}
		}
		return nullptr;
	}

	bool sameElement(const AGMRegion& a, const AGMRegion& b) noexcept {
		return a.def->htmlTag and b.def->htmlTag and *a.def->htmlTag == *b.def->htmlTag;
	}

	/**
	An empty, prunable half that directly meets its other half would only render as
	an empty element split over two regions, e.g. "<p></p>" between two section boundaries.
	*/
	bool isRedundantPair(const std::vector<AGMRegion>& regions, size_t i) noexcept {
		const AGMRegion& r = regions[i];
		if (not r.def->canPrune(r.innerIsEmpty())) {
			return false;
		}
		if (r.mode == RenderMode::BeginOnly) {
			const AGMRegion* next = nextExported(regions, i);
			return next and sameElement(r, *next) and next->mode == RenderMode::EndOnly;
		}
		if (r.mode == RenderMode::EndOnly) {
			const AGMRegion* prev = prevExported(regions, i);
			return prev and sameElement(r, *prev) and prev->mode == RenderMode::BeginOnly and prev->def->canPrune(prev->innerIsEmpty());
		}
		return false;
	}
}

bool agmark::htmlExport(const agmark::Engine& e, std::ostream& out) {
	const auto& regions = e.regions();
	std::map<std::string_view, int> openCounts{};

	for (size_t i = 0; i < regions.size() and not out.fail(); ++i) {
		const AGMRegion& region = regions[i];
		if (not isExported(region) or isRedundantPair(regions, i)) {
			continue;
		}
		if (region.def->htmlTag) {
			int& openCount = openCounts[*region.def->htmlTag];
			if (region.mode == RenderMode::EndOnly) {
				// its opening half was pruned
				if (openCount <= 0) {
					continue;
				}
				--openCount;
			}
			else if (region.mode == RenderMode::BeginOnly) {
				++openCount;
			}
		}
		out << region.def->renderHtml(region.inner, region.attributes, region.mode);
	}
	return not out.fail();
}
