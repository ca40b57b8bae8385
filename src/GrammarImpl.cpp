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

#include <charconv>
#include <string>
#include <string_view>
#include "GrammarImpl.h"

#include "tao/pegtl.hpp"

namespace {
	struct HeaderState {
		std::vector<agmark_impl::HeaderLine> lines;
		std::string key;
		std::optional<std::string> value;
	};

	struct DateState {
		int  year;
		int month;
		int   day;
	};

	std::string_view trimBlanks(std::string_view str) noexcept {
		const auto first = str.find_first_not_of(" \t\r\n");
		if (first == std::string_view::npos) {
			return {};
		}
		const auto last = str.find_last_not_of(" \t\r\n");
		return str.substr(first, last - first + 1);
	}

	template<typename ActionInput>
	int toInt(const ActionInput& in) noexcept {
		int result{};
		std::from_chars(in.begin(), in.end(), result);
		return result;
	}
}

namespace agmlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct rule_line : seq<string<'-', '-', '-'>, star<blank>, at<eolf>> {};
	struct list_item_ahead : seq<star<blank>, string<'-', ' '>> {};

	struct separator : seq<string<'-', '-', '-'>, star<blank>, eolf> {};
	struct key : identifier {};
	struct value : plus<not_one<'\r', '\n'>> {};
	struct blank_line : seq<star<blank>, eol> {};

	// "date" only names metadata when followed by something shaped like a date
	struct date_key : keyword<'d', 'a', 't', 'e'> {};
	struct date_value : seq<plus<digit>, one<'-'>, plus<digit>, one<'-'>, plus<digit>> {};
	struct date_line : seq<date_key, plus<blank>, date_value, star<blank>, eol> {};
	struct plain_line : seq<not_at<date_key>, key, star<blank>, opt<value>, eol> {};
	struct header_line : sor<date_line, plain_line> {};
	struct header : seq<star<sor<blank_line, header_line>>, separator> {};

	template <typename Rule>
	struct header_action : nothing<Rule> {};

	template <>
	struct header_action<key> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeaderState& s) {
			s.key = in.string();
			s.value.reset();
		}
	};
	template <>
	struct header_action<value> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeaderState& s) {
			const auto trimmed = trimBlanks(in.string_view());
			if (!trimmed.empty()) {
				s.value.emplace(trimmed);
			}
		}
	};
	template <>
	struct header_action<date_key> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeaderState& s) {
			s.key = in.string();
			s.value.reset();
		}
	};
	template <>
	struct header_action<date_value> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeaderState& s) {
			s.value.emplace(in.string_view());
		}
	};
	template <>
	struct header_action<header_line> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeaderState& s) {
			s.lines.push_back({ s.key, s.value, std::string{ trimBlanks(in.string_view()) } });
		}
	};

	struct year : rep<4, digit> {};
	struct month : rep_min_max<1, 2, digit> {};
	struct day : rep_min_max<1, 2, digit> {};
	struct iso_date : seq<year, one<'-'>, month, one<'-'>, day, eof> {};

	template <typename Rule>
	struct date_action : nothing<Rule> {};

	template <>
	struct date_action<year> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, DateState& s) noexcept { s.year = toInt(in); }
	};
	template <>
	struct date_action<month> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, DateState& s) noexcept { s.month = toInt(in); }
	};
	template <>
	struct date_action<day> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, DateState& s) noexcept { s.day = toInt(in); }
	};
}

auto agmark_impl::tryThematicBreak(const char* begin, const char* end) noexcept -> size_t {
	peggi::memory_input<peggi::tracking_mode::eager> input{ begin, end, "rule" };
	if (agmlang::parse<agmlang::rule_line>(input)) {
		return static_cast<size_t>(input.current() - begin);
	}
	return 0;
}

bool agmark_impl::tryListItemAhead(const char* begin, const char* end) noexcept {
	peggi::memory_input<peggi::tracking_mode::eager> input{ begin, end, "list" };
	return agmlang::parse<agmlang::list_item_ahead>(input);
}

auto agmark_impl::tryHeader(std::string_view source) -> std::optional<std::pair<std::vector<HeaderLine>, size_t>> {
	peggi::memory_input<peggi::tracking_mode::eager> input{ source.data(), source.data() + source.size(), "header" };
	HeaderState state{};
	if (!agmlang::parse<agmlang::header, agmlang::header_action>(input, state)) {
		return std::nullopt;
	}
	return std::make_pair(std::move(state.lines), static_cast<size_t>(input.current() - source.data()));
}

bool agmark_impl::tryDate(std::string_view text, int& year, int& month, int& day) noexcept {
	peggi::memory_input<peggi::tracking_mode::eager> input{ text.data(), text.data() + text.size(), "date" };
	DateState state{ 0, 0, 0 };
	if (!agmlang::parse<agmlang::iso_date, agmlang::date_action>(input, state)) {
		return false;
	}
	year = state.year;
	month = state.month;
	day = state.day;
	return true;
}
