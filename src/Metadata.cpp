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

#include "agmark/Metadata.h"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "GrammarImpl.h"

namespace ag = agmark;

namespace {
	constexpr std::array<std::string_view, 12> MONTH_NAMES = {
		"January", "February", "March", "April", "May", "June",
		"July", "August", "September", "October", "November", "December"
	};

	int daysInMonth(const int year, const int month) noexcept {
		constexpr int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
		const bool leap = (year % 4 == 0 and year % 100 != 0) or year % 400 == 0;
		return month == 2 and leap ? 29 : days[month - 1];
	}

	// prose ahead of a "---" rule must not pass for a header
	bool isKnownKey(const agmark_impl::HeaderLine& line) noexcept {
		return line.key == "title" or line.key == "author" or line.key == "date" or line.key == "template" or line.key == "static";
	}

	nlohmann::json optionalToJson(const std::optional<std::string>& value) {
		return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
	}
}

ag::ParseError::ParseError(const std::string& message, std::string line) : std::runtime_error{ message }, line_{ std::move(line) } {}

auto ag::monthName(int month) -> std::string_view {
	if (month < 1 or month > static_cast<int>(MONTH_NAMES.size())) {
		throw std::out_of_range{ fmt::format("month {} is not in 1..12", month) };
	}
	return MONTH_NAMES[static_cast<size_t>(month - 1)];
}

auto ag::parseDate(std::string_view value, const std::string& headerLine) -> Date {
	int year{}, month{}, day{};
	if (!agmark_impl::tryDate(value, year, month, day)) {
		throw ParseError{ fmt::format("malformed date '{}' in header line '{}', expected YYYY-MM-DD", value, headerLine), headerLine };
	}
	if (month < 1 or month > 12) {
		throw ParseError{ fmt::format("month {} out of range in header line '{}'", month, headerLine), headerLine };
	}
	if (day < 1 or day > daysInMonth(year, month)) {
		throw ParseError{ fmt::format("day {} out of range in header line '{}'", day, headerLine), headerLine };
	}
	return { year, month, day, fmt::format("{} {}, {}", monthName(month), day, year) };
}

auto ag::splitHeader(std::string_view source) -> SplitSource {
	SplitSource result{ {}, source };
	auto parsed = agmark_impl::tryHeader(source);
	if (!parsed or std::none_of(parsed->first.cbegin(), parsed->first.cend(), isKnownKey)) {
		return result;
	}

	Metadata& meta = result.metadata;
	for (const auto& line : parsed->first) {
		meta.entries[line.key] = line.value;
		if (line.key == "title") {
			meta.title = line.value;
		}
		else if (line.key == "author") {
			meta.author = line.value;
		}
		else if (line.key == "template") {
			meta.templateName = line.value;
		}
		else if (line.key == "static") {
			meta.isStatic = true;
		}
		else if (line.key == "date") {
			meta.date = parseDate(*line.value, line.raw);
		}
	}
	result.body = source.substr(parsed->second);
	return result;
}

auto ag::Metadata::toJson() const -> nlohmann::json {
	nlohmann::json j = nlohmann::json::object();
	j["title"] = optionalToJson(title);
	j["author"] = optionalToJson(author);
	j["template"] = optionalToJson(templateName);
	j["static"] = isStatic;
	if (date) {
		j["date"] = {
			{ "year", date->year },
			{ "month", date->month },
			{ "day", date->day },
			{ "rendered", date->rendered }
		};
	}
	else {
		j["date"] = nullptr;
	}
	nlohmann::json entryObj = nlohmann::json::object();
	for (const auto& [key, value] : entries) {
		entryObj[key] = optionalToJson(value);
	}
	j["entries"] = std::move(entryObj);
	return j;
}
