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

#ifndef AGMARK_METADATA_H
#define AGMARK_METADATA_H
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <nlohmann/json_fwd.hpp>
#include "agmark_export.h"

namespace agmark {
	/// Raised for structurally invalid metadata; names the header line at fault.
	class AGMARK_EXPORT ParseError : public std::runtime_error {
	public:
		ParseError(const std::string& message, std::string line);

		const std::string& line() const noexcept { return line_; }
	private:
		std::string line_;
	};

	struct Date {
		int  year;
		int month;
		int   day;
		std::string rendered;

		auto sortKey() const noexcept -> std::tuple<int, int, int> { return { year, month, day }; }
	};

	struct Metadata {
		std::optional<std::string> title;
		std::optional<std::string> author;
		std::optional<Date> date;
		std::optional<std::string> templateName;
		bool isStatic = false;
		// every header key, free-form keys included
		std::map<std::string, std::optional<std::string>> entries;

		AGMARK_EXPORT auto toJson() const -> nlohmann::json;
	};

	struct SplitSource {
		Metadata metadata;
		std::string_view body;
	};

	AGMARK_EXPORT auto splitHeader(std::string_view source) -> SplitSource;
	AGMARK_EXPORT auto parseDate(std::string_view value, const std::string& headerLine) -> Date;
	AGMARK_EXPORT auto monthName(int month) -> std::string_view;
}

#endif
