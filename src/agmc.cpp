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
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "agmark/Agmark.h"
#include "agmark/Page.h"

namespace agmc {
	enum class in_type : uint8_t {
		File, StdCIn
	};
	struct CmdArgInfo {
		in_type inSource;
		bool toFile;
		bool metadataOnly;
		std::string outFilename;
		std::string templateFile;
		std::string templateDir;
	};
	enum exit_code : int {
		Ok = 0,
		InputFailed = 1,
		BadTemplate = 2
	};
}

void configureParser(CLI::App& cmdArgParser, agmc::CmdArgInfo& argInfo);
void parseArgs(const CLI::App& argProcessor, agmc::CmdArgInfo& res);

auto readAll(std::istream& stm) -> std::string;
auto loadTemplate(const agmc::CmdArgInfo& args, const agmark::Metadata& metadata) -> std::optional<std::string>;
int convertDocument(const std::string& source, const std::string& name, const agmc::CmdArgInfo& args, std::ostream& out);

std::string correctUserFilename(const std::string& rawStr) noexcept;

int main(int argc, char* argv[])
{
	agmc::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "Compiles AGM markup documents into HTML.", "agmc" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	parseArgs(argProcessor, cmdArgResult);

	int status = agmc::Ok;
	if (cmdArgResult.inSource == agmc::in_type::File) {
		std::vector<std::string> extraArgs = argProcessor.remaining();

		std::optional<std::ofstream> outFileOptional;
		if (cmdArgResult.toFile) {
			outFileOptional.emplace(cmdArgResult.outFilename);
			if (!*outFileOptional) {
				std::cerr << "cannot write " << cmdArgResult.outFilename << "\n";
				return agmc::InputFailed;
			}
		}
		for (const auto& inFilename : extraArgs) {
			std::ifstream streamie{ inFilename };
			if (!streamie) {
				std::cerr << "file not found; skipping " << inFilename << "\n";
				status = std::max<int>(status, agmc::InputFailed);
				continue;
			}
			const std::string source = readAll(streamie);

			if (!cmdArgResult.toFile) {
				outFileOptional.emplace(correctUserFilename(inFilename));
			}
			status = std::max(status, convertDocument(source, inFilename, cmdArgResult, *outFileOptional));
			if (!cmdArgResult.toFile) {
				outFileOptional.reset();
			}
		}
	}
	else {
		std::optional<std::ofstream> maybeFile;
		std::ostream* outStream = &std::cout;
		if (cmdArgResult.toFile) {
			maybeFile.emplace(cmdArgResult.outFilename);
			outStream = &*maybeFile;
		}
		status = convertDocument(readAll(std::cin), "<stdin>", cmdArgResult, *outStream);
	}
	return status;
}

int convertDocument(const std::string& source, const std::string& name, const agmc::CmdArgInfo& args, std::ostream& out) {
	agmark::CompiledDocument doc;
	try {
		doc = agmark::compileDocument(source);
	}
	catch (const agmark::ParseError& e) {
		std::cerr << name << ": " << e.what() << "\n";
		return agmc::InputFailed;
	}

	if (args.metadataOnly) {
		out << std::setw(4) << doc.metadata.toJson() << std::endl;
		return out.fail() ? agmc::InputFailed : agmc::Ok;
	}

	if (args.templateFile.empty() and args.templateDir.empty()) {
		out << doc.html;
	}
	else {
		auto pageTemplate = loadTemplate(args, doc.metadata);
		if (!pageTemplate) {
			std::cerr << name << ": template '" << agmark::templateNameOf(doc.metadata) << "' not found\n";
			return agmc::BadTemplate;
		}
		out << agmark::renderPage(*pageTemplate, doc);
	}
	if (out.fail()) {
		std::cerr << name << ": failed writing output\n";
		return agmc::InputFailed;
	}
	return agmc::Ok;
}

auto loadTemplate(const agmc::CmdArgInfo& args, const agmark::Metadata& metadata) -> std::optional<std::string> {
	std::filesystem::path path{ args.templateFile };
	if (path.empty()) {
		path = std::filesystem::path{ args.templateDir } / (agmark::templateNameOf(metadata) + ".html");
	}
	std::ifstream in{ path };
	if (!in) {
		return std::nullopt;
	}
	return readAll(in);
}

auto readAll(std::istream& stm) -> std::string {
	return { std::istreambuf_iterator<char>{ stm }, std::istreambuf_iterator<char>{} };
}

void parseArgs(const CLI::App& argProcessor, agmc::CmdArgInfo& res) {
	if (argProcessor.remaining_size() != 0) {
		res.inSource = agmc::in_type::File;
	}
	else {
		res.inSource = agmc::in_type::StdCIn;
	}
	res.toFile = !res.outFilename.empty();
}

void configureParser(CLI::App& cmdArgParser, agmc::CmdArgInfo& argInfo) {
	cmdArgParser.allow_extras();
	cmdArgParser.add_option("-o, --output", argInfo.outFilename, "Write all output to this file");
	auto tOpt = cmdArgParser.add_option("-t, --template", argInfo.templateFile, "Embed each document into this page template");
	cmdArgParser.add_option("-d, --template-dir", argInfo.templateDir, "Resolve the 'template' header of each document as <dir>/<name>.html")->excludes(tOpt);
	cmdArgParser.add_flag("-m, --metadata", argInfo.metadataOnly, "Print the parsed metadata header as JSON instead of HTML");
}

std::string correctUserFilename(const std::string& rawStr) noexcept {
	size_t pos = std::min(rawStr.rfind('.'), rawStr.size());
	std::string correctedStr{ rawStr, 0, pos };
	if (rawStr.compare(pos, 5, ".html") != 0) {
		correctedStr.append(".html");
	}
	else {
		correctedStr.append("COPY.html");
	}
	return correctedStr;
}
