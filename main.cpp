#include "parser.hpp"
#include "output.hpp"
#include <dlg/dlg.hpp>

#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>

void printHelp() {
	std::cout << "Usage: sexpr-dump [--strict] <source>\n";
	std::cout << "\tPrints every expression in source, one per line.\n";
	std::cout << "\tWith --strict, source must contain exactly one expression\n";
}

std::string readFile(std::string_view filename) {
	auto openmode = std::ios::ate;
	std::ifstream ifs(std::string{filename}, openmode);
	ifs.exceptions(std::ostream::failbit | std::ostream::badbit);

	auto size = ifs.tellg();
	ifs.seekg(0, std::ios::beg);

	std::string buffer;
	buffer.resize(size);
	ifs.read(buffer.data(), size);
	return buffer;
}

int main(int argc, const char** argv) {
	if(argc < 2 || !std::strcmp(argv[1], "-h") ||
			!std::strcmp(argv[1], "--help")) {
		printHelp();
		return -1;
	}

	auto strict = false;
	auto input = argv[1];
	if(!std::strcmp(argv[1], "--strict")) {
		if(argc < 3) {
			printHelp();
			return -1;
		}

		strict = true;
		input = argv[2];
	}

	std::string source;
	try {
		source = readFile(input);
	} catch(const std::exception& err) {
		dlg_error("Can't read input '{}': {}", input, err.what());
		return -2;
	}

	if(strict) {
		auto res = sexpr::read(source, {true});
		if(auto err = std::get_if<sexpr::ParseError>(&res)) {
			dlg_error("{}: {}", input, *err);
			return -3;
		}

		std::cout << std::get<sexpr::Expression>(res) << "\n";
		return 0;
	}

	auto res = sexpr::readAll(source);
	if(auto err = std::get_if<sexpr::ParseError>(&res)) {
		dlg_error("{}: {}", input, *err);
		return -3;
	}

	auto& exprs = std::get<std::vector<sexpr::Expression>>(res);
	if(exprs.empty()) {
		dlg_warn("{}: no expressions", input);
	}

	for(auto& expr : exprs) {
		std::cout << expr << "\n";
	}
}
