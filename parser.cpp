#include "parser.hpp"
#include "output.hpp"
#include <dlg/dlg.hpp>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace sexpr {
namespace {

using TokenIt = std::vector<Token>::const_iterator;

bool whitespace(char c) {
	return std::isspace(static_cast<unsigned char>(c));
}

bool delimiter(char c) {
	return c == '(' || c == ')' || c == '\'';
}

void skipws(std::string_view& source, Location& loc) {
	while(!source.empty() && whitespace(source[0])) {
		if(source[0] == '\n') {
			++loc.row;
			loc.col = 0;
		} else {
			++loc.col;
		}
		source = source.substr(1);
	}
}

std::string_view consume(std::string_view& source, std::size_t n, Location& loc) {
	auto token = source.substr(0, n);
	source = source.substr(n);
	loc.col += n;
	return token;
}

// loc will be the location behind the last character
std::vector<Token> tokenize(std::string_view source, Location& loc) {
	std::vector<Token> tokens;
	tokens.reserve(source.size() / 8);

	while(true) {
		skipws(source, loc);
		if(source.empty()) {
			break;
		}

		auto n = 0u;
		while(n < source.size() && !whitespace(source[n]) && !delimiter(source[n])) {
			++n;
		}

		if(n > 0) {
			auto oloc = loc;
			tokens.push_back({consume(source, n, loc), oloc});
		}

		if(!source.empty() && delimiter(source[0])) {
			auto oloc = loc;
			tokens.push_back({consume(source, 1, loc), oloc});
		}
	}

	return tokens;
}

bool parseNumber(std::string_view token, double& value) {
	// strtod would accept hex floats, we don't
	if(token.find_first_of("xX") != token.npos) {
		return false;
	}

	// the token isn't null-terminated
	std::string buf {token};
	char* end {};
	value = std::strtod(buf.c_str(), &end);
	return end != buf.c_str() && end == buf.c_str() + buf.size();
}

ReadResult nextExpression(TokenIt& it, TokenIt end, const Location& eof,
		unsigned depth) {
	if(it == end) {
		return ParseError{ErrorKind::eUnexpectedEOF, eof};
	}

	auto& token = *it;
	dlg_assert(!token.text.empty());
	++it;

	auto loc = token.loc;
	loc.depth = depth;

	if(token.text == "(") {
		List list;
		while(it != end && it->text != ")") {
			auto res = nextExpression(it, end, eof, depth + 1);
			if(auto err = std::get_if<ParseError>(&res)) {
				return *err;
			}

			list.values.push_back(std::move(std::get<Expression>(res)));
		}

		if(it == end) {
			return ParseError{ErrorKind::eMissingClosingParen, loc};
		}

		++it; // skip ')'
		return Expression{std::move(list), loc};
	}

	if(token.text == ")") {
		return ParseError{ErrorKind::eUnexpectedClosingParen, loc};
	}

	return parseAtom(token.text, loc);
}

} // anon namespace

bool operator==(const List& a, const List& b) {
	return a.values == b.values;
}

ReadError::ReadError(const ParseError& err) :
	std::runtime_error(toString(err)), error(err) {
}

std::vector<Token> tokenize(std::string_view source) {
	Location loc {};
	return tokenize(source, loc);
}

Expression parseAtom(std::string_view token, Location loc) {
	if(token.empty()) {
		return {Symbol{token}, loc};
	}

	// 1: numbers. Tried for every length, "5" is a number
	auto first = token[0];
	if(std::isdigit(static_cast<unsigned char>(first)) ||
			first == '+' || first == '-') {
		double value;
		if(parseNumber(token, value)) {
			return {value, loc};
		}
	}

	// 2: any other single character is a symbol
	if(token.size() == 1) {
		return {Symbol{token}, loc};
	}

	// 3: keywords
	if(token == "true") {
		return {true, loc};
	} else if(token == "false") {
		return {false, loc};
	} else if(token == "null") {
		return {Null{}, loc};
	}

	// 4: string literal, no escapes
	if(token.front() == '"' && token.back() == '"') {
		return {token.substr(1, token.size() - 2), loc};
	}

	return {Symbol{token}, loc};
}

ReadResult read(std::string_view source, const ReadOptions& opts) {
	Location eof {};
	auto tokens = tokenize(source, eof);
	auto it = tokens.cbegin();

	auto res = nextExpression(it, tokens.cend(), eof, 0u);
	if(std::holds_alternative<ParseError>(res) || it == tokens.cend()) {
		return res;
	}

	if(opts.strict) {
		return ParseError{ErrorKind::eTrailingTokens, it->loc};
	}

	dlg_debug("read: ignoring {} trailing tokens at {}:{}",
		tokens.cend() - it, it->loc.row, it->loc.col);
	return res;
}

ReadAllResult readAll(std::string_view source) {
	Location eof {};
	auto tokens = tokenize(source, eof);
	auto it = tokens.cbegin();

	std::vector<Expression> exprs;
	while(it != tokens.cend()) {
		auto res = nextExpression(it, tokens.cend(), eof, 0u);
		if(auto err = std::get_if<ParseError>(&res)) {
			return *err;
		}

		exprs.push_back(std::move(std::get<Expression>(res)));
	}

	return exprs;
}

Expression readUnchecked(std::string_view source) {
	auto res = read(source);
	if(auto err = std::get_if<ParseError>(&res)) {
		throwError(*err);
	}

	return std::move(std::get<Expression>(res));
}

void throwError(const ParseError& err) {
	throw ReadError(err);
}

} // namespace sexpr
