#pragma once

#include "expression.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sexpr {

struct Token {
	std::string_view text;
	Location loc;
};

enum class ErrorKind {
	eUnexpectedEOF, // no tokens left where an expression was expected
	eMissingClosingParen, // '(' without matching ')'
	eUnexpectedClosingParen, // ')' without matching '('
	eTrailingTokens, // only in strict mode
};

struct ParseError {
	ErrorKind kind;
	Location loc;
};

struct ReadOptions {
	// Whether tokens after the first complete expression are an error.
	// Otherwise they are ignored.
	bool strict {false};
};

// Thrown by readUnchecked.
class ReadError : public std::runtime_error {
public:
	explicit ReadError(const ParseError& err);
	ParseError error;
};

using ReadResult = std::variant<Expression, ParseError>;
using ReadAllResult = std::variant<std::vector<Expression>, ParseError>;

// Splits the source into tokens: '(', ')', '\'' and whitespace-separated
// atoms. Never produces empty tokens.
std::vector<Token> tokenize(std::string_view source);

// Classifies a single non-structural token. Never fails, everything
// that isn't a number, bool, null or string literal is a Symbol.
Expression parseAtom(std::string_view token, Location loc = {});

// Reads the first expression from source.
// The returned expression references source.
ReadResult read(std::string_view source, const ReadOptions& opts = {});

// Reads all top-level expressions from source.
ReadAllResult readAll(std::string_view source);

// Like read but throws a ReadError on failure.
// Only meant for trusted input.
Expression readUnchecked(std::string_view source);

[[noreturn]] void throwError(const ParseError& err);

} // namespace sexpr
