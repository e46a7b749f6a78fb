#pragma once

#include "expression.hpp"
#include "parser.hpp"
#include <ostream>
#include <string>

namespace sexpr {

// Renders the expression as s-expression source.
// Numbers use the shortest form that reads back to the same value.
std::string dump(const Expression& expr);
std::string dumpNumber(double value);
std::ostream& operator<<(std::ostream& os, const Expression& expr);

const char* name(ErrorKind kind);

// "row:col: message", row and col are 1-based
std::string toString(const ParseError& err);
std::ostream& operator<<(std::ostream& os, const ParseError& err);

} // namespace sexpr
