#pragma once

#include "fwd.hpp"
#include <string_view>
#include <variant>
#include <vector>

namespace sexpr {

// Position of a token or expression in the source.
// row and col are zero-based, depth is the parenthesis nesting
// depth of an expression (0 for top-level ones).
struct Location {
	unsigned row {0};
	unsigned col {0};
	unsigned depth {0};
};

struct Null {};

struct Symbol {
	std::string_view name;
};

struct List {
	std::vector<Expression> values;
};

// Zero-copy expression tree.
// std::string_view is a string literal (quotes stripped), Symbol an
// identifier. Both reference the source buffer the expression was read
// from, i.e. the buffer must outlive the expression.
// Location does not take part in comparison.
struct Expression {
	std::variant<double, bool, std::string_view, Symbol, List, Null> value;
	Location loc;
};

inline bool operator==(Null, Null) { return true; }
inline bool operator!=(Null, Null) { return false; }

inline bool operator==(const Symbol& a, const Symbol& b) { return a.name == b.name; }
inline bool operator!=(const Symbol& a, const Symbol& b) { return !(a == b); }

bool operator==(const List& a, const List& b);
inline bool operator!=(const List& a, const List& b) { return !(a == b); }

inline bool operator==(const Expression& a, const Expression& b) {
	return a.value == b.value;
}
inline bool operator!=(const Expression& a, const Expression& b) {
	return !(a == b);
}

} // namespace sexpr
