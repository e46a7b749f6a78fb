#pragma once

#include "expression.hpp"
#include "output.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace sexpr {

// Default symbol representation, just the plain text.
// Any type used as symbol representation for OwnedExpression has to
// provide the same interface:
//  - static Sym fromString(std::string_view)
//  - std::string toString() const
//  - operator==
struct StringSymbol {
	std::string name;

	static StringSymbol fromString(std::string_view str) {
		return {std::string(str)};
	}

	std::string toString() const {
		return name;
	}
};

inline bool operator==(const StringSymbol& a, const StringSymbol& b) {
	return a.name == b.name;
}
inline bool operator!=(const StringSymbol& a, const StringSymbol& b) {
	return !(a == b);
}

template<typename Sym>
struct OwnedList {
	std::vector<OwnedExpression<Sym>> values;
};

// Expression that owns all its data and can therefore outlive the
// source it was read from.
template<typename Sym = StringSymbol>
struct OwnedExpression {
	static_assert(!std::is_same_v<Sym, std::string> &&
		!std::is_same_v<Sym, double> && !std::is_same_v<Sym, bool>,
		"Symbol type must be distinguishable from the other values");

	std::variant<double, bool, std::string, Sym, OwnedList<Sym>, Null> value;
	Location loc;
};

template<typename Sym>
bool operator==(const OwnedList<Sym>& a, const OwnedList<Sym>& b) {
	return a.values == b.values;
}
template<typename Sym>
bool operator!=(const OwnedList<Sym>& a, const OwnedList<Sym>& b) {
	return !(a == b);
}

template<typename Sym>
bool operator==(const OwnedExpression<Sym>& a, const OwnedExpression<Sym>& b) {
	return a.value == b.value;
}
template<typename Sym>
bool operator!=(const OwnedExpression<Sym>& a, const OwnedExpression<Sym>& b) {
	return !(a == b);
}

// Deep copy of the given expression. Every symbol in the tree is
// converted using Sym::fromString.
template<typename Sym = StringSymbol>
OwnedExpression<Sym> toOwned(const Expression& expr) {
	OwnedExpression<Sym> ret;
	ret.loc = expr.loc;

	std::visit(Visitor{
		[&](double val) { ret.value.template emplace<double>(val); },
		[&](bool val) { ret.value.template emplace<bool>(val); },
		[&](std::string_view val) {
			ret.value.template emplace<std::string>(val);
		},
		[&](const Symbol& sym) {
			ret.value.template emplace<Sym>(Sym::fromString(sym.name));
		},
		[&](const List& list) {
			auto& owned = ret.value.template emplace<OwnedList<Sym>>();
			owned.values.reserve(list.values.size());
			for(auto& child : list.values) {
				owned.values.push_back(toOwned<Sym>(child));
			}
		},
		[&](Null) { ret.value.template emplace<Null>(); },
	}, expr.value);

	return ret;
}

template<typename Sym>
std::string dump(const OwnedExpression<Sym>& expr) {
	return std::visit(Visitor{
		[](double val) { return dumpNumber(val); },
		[](bool val) { return std::string(val ? "true" : "false"); },
		[](const std::string& val) { return "\"" + val + "\""; },
		[](const Sym& sym) { return std::string(sym.toString()); },
		[](const OwnedList<Sym>& list) {
			std::string ret = "(";
			auto first = true;
			for(auto& arg : list.values) {
				if(!first) {
					ret += " ";
				}

				first = false;
				ret += dump(arg);
			}

			ret += ")";
			return ret;
		},
		[](Null) { return std::string("null"); },
	}, expr.value);
}

template<typename Sym>
std::ostream& operator<<(std::ostream& os, const OwnedExpression<Sym>& expr) {
	return os << dump(expr);
}

} // namespace sexpr
