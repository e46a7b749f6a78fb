#include "output.hpp"
#include <dlg/dlg.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace sexpr {

std::string dumpNumber(double value) {
	// "inf" and "nan" would read back as symbols, the sign makes
	// them numbers
	if(std::isinf(value)) {
		return value < 0 ? "-inf" : "+inf";
	} else if(std::isnan(value)) {
		return std::signbit(value) ? "-nan" : "+nan";
	}

	// 15 digits are enough for most values, only fall back to the
	// full 17 when they don't read back exactly
	char buf[32];
	for(auto precision : {15, 17}) {
		std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
		if(std::strtod(buf, nullptr) == value) {
			break;
		}
	}

	return buf;
}

std::string dump(const Expression& expr) {
	return std::visit(Visitor{
		[](double val) { return dumpNumber(val); },
		[](bool val) { return std::string(val ? "true" : "false"); },
		[](std::string_view val) {
			std::string ret = "\"";
			ret += val;
			ret += "\"";
			return ret;
		},
		[](const Symbol& sym) { return std::string(sym.name); },
		[](const List& list) {
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

std::ostream& operator<<(std::ostream& os, const Expression& expr) {
	return os << dump(expr);
}

const char* name(ErrorKind kind) {
	switch(kind) {
		case ErrorKind::eUnexpectedEOF:
			return "Unexpected EOF";
		case ErrorKind::eMissingClosingParen:
			return "Missing closing parenthesis";
		case ErrorKind::eUnexpectedClosingParen:
			return "Unexpected closing parenthesis";
		case ErrorKind::eTrailingTokens:
			return "Trailing tokens after expression";
	}

	return "<invalid>";
}

std::string toString(const ParseError& err) {
	return dlg::format("{}:{}: {}", err.loc.row + 1, err.loc.col + 1,
		name(err.kind));
}

std::ostream& operator<<(std::ostream& os, const ParseError& err) {
	return os << toString(err);
}

} // namespace sexpr
