#pragma once

namespace sexpr {

struct Location;
struct Null;
struct Symbol;
struct List;
struct Expression;

struct Token;
struct ParseError;
struct ReadOptions;

struct StringSymbol;
template<typename Sym> struct OwnedList;
template<typename Sym> struct OwnedExpression;

template<typename ...Ts>
struct Visitor : Ts...  {
    Visitor(const Ts&... args) : Ts(args)...  {}
    using Ts::operator()...;
};

} // namespace sexpr
