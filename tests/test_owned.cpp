#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "owned.hpp"
#include "parser.hpp"

using namespace sexpr;

namespace {

// Splits "ns::name" into namespace and name.
struct namespaced_symbol {
    std::optional<std::string> ns;
    std::string name;

    static namespaced_symbol fromString(std::string_view str) {
        auto sep = str.find("::");
        if (sep == str.npos) {
            return {std::nullopt, std::string(str)};
        }
        return {std::string(str.substr(0, sep)), std::string(str.substr(sep + 2))};
    }

    std::string toString() const {
        return ns? *ns + "::" + name: name;
    }
};

bool operator==(const namespaced_symbol& a, const namespaced_symbol& b) {
    return a.ns == b.ns && a.name == b.name;
}

enum class symbol_category { function, variable, type, macro };

// "fn:name", "var:name", "type:name", "macro:name"; variable by default
struct categorized_symbol {
    symbol_category category;
    std::string name;

    static categorized_symbol fromString(std::string_view str) {
        auto sep = str.find(':');
        if (sep == str.npos) {
            return {symbol_category::variable, std::string(str)};
        }

        auto prefix = str.substr(0, sep);
        auto category = symbol_category::variable;
        if (prefix == "fn") category = symbol_category::function;
        else if (prefix == "type") category = symbol_category::type;
        else if (prefix == "macro") category = symbol_category::macro;
        return {category, std::string(str.substr(sep + 1))};
    }

    std::string toString() const {
        switch (category) {
            case symbol_category::function: return "fn:" + name;
            case symbol_category::variable: return "var:" + name;
            case symbol_category::type: return "type:" + name;
            case symbol_category::macro: return "macro:" + name;
        }
        return name;
    }
};

bool operator==(const categorized_symbol& a, const categorized_symbol& b) {
    return a.category == b.category && a.name == b.name;
}

// Compares a borrowed and an owned tree node by node.
bool same_structure(const Expression& a, const OwnedExpression<>& b) {
    if (a.value.index() != b.value.index()) return false;

    if (auto v = std::get_if<double>(&a.value)) return *v == std::get<double>(b.value);
    if (auto v = std::get_if<bool>(&a.value)) return *v == std::get<bool>(b.value);
    if (auto v = std::get_if<std::string_view>(&a.value)) return *v == std::get<std::string>(b.value);
    if (auto v = std::get_if<Symbol>(&a.value)) return v->name == std::get<StringSymbol>(b.value).name;
    if (auto v = std::get_if<List>(&a.value)) {
        auto& owned = std::get<OwnedList<StringSymbol>>(b.value).values;
        if (v->values.size() != owned.size()) return false;
        for (auto i = 0u; i < owned.size(); ++i) {
            if (!same_structure(v->values[i], owned[i])) return false;
        }
        return true;
    }
    return std::holds_alternative<Null>(b.value);
}

} // namespace

TEST(owned, symbol) {
    Expression borrowed{Symbol{"hello"}, {}};
    auto owned = toOwned(borrowed);
    OwnedExpression<> expected;
    expected.value = StringSymbol{"hello"};
    EXPECT_EQ(expected, owned);
}

TEST(owned, structure_preserved) {
    for (auto src: {
            "(define (factorial n) (if (= n 0) 1 (* n (factorial (- n 1)))))",
            "(1 symbol \"string\" true false null (1.5 ()))",
            "\"str\"",
            "-2.5",
            "null"}) {
        auto borrowed = readUnchecked(src);
        EXPECT_TRUE(same_structure(borrowed, toOwned(borrowed))) << src;
    }
}

TEST(owned, outlives_source) {
    OwnedExpression<> owned;
    {
        std::string src = "(name \"value\" (nested sym))";
        owned = toOwned(readUnchecked(src));
        src.assign(src.size(), 'x');
    }

    EXPECT_EQ("(name \"value\" (nested sym))", dump(owned));
}

TEST(owned, locations_copied) {
    auto borrowed = readUnchecked("(a\n (b))");
    auto owned = toOwned(borrowed);
    auto& inner = std::get<OwnedList<StringSymbol>>(owned.value).values[1];
    EXPECT_EQ(1u, inner.loc.row);
    EXPECT_EQ(1u, inner.loc.col);
    EXPECT_EQ(1u, inner.loc.depth);
}

TEST(owned, namespaced_symbols) {
    auto owned = toOwned<namespaced_symbol>(readUnchecked("(std::vector 1 (main x::y))"));
    auto& values = std::get<OwnedList<namespaced_symbol>>(owned.value).values;
    ASSERT_EQ(3u, values.size());

    auto& vec = std::get<namespaced_symbol>(values[0].value);
    ASSERT_TRUE(vec.ns);
    EXPECT_EQ("std", *vec.ns);
    EXPECT_EQ("vector", vec.name);

    // nested lists are converted as well
    auto& nested = std::get<OwnedList<namespaced_symbol>>(values[2].value).values;
    auto& plain = std::get<namespaced_symbol>(nested[0].value);
    EXPECT_FALSE(plain.ns);
    EXPECT_EQ("main", plain.name);
    EXPECT_EQ("x", *std::get<namespaced_symbol>(nested[1].value).ns);

    EXPECT_EQ("(std::vector 1 (main x::y))", dump(owned));
}

TEST(owned, categorized_symbols) {
    auto owned = toOwned<categorized_symbol>(readUnchecked("(fn:factorial var:count type:Result plain)"));
    auto& values = std::get<OwnedList<categorized_symbol>>(owned.value).values;
    ASSERT_EQ(4u, values.size());

    EXPECT_EQ(symbol_category::function, std::get<categorized_symbol>(values[0].value).category);
    EXPECT_EQ("factorial", std::get<categorized_symbol>(values[0].value).name);
    EXPECT_EQ(symbol_category::variable, std::get<categorized_symbol>(values[1].value).category);
    EXPECT_EQ(symbol_category::type, std::get<categorized_symbol>(values[2].value).category);
    EXPECT_EQ(symbol_category::variable, std::get<categorized_symbol>(values[3].value).category);

    EXPECT_EQ("(fn:factorial var:count type:Result var:plain)", dump(owned));
}

TEST(owned, strings_are_not_symbols) {
    auto owned = toOwned<namespaced_symbol>(readUnchecked("\"a::b\""));
    ASSERT_TRUE(std::holds_alternative<std::string>(owned.value));
    EXPECT_EQ("a::b", std::get<std::string>(owned.value));
}

TEST(owned, equality) {
    auto a = toOwned(readUnchecked("(a 1 \"s\")"));
    auto b = toOwned(readUnchecked("(a   1 \"s\")"));
    auto c = toOwned(readUnchecked("(a 2 \"s\")"));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
