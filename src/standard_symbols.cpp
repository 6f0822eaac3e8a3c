#include "anyexpr/standard_symbols.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "anyexpr/error.hpp"

namespace anyexpr {

namespace {

using Args = std::vector<double>;

// Регистрирует функцию одного аргумента
void unary(NumericSymbolTable& table, const std::string& name, double (*function)(double)) {
    table[Symbol::function(name, Arity::exactly(1))] = [function](const Args& args) { return function(args[0]); };
}

// Регистрирует функцию двух аргументов
void binary(NumericSymbolTable& table, const std::string& name, double (*function)(double, double)) {
    table[Symbol::function(name, Arity::exactly(2))] = [function](const Args& args) {
        return function(args[0], args[1]);
    };
}

NumericSymbolTable makeMathSymbols() {
    NumericSymbolTable table;
    table[Symbol::variable("pi")] = [](const Args&) { return std::numbers::pi; };

    table[Symbol::infix("+")] = [](const Args& args) { return args[0] + args[1]; };
    table[Symbol::infix("-")] = [](const Args& args) { return args[0] - args[1]; };
    table[Symbol::infix("*")] = [](const Args& args) { return args[0] * args[1]; };
    table[Symbol::infix("/")] = [](const Args& args) { return args[0] / args[1]; };
    table[Symbol::infix("%")] = [](const Args& args) { return std::fmod(args[0], args[1]); };
    table[Symbol::prefix("-")] = [](const Args& args) { return -args[0]; };
    table[Symbol::prefix("+")] = [](const Args& args) { return args[0]; };

    unary(table, "sqrt", [](double x) { return std::sqrt(x); });
    unary(table, "floor", [](double x) { return std::floor(x); });
    unary(table, "ceil", [](double x) { return std::ceil(x); });
    unary(table, "round", [](double x) { return std::round(x); });
    unary(table, "cos", [](double x) { return std::cos(x); });
    unary(table, "sin", [](double x) { return std::sin(x); });
    unary(table, "tan", [](double x) { return std::tan(x); });
    unary(table, "ctan", [](double x) { return 1.0 / std::tan(x); });
    unary(table, "acos", [](double x) { return std::acos(x); });
    unary(table, "asin", [](double x) { return std::asin(x); });
    unary(table, "atan", [](double x) { return std::atan(x); });
    unary(table, "arccos", [](double x) { return std::acos(x); });
    unary(table, "arcsin", [](double x) { return std::asin(x); });
    unary(table, "abs", [](double x) { return std::fabs(x); });
    unary(table, "log", [](double x) { return std::log(x); });
    unary(table, "exp", [](double x) { return std::exp(x); });

    binary(table, "pow", [](double x, double y) { return std::pow(x, y); });
    binary(table, "atan2", [](double y, double x) { return std::atan2(y, x); });
    binary(table, "mod", [](double x, double y) { return std::fmod(x, y); });

    // max и min принимают любое число аргументов, но не меньше одного
    table[Symbol::function("max", Arity::any())] = [](const Args& args) {
        if (args.empty()) {
            throw Error::arityMismatch(Symbol::function("max", Arity::exactly(1)));
        }
        return *std::max_element(args.begin(), args.end());
    };
    table[Symbol::function("min", Arity::any())] = [](const Args& args) {
        if (args.empty()) {
            throw Error::arityMismatch(Symbol::function("min", Arity::exactly(1)));
        }
        return *std::min_element(args.begin(), args.end());
    };
    return table;
}

double truth(bool flag) {
    return flag ? 1.0 : 0.0;
}

NumericSymbolTable makeBoolSymbols() {
    NumericSymbolTable table;
    table[Symbol::infix("==")] = [](const Args& args) { return truth(args[0] == args[1]); };
    table[Symbol::infix("!=")] = [](const Args& args) { return truth(args[0] != args[1]); };
    table[Symbol::infix(">")] = [](const Args& args) { return truth(args[0] > args[1]); };
    table[Symbol::infix(">=")] = [](const Args& args) { return truth(args[0] >= args[1]); };
    table[Symbol::infix("<")] = [](const Args& args) { return truth(args[0] < args[1]); };
    table[Symbol::infix("<=")] = [](const Args& args) { return truth(args[0] <= args[1]); };
    table[Symbol::infix("&&")] = [](const Args& args) { return truth(args[0] != 0 && args[1] != 0); };
    table[Symbol::infix("||")] = [](const Args& args) { return truth(args[0] != 0 || args[1] != 0); };
    table[Symbol::prefix("!")] = [](const Args& args) { return truth(args[0] == 0); };
    table[Symbol::infix("?:")] = [](const Args& args) {
        if (args.size() != 3) {
            throw Error::undefinedSymbol(Symbol::infix("?:"));
        }
        return args[0] != 0 ? args[1] : args[2];
    };
    return table;
}

} // namespace

const NumericSymbolTable& mathSymbols() {
    static const NumericSymbolTable table = makeMathSymbols();
    return table;
}

const NumericSymbolTable& boolSymbols() {
    static const NumericSymbolTable table = makeBoolSymbols();
    return table;
}

NumericEvaluator findSymbol(const NumericSymbolTable& table, const Symbol& symbol) {
    auto found = table.find(symbol);
    if (found != table.end()) {
        return found->second;
    }
    if (symbol.kind() == Symbol::Kind::Function && !symbol.arity().isAny()) {
        found = table.find(Symbol::function(symbol.name(), Arity::any()));
        if (found != table.end()) {
            return found->second;
        }
    }
    return {};
}

} // namespace anyexpr
