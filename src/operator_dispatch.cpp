#include "anyexpr/operator_dispatch.hpp"

#include "anyexpr/coercion.hpp"
#include "anyexpr/error.hpp"
#include "anyexpr/standard_symbols.hpp"
#include "anyexpr/subscript.hpp"

namespace anyexpr {

namespace {

// Число из канала: обычные числа передаются как есть, сохранённые значения приводятся
std::optional<double> loadNumber(const ValueBox& box, double arg) {
    if (auto value = box.loadIfStored(arg)) {
        return numericValue(*value);
    }
    return arg;
}

bool isRangeOperator(const std::string& name) {
    return name == "..." || name == "..<";
}

} // namespace

OperatorDispatch::OperatorDispatch(ValueBox& box, bool boolSymbols) : box(box), boolSymbols(boolSymbols) {}

NumericEvaluator OperatorDispatch::numeric(const Symbol& symbol, NumericEvaluator function) const {
    return [&box = box, symbol, function](const std::vector<double>& args) {
        std::vector<double> numbers;
        numbers.reserve(args.size());
        for (double arg : args) {
            auto number = loadNumber(box, arg);
            if (!number) {
                throw Error::typeMismatch(symbol, box.load(args));
            }
            numbers.push_back(*number);
        }
        return function(numbers);
    };
}

NumericEvaluator OperatorDispatch::boolean(const Symbol& symbol, NumericEvaluator function) const {
    auto evaluate = numeric(symbol, std::move(function));
    return [evaluate](const std::vector<double>& args) { return ValueBox::boolValue(evaluate(args) != 0); };
}

NumericEvaluator OperatorDispatch::lookup(const Symbol& symbol) const {
    const std::string& name = symbol.name();

    // Стандартные символы
    if (symbol.kind() == Symbol::Kind::Variable) {
        if (name == "true") {
            return [](const std::vector<double>&) { return ValueBox::trueValue(); };
        }
        if (name == "false") {
            return [](const std::vector<double>&) { return ValueBox::falseValue(); };
        }
        if (name == "nil") {
            return [](const std::vector<double>&) { return ValueBox::nilValue(); };
        }
    }
    if (symbol == Symbol::infix("??")) {
        return [](const std::vector<double>& args) { return ValueBox::isNil(args[0]) ? args[1] : args[0]; };
    }

    if (auto function = findSymbol(mathSymbols(), symbol)) {
        if (symbol == Symbol::infix("+")) {
            return [&box = box, symbol](const std::vector<double>& args) {
                return box.store(add(symbol, box.load(args[0]), box.load(args[1])));
            };
        }
        return numeric(symbol, std::move(function));
    }

    if (boolSymbols) {
        if (auto function = findSymbol(anyexpr::boolSymbols(), symbol)) {
            if (symbol == Symbol::infix("==") || symbol == Symbol::infix("!=")) {
                const bool negate = name == "!=";
                return [&box = box, symbol, negate](const std::vector<double>& args) {
                    const bool equal = equalValues(symbol, box.load(args[0]), box.load(args[1]));
                    return ValueBox::boolValue(equal != negate);
                };
            }
            if (symbol == Symbol::infix("?:")) {
                return [&box = box, symbol](const std::vector<double>& args) {
                    if (args.size() != 3) {
                        throw Error::undefinedSymbol(symbol);
                    }
                    auto condition = loadNumber(box, args[0]);
                    if (!condition) {
                        throw Error::typeMismatch(symbol, box.load(args));
                    }
                    return *condition != 0 ? args[1] : args[2];
                };
            }
            return boolean(symbol, std::move(function));
        }
    }

    return builtin(symbol);
}

// Индексация, диапазоны, литералы массивов и строк
NumericEvaluator OperatorDispatch::builtin(const Symbol& symbol) const {
    const std::string& name = symbol.name();
    switch (symbol.kind()) {
    case Symbol::Kind::Infix:
        if (name == "[]") {
            return [&box = box, symbol](const std::vector<double>& args) {
                return box.store(subscript(symbol, box.load(args[0]), box.load(args[1])));
            };
        }
        if (isRangeOperator(name)) {
            return [&box = box, symbol](const std::vector<double>& args) {
                return box.store(makeRange(symbol, box.load(args[0]), box.load(args[1])));
            };
        }
        break;
    case Symbol::Kind::Prefix:
        if (isRangeOperator(name)) {
            return [&box = box, symbol](const std::vector<double>& args) {
                return box.store(makePartialRange(symbol, box.load(args[0])));
            };
        }
        break;
    case Symbol::Kind::Postfix:
        if (name == "...") {
            return [&box = box, symbol](const std::vector<double>& args) {
                return box.store(makePartialRange(symbol, box.load(args[0])));
            };
        }
        break;
    case Symbol::Kind::Function:
        if (name == "[]") {
            return [&box = box](const std::vector<double>& args) { return box.store(Value(box.load(args))); };
        }
        break;
    case Symbol::Kind::Variable:
        if (auto text = symbol.unquotedName()) {
            // Строковый литерал сохраняется в таблицу один раз
            const double stored = box.store(Value(*text));
            return [stored](const std::vector<double>&) { return stored; };
        }
        break;
    case Symbol::Kind::Array:
        if (auto text = symbol.unquotedName()) {
            auto evaluate = subscriptEvaluator(symbol, Value(*text));
            return [&box = box, evaluate](const std::vector<double>& args) {
                return box.store(evaluate(box.load(args)));
            };
        }
        break;
    }
    return {};
}

} // namespace anyexpr
