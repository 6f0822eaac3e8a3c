#include "anyexpr/any_expression.hpp"

#include <exception>
#include <mutex>

#include "anyexpr/error.hpp"
#include "anyexpr/operator_dispatch.hpp"
#include "anyexpr/optimizer.hpp"
#include "anyexpr/parser.hpp"
#include "anyexpr/subscript.hpp"

namespace anyexpr {

namespace {

// Максимальная арность, которую проверяет поиск похожих функций
constexpr std::size_t kMaxProbedArity = 10;

// Вычислитель, повторно выбрасывающий сохранённое исключение
NumericEvaluator rethrowing(std::exception_ptr error) {
    return [error](const std::vector<double>&) -> double { std::rethrow_exception(error); };
}

// Вычисляет значение один раз; ошибка запоминается и выбрасывается при каждом вызове
NumericEvaluator memoize(const std::function<double()>& compute) {
    try {
        const double value = compute();
        return [value](const std::vector<double>&) { return value; };
    } catch (...) {
        return rethrowing(std::current_exception());
    }
}

// Поиск в таблице пользователя; функции без точной арности ищутся с любой арностью
SymbolEvaluator findUserSymbol(const AnyExpression::SymbolTable& symbols, const Symbol& symbol) {
    auto found = symbols.find(symbol);
    if (found != symbols.end()) {
        return found->second;
    }
    if (symbol.kind() == Symbol::Kind::Function && !symbol.arity().isAny()) {
        found = symbols.find(Symbol::function(symbol.name(), Arity::any()));
        if (found != symbols.end()) {
            return found->second;
        }
    }
    return {};
}

bool isVariableLike(const Symbol& symbol) {
    return symbol.kind() == Symbol::Kind::Variable || symbol.kind() == Symbol::Kind::Array;
}

} // namespace

AnyExpression::AnyExpression(const std::string& expression, Options options, Constants constants,
                             SymbolTable symbols)
    : AnyExpression(parse(expression), options, std::move(constants), std::move(symbols)) {}

AnyExpression::AnyExpression(const ParsedExpression& expression, Options options, Constants constants,
                             SymbolTable symbols)
    : box(std::make_shared<ValueBox>()), text(expression.description()) {
    const bool pureSymbols = contains(options, Options::PureSymbols);

    // Переменные из таблицы вызываются при каждом вычислении, если нет одноимённой константы
    SymbolLookup impureLookup = [&constants, &symbols, pureSymbols](const Symbol& symbol) -> SymbolEvaluator {
        if (isVariableLike(symbol)) {
            if (constants.contains(symbol.name())) {
                return {};
            }
            return findUserSymbol(symbols, symbol);
        }
        return pureSymbols ? SymbolEvaluator{} : findUserSymbol(symbols, symbol);
    };

    SymbolLookup pureLookup = [&constants, &symbols](const Symbol& symbol) -> SymbolEvaluator {
        if (isVariableLike(symbol)) {
            auto constant = constants.find(symbol.name());
            if (constant != constants.end()) {
                Value value = constant->second;
                if (symbol.kind() == Symbol::Kind::Variable) {
                    return [value](const std::vector<Value>&) { return value; };
                }
                return [symbol, value](const std::vector<Value>& args) {
                    if (args.size() != 1) {
                        throw Error::arityMismatch(symbol);
                    }
                    return subscript(symbol, value, args[0]);
                };
            }
        }
        return findUserSymbol(symbols, symbol);
    };

    compile(expression, options, impureLookup, pureLookup);
}

AnyExpression::AnyExpression(const ParsedExpression& expression, SymbolLookup impureSymbols,
                             SymbolLookup pureSymbols, Options options)
    : box(std::make_shared<ValueBox>()), text(expression.description()) {
    compile(expression, options, impureSymbols, pureSymbols);
}

void AnyExpression::compile(const ParsedExpression& expression, Options options, const SymbolLookup& impureSymbols,
                            const SymbolLookup& pureSymbols) {
    ValueBox& values = *box;
    const OperatorDispatch dispatch(values, contains(options, Options::BoolSymbols));
    const bool shouldOptimize = !contains(options, Options::NoOptimize);

    auto findImpure = [&impureSymbols](const Symbol& symbol) {
        return impureSymbols ? impureSymbols(symbol) : SymbolEvaluator{};
    };
    auto findPure = [&pureSymbols](const Symbol& symbol) {
        return pureSymbols ? pureSymbols(symbol) : SymbolEvaluator{};
    };

    // Перевод вычислителя над значениями в вычислитель над числовым каналом
    auto wrap = [&values](SymbolEvaluator function) -> NumericEvaluator {
        return [&values, function = std::move(function)](const std::vector<double>& args) {
            return values.store(function(values.load(args)));
        };
    };

    // Ошибка для символа, который не удалось разрешить
    auto unresolved = [&](const Symbol& symbol) -> NumericEvaluator {
        if (symbol.kind() == Symbol::Kind::Function) {
            for (std::size_t arity = 0; arity <= kMaxProbedArity; ++arity) {
                Symbol probe = Symbol::function(symbol.name(), Arity::exactly(arity));
                if (findImpure(probe) || findPure(probe) || dispatch.lookup(probe)) {
                    return rethrowing(std::make_exception_ptr(Error::arityMismatch(probe)));
                }
            }
        }
        if (symbol == Symbol::infix(",")) {
            return rethrowing(std::make_exception_ptr(Error::unexpectedToken(",")));
        }
        return rethrowing(std::make_exception_ptr(Error::undefinedSymbol(symbol)));
    };

    Optimizer::Lookup impure = [&](const Symbol& symbol) -> NumericEvaluator {
        if (auto function = findImpure(symbol)) {
            return wrap(std::move(function));
        }
        if (symbol.kind() == Symbol::Kind::Array) {
            if (auto function = findImpure(Symbol::variable(symbol.name()))) {
                return [&values, symbol, function](const std::vector<double>& args) {
                    auto evaluate = subscriptEvaluator(symbol, function({}));
                    return values.store(evaluate(values.load(args)));
                };
            }
        }
        if (!shouldOptimize) {
            if (auto function = findPure(symbol)) {
                return wrap(std::move(function));
            }
            return dispatch.lookup(symbol);
        }
        return {};
    };

    Optimizer::Lookup pure = [&](const Symbol& symbol) -> NumericEvaluator {
        if (auto function = findPure(symbol)) {
            const bool constant = symbol.kind() == Symbol::Kind::Variable ||
                                  (symbol.kind() == Symbol::Kind::Function && symbol.arity() == Arity::exactly(0));
            if (constant) {
                return memoize([&values, &function] { return values.store(function({})); });
            }
            return wrap(std::move(function));
        }
        if (symbol.kind() == Symbol::Kind::Array) {
            if (auto function = findPure(Symbol::variable(symbol.name()))) {
                try {
                    auto evaluate = subscriptEvaluator(symbol, function({}));
                    return [&values, evaluate](const std::vector<double>& args) {
                        return values.store(evaluate(values.load(args)));
                    };
                } catch (...) {
                    return rethrowing(std::current_exception());
                }
            }
        }
        if (auto function = dispatch.lookup(symbol)) {
            return function;
        }
        return unresolved(symbol);
    };

    // "??" с константой слева заменяется одним из операндов
    Optimizer::Inliner inliner = [&](const Symbol& symbol, const std::vector<EvalNodePtr>& children) -> EvalNodePtr {
        if (symbol != Symbol::infix("??") || children.size() != 2 || findPure(symbol)) {
            return nullptr;
        }
        auto constant = children[0]->constantValue();
        if (!constant) {
            return nullptr;
        }
        return ValueBox::isNil(*constant) ? children[1] : children[0];
    };

    Optimizer optimizer(impure, pure, inliner);
    evaluator = std::make_shared<const Evaluator>(optimizer.optimize(expression));
    baseline = values.size();
}

// Таблица возвращается к исходному размеру и при успехе, и при ошибке
Value AnyExpression::run() const {
    std::lock_guard<std::mutex> lock(box->mutex());
    try {
        Value result = box->load(evaluator->evaluate());
        box->truncate(baseline);
        return result;
    } catch (...) {
        box->truncate(baseline);
        throw;
    }
}

std::size_t AnyExpression::valueTableSize() const {
    std::lock_guard<std::mutex> lock(box->mutex());
    return box->size();
}

} // namespace anyexpr
