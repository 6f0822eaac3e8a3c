#pragma once

#include "anyexpr/symbol.hpp"
#include "anyexpr/value.hpp"

namespace anyexpr {

// Индексация контейнера: массива, среза, строки, подстроки или словаря.
// Целые индексы строк считаются в символах от начала (под)строки,
// позиции String.Index - от начала исходной строки.
Value subscript(const Symbol& symbol, const Value& container, const Value& index);

// Вычислитель для массива-символа над фиксированным контейнером.
// Выбрасывает illegalSubscript, если значение не поддерживает индексацию.
SymbolEvaluator subscriptEvaluator(const Symbol& symbol, const Value& container);

} // namespace anyexpr
