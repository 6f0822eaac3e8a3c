#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>

#include "anyexpr/any_expression.hpp"
#include "anyexpr/csv_writer.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

namespace anyexpr {

// Итоги обработки входного файла
struct RunSummary {
    std::size_t lineCount = 0;
    std::size_t successCount = 0;
    std::size_t errorCount = 0;
    std::chrono::milliseconds duration{0};
    std::optional<std::filesystem::path> outputPath;
};

// Заголовок программы с включёнными режимами вычисления
void printHeader(Options options, std::ostream& out = std::cout);

// Справка по аргументам командной строки
void printUsage(std::ostream& out = std::cout);

// Одна строка входа: выражение и результат или текст ошибки
void printRecord(const EvaluationRecord& record, std::ostream& out = std::cout);

void printSummary(const RunSummary& summary, std::ostream& out = std::cout);

} // namespace anyexpr
