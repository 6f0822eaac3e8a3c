#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "anyexpr/any_expression.hpp"
#include "anyexpr/console.hpp"
#include "anyexpr/csv_writer.hpp"

namespace {

    // Параметры запуска, полученные из командной строки
    struct CommandLine {
        std::string inputPath = "-";
        std::optional<std::filesystem::path> outputPath;
        anyexpr::AnyExpression::Constants constants;
        anyexpr::Options options = anyexpr::Options::BoolSymbols;
    };

    // Разбор значения константы: число, логическое значение, nil или строка
    anyexpr::Value parseConstant(const std::string& text) {
        if (text == "true") {
            return anyexpr::Value(true);
        }
        if (text == "false") {
            return anyexpr::Value(false);
        }
        if (text == "nil") {
            return anyexpr::Value();
        }
        if (!text.empty()) {
            char* end = nullptr;
            double number = std::strtod(text.c_str(), &end);
            if (end == text.c_str() + text.size()) {
                return anyexpr::Value(number);
            }
        }
        if (text.size() >= 2 && (text.front() == '\'' || text.front() == '"') && text.back() == text.front()) {
            return anyexpr::Value(text.substr(1, text.size() - 2));
        }
        return anyexpr::Value(text);
    }

    CommandLine parseCommandLine(int argc, char** argv) {
        CommandLine commandLine;
        bool inputSeen = false;
        for (int i = 1; i < argc; ++i) {
            std::string argument = argv[i];
            if (argument == "-o" || argument == "-D") {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Не указано значение для " + argument);
                }
                std::string value = argv[++i];
                if (argument == "-o") {
                    commandLine.outputPath = value;
                    continue;
                }
                auto separator = value.find('=');
                if (separator == std::string::npos || separator == 0) {
                    throw std::runtime_error("Константа должна иметь вид имя=значение: " + value);
                }
                commandLine.constants[value.substr(0, separator)] = parseConstant(value.substr(separator + 1));
            } else if (argument == "--no-optimize") {
                commandLine.options = commandLine.options | anyexpr::Options::NoOptimize;
            } else if (argument == "--pure") {
                commandLine.options = commandLine.options | anyexpr::Options::PureSymbols;
            } else if (argument == "--no-bool") {
                commandLine.options = static_cast<anyexpr::Options>(
                    static_cast<unsigned>(commandLine.options) & ~static_cast<unsigned>(anyexpr::Options::BoolSymbols));
            } else if (!inputSeen && (argument == "-" || (!argument.empty() && argument.front() != '-'))) {
                commandLine.inputPath = argument;
                inputSeen = true;
            } else {
                throw std::runtime_error("Неизвестный аргумент: " + argument);
            }
        }
        return commandLine;
    }

    // Вычисление одной строки; ошибки попадают в запись, а не наружу
    anyexpr::EvaluationRecord evaluateLine(std::size_t lineNumber, const std::string& line,
                                           const CommandLine& commandLine) {
        anyexpr::EvaluationRecord record{lineNumber, line, std::nullopt, "success", ""};
        try {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                throw std::runtime_error("Пустая строка");
            }
            anyexpr::AnyExpression expression(line, commandLine.options, commandLine.constants);
            record.value = expression.evaluate<anyexpr::Value>().description();
        } catch (const std::exception& ex) {
            record.status = "error";
            record.message = ex.what();
        }
        return record;
    }

    int run(const CommandLine& commandLine) {
        std::ifstream file;
        std::istream* input = &std::cin;
        if (commandLine.inputPath != "-") {
            file.open(commandLine.inputPath);
            if (!file.is_open()) {
                throw std::runtime_error("Не удалось открыть входной файл: " + commandLine.inputPath);
            }
            input = &file;
        }

        std::unique_ptr<anyexpr::CsvWriter> writer;
        if (commandLine.outputPath) {
            writer = std::make_unique<anyexpr::CsvWriter>(*commandLine.outputPath);
        }

        std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
        auto startProcess = std::chrono::high_resolution_clock::now();

        anyexpr::RunSummary summary;
        summary.outputPath = commandLine.outputPath;
        std::string line;
        while (std::getline(*input, line)) {
            ++summary.lineCount;
            auto record = evaluateLine(summary.lineCount, line, commandLine);
            if (record.status == "success") {
                ++summary.successCount;
            } else {
                ++summary.errorCount;
            }
            anyexpr::printRecord(record);
            if (writer) {
                writer->writeRecord(record);
            }
        }

        auto endProcess = std::chrono::high_resolution_clock::now();
        summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(endProcess - startProcess);

        anyexpr::printSummary(summary);
        return summary.errorCount == 0 ? 0 : 1;
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
            anyexpr::printHeader(anyexpr::Options::BoolSymbols);
            anyexpr::printUsage();
            return 0;
        }
        CommandLine commandLine = parseCommandLine(argc, argv);
        anyexpr::printHeader(commandLine.options);
        return run(commandLine);
    } catch (const std::exception& ex) {
        std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
                  << Color::RESET << Color::RED << ex.what() << Color::RESET << "\n\n";
        return 1;
    }
}
