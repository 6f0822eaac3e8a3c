#include "anyexpr/console.hpp"

#include <string>

namespace anyexpr {

namespace {

    std::string describeOptions(Options options) {
        std::string result = contains(options, Options::BoolSymbols) ? "логика" : "без логики";
        if (contains(options, Options::PureSymbols)) {
            result += ", чистые символы";
        }
        result += contains(options, Options::NoOptimize) ? ", без оптимизации" : ", свёртка констант";
        return result;
    }

} // namespace

void printHeader(Options options, std::ostream& out) {
    out << Color::BOLD << Color::CYAN;
    out << "\nanyexpr " << ANYEXPR_VERSION << ": вычисление выражений над значениями\n";
    out << Color::RESET << Color::GRAY << "режим: " << describeOptions(options) << Color::RESET << "\n\n";
}

void printUsage(std::ostream& out) {
    out << Color::BOLD << "Использование:" << Color::RESET
        << " anyexpr [файл|-] [-o результат.csv] [-D имя=значение]... [--no-optimize] [--pure] [--no-bool]\n\n";
    out << "  " << Color::CYAN << "-o" << Color::RESET << "             запись результатов в CSV\n";
    out << "  " << Color::CYAN << "-D" << Color::RESET << "             константа (число, true, false, nil или строка)\n";
    out << "  " << Color::CYAN << "--no-optimize" << Color::RESET << "  не сворачивать константы\n";
    out << "  " << Color::CYAN << "--pure" << Color::RESET << "         пользовательские символы считаются чистыми\n";
    out << "  " << Color::CYAN << "--no-bool" << Color::RESET << "      без логических операторов и сравнений\n\n";
}

void printRecord(const EvaluationRecord& record, std::ostream& out) {
    out << "  " << Color::GRAY << "[" << record.lineNumber << "]" << Color::RESET << " " << record.expression;
    if (record.value.has_value()) {
        out << " " << Color::GREEN << "✓ " << Color::BOLD << record.value.value() << Color::RESET << "\n";
    } else {
        out << " " << Color::RED << "✗ " << record.message << Color::RESET << "\n";
    }
}

void printSummary(const RunSummary& summary, std::ostream& out) {
    out << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    out << "  Всего строк:  " << Color::CYAN << summary.lineCount << Color::RESET << "\n";
    out << "  Успешно:      " << Color::GREEN << summary.successCount << Color::RESET << "\n";
    out << "  С ошибками:   " << Color::RED << summary.errorCount << Color::RESET << "\n";
    out << "  Время:        " << Color::CYAN << summary.duration.count() << " мс" << Color::RESET << "\n";
    if (summary.outputPath) {
        out << "  Результаты:   " << Color::YELLOW << summary.outputPath->string() << Color::RESET << "\n";
    }
    out << "\n";
}

} // namespace anyexpr
