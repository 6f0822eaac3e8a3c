#include "anyexpr/csv_writer.hpp"

#include <stdexcept>

namespace anyexpr {

namespace {
void writeLine(std::ostream& stream, const EvaluationRecord& record) {
    stream << record.lineNumber << ',' << quoteCsvField(record.expression) << ',' << record.status << ',';
    if (record.value.has_value()) {
        stream << quoteCsvField(record.value.value());
    }
    stream << ',' << quoteCsvField(record.message) << '\n';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    auto stream = open(std::ios::trunc);
    stream << "line,expression,status,result,message\n";
}

std::ofstream CsvWriter::open(std::ios::openmode mode) const {
    std::ofstream stream(path, std::ios::out | mode);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}

void CsvWriter::writeRecord(const EvaluationRecord& record) const {
    auto stream = open(std::ios::app);
    writeLine(stream, record);
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) const {
    auto stream = open(std::ios::app);
    for (const auto& record : records) {
        writeLine(stream, record);
    }
}

std::string quoteCsvField(const std::string& field) {
    std::string quoted = "\"";
    for (char ch : field) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    return quoted + "\"";
}

} // namespace anyexpr
