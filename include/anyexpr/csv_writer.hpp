#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace anyexpr {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber;           // Номер строки в исходном файле
    std::string expression;           // Исходный текст выражения
    std::optional<std::string> value; // Текстовое представление результата (если вычисление успешно)
    std::string status;               // Статус (success или error)
    std::string message;              // Сообщение об ошибке (если есть)
};

// Запись результатов в формате CSV: line,expression,status,result,message
// Текстовые поля заключаются в кавычки, кавычки внутри удваиваются.
class CsvWriter {
public:
    // Конструктор создаёт файл (перезаписывая его) и записывает заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов в файл
    void write(const std::vector<EvaluationRecord>& records) const;

    // Записывает один результат в файл
    void writeRecord(const EvaluationRecord& record) const;

private:
    std::filesystem::path path; // Путь к выходному файлу

    std::ofstream open(std::ios::openmode mode) const;
};

// Экранирование поля CSV
std::string quoteCsvField(const std::string& field);

} // namespace anyexpr
