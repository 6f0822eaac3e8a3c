#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "anyexpr/csv_writer.hpp"

using namespace anyexpr;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream stream(path);
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("testing csv field quoting", "[csv]")
{
    CHECK(quoteCsvField("") == "\"\"");
    CHECK(quoteCsvField("1 + 2") == "\"1 + 2\"");
    CHECK(quoteCsvField("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("testing csv writer output", "[csv]")
{
    const auto path = std::filesystem::temp_directory_path() / "anyexpr_csv_writer_test.csv";

    {
        CsvWriter writer(path);
        writer.writeRecord({1, "4 + 5", std::string("9"), "success", ""});
        writer.write({
            {2, "'a' + nil", std::nullopt, "error", "Несовместимые типы"},
            {3, "\"x\"", std::string("x"), "success", ""},
        });
    }

    const std::string expected = "line,expression,status,result,message\n"
                                 "1,\"4 + 5\",success,\"9\",\"\"\n"
                                 "2,\"'a' + nil\",error,,\"Несовместимые типы\"\n"
                                 "3,\"\"\"x\"\"\",success,\"x\",\"\"\n";
    CHECK(readFile(path) == expected);

    SECTION("a new writer truncates the file")
    {
        CsvWriter writer(path);
        CHECK(readFile(path) == "line,expression,status,result,message\n");
    }

    std::filesystem::remove(path);
}

TEST_CASE("testing csv writer errors", "[csv]")
{
    const auto path = std::filesystem::temp_directory_path() / "anyexpr_missing_directory" / "out.csv";
    CHECK_THROWS_AS(CsvWriter(path), std::runtime_error);
}
