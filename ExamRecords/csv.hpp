#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "dataset.hpp"

/*
-------------------------------------------------------------------------------
 csv.hpp — Delimited text in and out
-------------------------------------------------------------------------------
Reading
  - parse_csv        : text -> header + rows (comma, "quoted" fields with ""
                       escapes, embedded commas/newlines, LF or CRLF).
                       Blank lines are skipped. An unterminated quote throws
                       ValidationError(Format).
  - decode_text      : raw bytes -> UTF-8. Strips a UTF-8 BOM. Bytes that are
                       not valid UTF-8 are decoded again as Latin-1.
  - read_csv_file    : read + decode + parse. Throws IoError with the path if
                       the file cannot be read.

Writing
  - to_csv / write_csv : canonical English header
                         student_id,first_name,last_name,term,score,grade
                         and one row per record in Dataset order.
-------------------------------------------------------------------------------
*/

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::size_t> row_lines;  // 1-based source line of each row
};

CsvTable parse_csv(const std::string& text);

bool is_valid_utf8(const std::string& bytes);
std::string latin1_to_utf8(const std::string& bytes);
std::string decode_text(const std::string& bytes);

CsvTable read_csv_file(const std::string& path);

std::string to_csv(const Dataset& data);
void write_csv(const Dataset& data, const std::string& path);
