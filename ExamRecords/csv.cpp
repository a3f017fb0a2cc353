/*
-------------------------------------------------------------------------------
 csv.cpp — CSV reader/writer for exam result files
-------------------------------------------------------------------------------
The reader is a small state machine over the whole decoded text, so quoted
fields may span lines. It knows nothing about the exam schema; column names
and value checks belong to the loader.

Encoding
  - Files are expected in UTF-8. Spreadsheet exports from older Windows setups
    are often Latin-1; if the bytes fail UTF-8 validation the whole file is
    re-decoded as Latin-1 (every byte maps to the code point of the same
    value). This is the only automatic retry in the load path.
-------------------------------------------------------------------------------
*/

#include "csv.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

// ==========================
// Parsing
// ==========================

CsvTable parse_csv(const std::string& text) {
    CsvTable table;

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;   // current field had quotes (so "" is not blank)
    std::size_t line = 1;
    std::size_t row_start = 1;
    std::size_t quote_line = 0;

    auto end_row = [&] {
        row.push_back(field);
        bool blank = row.size() == 1 && row[0].empty() && !field_quoted;
        if (!blank) {
            if (table.header.empty() && table.rows.empty()) {
                table.header = row;
            }
            else {
                table.rows.push_back(row);
                table.row_lines.push_back(row_start);
            }
        }
        row.clear();
        field.clear();
        field_quoted = false;
        };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') { field.push_back('"'); ++i; }
                else in_quotes = false;
            }
            else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
        case '"':
            in_quotes = true;
            field_quoted = true;
            quote_line = line;
            break;
        case ',':
            row.push_back(field);
            field.clear();
            field_quoted = false;
            break;
        case '\r':
            // CRLF: the '\n' ends the row. A lone CR is dropped.
            break;
        case '\n':
            end_row();
            ++line;
            row_start = line;
            break;
        default:
            field.push_back(c);
        }
    }

    if (in_quotes)
        throw ValidationError(ValidationKind::Format, "",
            "Unterminated quoted field starting on line " + std::to_string(quote_line) + ".");

    // Last line without a trailing newline.
    if (!field.empty() || field_quoted || !row.empty())
        end_row();

    return table;
}

// ==========================
// Encoding
// ==========================

bool is_valid_utf8(const std::string& bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        std::size_t len;
        unsigned cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and values past U+10FFFF.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += len;
    }
    return true;
}

std::string latin1_to_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char ch : bytes) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        }
        else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string decode_text(const std::string& bytes) {
    static const std::string bom = "\xEF\xBB\xBF";
    if (bytes.compare(0, bom.size(), bom) == 0)
        return decode_text(bytes.substr(bom.size()));
    if (is_valid_utf8(bytes))
        return bytes;
    return latin1_to_utf8(bytes);
}

CsvTable read_csv_file(const std::string& path) {
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw IoError(path, "cannot open file for reading");
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            throw IoError(path, "read failed");
        bytes = ss.str();
    }
    return parse_csv(decode_text(bytes));
}

// ==========================
// Writing
// ==========================

// Quote a cell if it holds a delimiter, a quote or a line break.
static std::string csv_cell(const std::string& v) {
    if (v.find_first_of(",\"\r\n") == std::string::npos) return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string to_csv(const Dataset& data) {
    std::ostringstream out;
    out << "student_id,first_name,last_name,term,score,grade\n";
    for (const auto& r : data) {
        out << r.student_id << ','
            << csv_cell(r.first_name) << ','
            << csv_cell(r.last_name) << ','
            << csv_cell(r.term) << ','
            << r.score << ','
            << r.grade << '\n';
    }
    return out.str();
}

void write_csv(const Dataset& data, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw IoError(path, "cannot open file for writing");
    out << to_csv(data);
    out.flush();
    if (!out)
        throw IoError(path, "write failed");
}
