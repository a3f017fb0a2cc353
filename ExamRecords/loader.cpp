/*
-------------------------------------------------------------------------------
 loader.cpp — CSV file -> validated Dataset
-------------------------------------------------------------------------------
Flow
  path check -> read/decode/parse (csv.cpp) -> empty check -> ragged-row
  check -> column resolution -> whole-column checks -> Dataset construction.

Notes
  - Checks run column by column over all rows, so a file with both a bad score
    and a blank name reports the score (check 2 comes before check 6).
  - Header cells and text values are trimmed. A whitespace-only name or term
    counts as blank.
  - Fractional scores pass the numeric check and are truncated on storage.
    Grades must be integral ("4" or "4.0"); "3.5" is a type error.
-------------------------------------------------------------------------------
*/

#include "loader.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

// Canonical field indices into column_aliases().
enum { kId, kFirst, kLast, kTerm, kScore, kGrade };

const std::array<ColumnAlias, 6>& column_aliases() {
    static const std::array<ColumnAlias, 6> table = { {
        { "student_id", { "id", "student_id", "studentid", "\xC5\xA1ifra" } },  // šifra
        { "first_name", { "ime", "first_name", "firstname", "name" } },
        { "last_name",  { "prezime", "last_name", "lastname", "surname" } },
        { "term",       { "termin", "term", "datum", "date", "ispitni_rok" } },
        { "score",      { "bodovi", "score", "points", "bod" } },
        { "grade",      { "ocjena", "grade", "ocj" } },
    } };
    return table;
}

static std::string trim(const std::string& s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), ws);
    auto e = std::find_if_not(s.rbegin(), s.rend(), ws).base();
    return (b < e) ? std::string(b, e) : std::string();
}

// Column index for each canonical field, -1 if absent. One pass per field over
// the (already folded) header; the first alias present wins.
static std::array<int, 6> resolve_columns(const std::vector<std::string>& header) {
    std::vector<std::string> folded;
    folded.reserve(header.size());
    for (const auto& h : header) folded.push_back(fold_case(trim(h)));

    std::array<int, 6> idx;
    idx.fill(-1);
    const auto& table = column_aliases();
    for (std::size_t f = 0; f < table.size(); ++f) {
        for (const auto& alias : table[f].aliases) {
            auto it = std::find(folded.begin(), folded.end(), alias);
            if (it != folded.end()) {
                idx[f] = static_cast<int>(it - folded.begin());
                break;
            }
        }
    }
    return idx;
}

std::vector<std::string> normalize_columns(std::vector<std::string>& header) {
    const auto idx = resolve_columns(header);
    const auto& table = column_aliases();
    std::vector<std::string> missing;
    for (std::size_t f = 0; f < table.size(); ++f) {
        if (idx[f] < 0) missing.push_back(table[f].canonical);
        else header[idx[f]] = table[f].canonical;
    }
    return missing;
}

// Strict decimal number: optional sign, digits, optional fraction/exponent.
// No hex, no inf/nan, surrounding whitespace allowed.
static bool parse_number(const std::string& raw, double& out) {
    std::string s = trim(raw);
    if (s.empty()) return false;
    for (char c : s)
        if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-'
            || c == '.' || c == 'e' || c == 'E'))
            return false;
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(d)) return false;
    out = d;
    return true;
}

static bool is_integral(double d) {
    return std::floor(d) == d;
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += ", ";
        out += v[i];
    }
    return out;
}

Dataset dataset_from_table(CsvTable table, const std::string& origin) {
    if (table.rows.empty())
        throw ValidationError(ValidationKind::NoRows, "",
            "File '" + origin + "' contains no data rows.");

    const std::size_t width = table.header.size();
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        auto& row = table.rows[r];
        if (row.size() > width)
            throw ValidationError(ValidationKind::Format, "",
                "Line " + std::to_string(table.row_lines[r]) + " has "
                + std::to_string(row.size()) + " fields, header has "
                + std::to_string(width) + ".");
        row.resize(width);  // short rows: missing cells are blank
    }

    // 1) required columns
    std::vector<std::string> found = table.header;
    const auto idx = resolve_columns(table.header);
    std::vector<std::string> missing = normalize_columns(table.header);
    if (!missing.empty()) {
        std::vector<std::string> required;
        for (const auto& c : column_aliases()) required.push_back(c.canonical);
        throw SchemaError(
            "Missing columns in '" + origin + "': " + join(missing)
            + "\nRequired columns: " + join(required)
            + "\nFound columns: " + join(found),
            missing);
    }

    const std::size_t n = table.rows.size();
    auto cell = [&](std::size_t r, int field) -> const std::string& {
        return table.rows[r][idx[field]];
        };

    // 2) score numeric
    std::vector<double> scores(n);
    for (std::size_t r = 0; r < n; ++r)
        if (!parse_number(cell(r, kScore), scores[r]))
            throw ValidationError(ValidationKind::Type, "score",
                "Column 'score' contains a non-numeric value '" + cell(r, kScore)
                + "' (line " + std::to_string(table.row_lines[r]) + ").");

    // 3) grade integer
    std::vector<double> grades(n);
    for (std::size_t r = 0; r < n; ++r)
        if (!parse_number(cell(r, kGrade), grades[r]) || !is_integral(grades[r]))
            throw ValidationError(ValidationKind::Type, "grade",
                "Column 'grade' must contain whole numbers, found '" + cell(r, kGrade)
                + "' (line " + std::to_string(table.row_lines[r]) + ").");

    // 4) score range
    for (std::size_t r = 0; r < n; ++r)
        if (scores[r] < kMinScore || scores[r] > kMaxScore)
            throw ValidationError(ValidationKind::Range, "score",
                "Scores must be in range 0-100 (line " + std::to_string(table.row_lines[r]) + ").");

    // 5) grade range
    for (std::size_t r = 0; r < n; ++r)
        if (grades[r] < kMinGrade || grades[r] > kMaxGrade)
            throw ValidationError(ValidationKind::Range, "grade",
                "Grades must be in range 1-5 (line " + std::to_string(table.row_lines[r]) + ").");

    // 6) no blank text
    for (int field : { kFirst, kLast, kTerm }) {
        const char* name = column_aliases()[field].canonical;
        for (std::size_t r = 0; r < n; ++r)
            if (trim(cell(r, field)).empty())
                throw ValidationError(ValidationKind::Empty, name,
                    std::string("Column '") + name + "' must not have empty values (line "
                    + std::to_string(table.row_lines[r]) + ").");
    }

    // 7) student_id
    std::vector<StudentRecord> records;
    records.reserve(n);
    for (std::size_t r = 0; r < n; ++r) {
        double id = 0;
        if (!parse_number(cell(r, kId), id) || !is_integral(id))
            throw ValidationError(ValidationKind::Type, "student_id",
                "Column 'student_id' must contain whole numbers, found '" + cell(r, kId)
                + "' (line " + std::to_string(table.row_lines[r]) + ").");
        if (id < 1 || id > 2147483647.0)
            throw ValidationError(ValidationKind::Range, "student_id",
                "student_id must be a positive integer (line "
                + std::to_string(table.row_lines[r]) + ").");

        StudentRecord rec;
        rec.student_id = static_cast<int>(id);
        rec.first_name = trim(cell(r, kFirst));
        rec.last_name = trim(cell(r, kLast));
        rec.term = trim(cell(r, kTerm));
        rec.score = static_cast<int>(scores[r]);
        rec.grade = static_cast<int>(grades[r]);
        records.push_back(std::move(rec));
    }

    // Uniqueness of student_id is checked by the Dataset constructor.
    return Dataset(std::move(records), origin);
}

Dataset load(const std::string& path) {
    std::error_code ec;
    fs::path p(path);
    if (!fs::exists(p, ec) || !fs::is_regular_file(p, ec))
        throw InputNotFoundError(path);

    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext != ".csv")
        throw ValidationError(ValidationKind::Format, "",
            "File must be in CSV format, not '" + p.extension().string() + "'.");

    return dataset_from_table(read_csv_file(path), path);
}

std::pair<bool, std::string> can_load(const std::string& path) {
    try {
        load(path);
        return { true, "OK" };
    }
    catch (const ExamDataError& e) {
        return { false, e.what() };
    }
    catch (const std::exception& e) {
        return { false, std::string("Unexpected error: ") + e.what() };
    }
}
