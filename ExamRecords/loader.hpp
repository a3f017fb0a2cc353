#pragma once
#include <array>
#include <string>
#include <utility>
#include <vector>
#include "csv.hpp"
#include "dataset.hpp"

/*
-------------------------------------------------------------------------------
 loader.hpp — Load and validate exam result files
-------------------------------------------------------------------------------
load(path) turns a CSV file into a Dataset or throws one of the errors from
errors.hpp. It never returns a partially valid Dataset and never returns an
empty one.

Column names
  Each canonical field accepts a fixed list of spellings, compared
  case-insensitively after trimming. For each field the first alias (in table
  order) that appears in the header wins. Other columns are kept in the table
  but ignored.

Checks, in order (the first failure is reported)
  1. all six canonical columns present        SchemaError
  2. score numeric                            ValidationError(Type,  "score")
  3. grade integer                            ValidationError(Type,  "grade")
  4. score in 0..100                          ValidationError(Range, "score")
  5. grade in 1..5                            ValidationError(Range, "grade")
  6. first_name / last_name / term non-blank  ValidationError(Empty, field)
  7. student_id positive integer, unique      ValidationError(Type/Range/Duplicate)

The grade column is trusted as given. It is NOT recomputed from the score.
-------------------------------------------------------------------------------
*/

struct ColumnAlias {
    const char* canonical;
    std::vector<std::string> aliases;  // lower-case, priority order
};

// Canonical fields in output order, with their accepted spellings.
const std::array<ColumnAlias, 6>& column_aliases();

// Rename header cells to canonical names in place. Returns the canonical
// fields that could not be matched.
std::vector<std::string> normalize_columns(std::vector<std::string>& header);

// Validate an already-parsed table. `origin` becomes the Dataset provenance.
Dataset dataset_from_table(CsvTable table, const std::string& origin);

// Check the path, read, decode, normalize and validate.
Dataset load(const std::string& path);

// Runs load(path) and reports {true, "OK"} or {false, reason}. Never throws
// for bad input.
std::pair<bool, std::string> can_load(const std::string& path);
