#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 dataset.hpp - Immutable collection of exam results
-------------------------------------------------------------------------------
A Dataset is an ordered list of StudentRecord rows (row order = insertion
order, never sorted implicitly) plus an optional provenance path.

Design notes
  - Every operation is const. Filters, search and sort return a NEW Dataset;
    the one they were called on is never changed. Derived datasets keep the
    parent's provenance.
  - The public constructor validates every record (field ranges, non-blank
    text, unique student_id) and throws ValidationError on the first problem.
    Derived datasets skip that pass: removing or reordering rows cannot break
    an invariant that already held.
  - Statistics on an empty Dataset are all zero; nothing here throws after
    construction.

Search policy
  - Matching is a case-insensitive substring test on first_name OR last_name.
  - An empty query keeps every record (the empty string is a substring of
    everything). The console skips the call for an empty query so the view
    it already has stays as it is (see apply_name_search in helpers.hpp).
-------------------------------------------------------------------------------
*/

enum class SortField { StudentId, FirstName, LastName, Term, Score, Grade };

class Dataset {
public:
    using const_iterator = std::vector<StudentRecord>::const_iterator;

    // Empty Dataset, no provenance.
    Dataset() = default;

    // Validates `records`. Throws ValidationError naming the offending field.
    explicit Dataset(std::vector<StudentRecord> records,
        std::optional<std::string> source_path = std::nullopt);

    std::size_t record_count() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const std::optional<std::string>& source_path() const { return source_path_; }
    const std::vector<StudentRecord>& records() const { return records_; }
    const StudentRecord& operator[](std::size_t i) const { return records_[i]; }

    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

    // Distinct terms, lexicographically sorted.
    std::vector<std::string> terms() const;

    // Distinct grades, ascending.
    std::vector<int> grades_present() const;

    // grade -> count, only for grades that occur.
    std::map<int, int> grade_distribution() const;

    Statistics statistics() const;

    // Stats for one term; all zero if the term does not occur.
    TermStats term_statistics(const std::string& term) const;

    Dataset filter_by_term(const std::string& term) const;
    Dataset filter_by_grade(int grade) const;

    // Inclusive on both ends. min > max yields an empty Dataset.
    Dataset filter_by_score_range(int min_score, int max_score) const;

    Dataset search(const std::string& query) const;

    // Stable: equal keys keep their current relative order.
    Dataset sorted_by(SortField field, bool descending = false) const;

private:
    struct Trusted {};
    Dataset(Trusted, std::vector<StudentRecord> records,
        std::optional<std::string> source_path);

    template <typename Pred>
    Dataset select(Pred keep) const;

    std::vector<StudentRecord> records_;
    std::optional<std::string> source_path_;
};

// Throws ValidationError if `r` breaks a field constraint. Used by the
// Dataset constructor; exposed so loaders can report per-field problems.
void validate_record(const StudentRecord& r);

// Lower-cases ASCII and the Latin-1 / Latin Extended-A letters in a UTF-8
// string. Other bytes pass through unchanged.
std::string fold_case(const std::string& s);
