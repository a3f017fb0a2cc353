/*
-------------------------------------------------------------------------------
 dataset.cpp — Dataset construction, statistics and derived views
-------------------------------------------------------------------------------
Purpose
  - Validates records entering a Dataset.
  - Computes the descriptive statistics shown by the front end.
  - Builds filtered / searched / sorted copies.

Complexity notes
  - Filters and search are a single linear pass. statistics() sorts a copy of
    the scores for the median (O(n log n)); everything else is linear.
  - Nothing is cached; statistics() rescans on every call.
-------------------------------------------------------------------------------
*/

#include "dataset.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_set>

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

void validate_record(const StudentRecord& r) {
    const std::string row = "student_id " + std::to_string(r.student_id);

    if (r.student_id < 1)
        throw ValidationError(ValidationKind::Range, "student_id",
            "student_id must be a positive integer (got " + std::to_string(r.student_id) + ").");
    if (is_blank(r.first_name))
        throw ValidationError(ValidationKind::Empty, "first_name", "first_name is empty for " + row + ".");
    if (is_blank(r.last_name))
        throw ValidationError(ValidationKind::Empty, "last_name", "last_name is empty for " + row + ".");
    if (is_blank(r.term))
        throw ValidationError(ValidationKind::Empty, "term", "term is empty for " + row + ".");
    if (r.score < kMinScore || r.score > kMaxScore)
        throw ValidationError(ValidationKind::Range, "score",
            "score must be in range 0-100 (got " + std::to_string(r.score) + " for " + row + ").");
    if (r.grade < kMinGrade || r.grade > kMaxGrade)
        throw ValidationError(ValidationKind::Range, "grade",
            "grade must be in range 1-5 (got " + std::to_string(r.grade) + " for " + row + ").");
}

Dataset::Dataset(std::vector<StudentRecord> records, std::optional<std::string> source_path)
    : records_(std::move(records)), source_path_(std::move(source_path)) {
    std::unordered_set<int> seen;
    seen.reserve(records_.size());
    for (const auto& r : records_) {
        validate_record(r);
        if (!seen.insert(r.student_id).second)
            throw ValidationError(ValidationKind::Duplicate, "student_id",
                "Duplicate student_id " + std::to_string(r.student_id) + ".");
    }
}

Dataset::Dataset(Trusted, std::vector<StudentRecord> records, std::optional<std::string> source_path)
    : records_(std::move(records)), source_path_(std::move(source_path)) {}

template <typename Pred>
Dataset Dataset::select(Pred keep) const {
    std::vector<StudentRecord> out;
    for (const auto& r : records_)
        if (keep(r)) out.push_back(r);
    return Dataset(Trusted{}, std::move(out), source_path_);
}

// ==========================
// Distinct values
// ==========================

std::vector<std::string> Dataset::terms() const {
    std::set<std::string> s;
    for (const auto& r : records_) s.insert(r.term);
    return std::vector<std::string>(s.begin(), s.end());
}

std::vector<int> Dataset::grades_present() const {
    std::set<int> s;
    for (const auto& r : records_) s.insert(r.grade);
    return std::vector<int>(s.begin(), s.end());
}

std::map<int, int> Dataset::grade_distribution() const {
    std::map<int, int> dist;
    for (const auto& r : records_) ++dist[r.grade];
    return dist;
}

// ==========================
// Statistics
// ==========================

TermStats Dataset::term_statistics(const std::string& term) const {
    TermStats ts;
    long score_sum = 0, grade_sum = 0;
    int passed = 0;
    for (const auto& r : records_) {
        if (r.term != term) continue;
        ++ts.count;
        score_sum += r.score;
        grade_sum += r.grade;
        if (r.passed()) ++passed;
    }
    if (ts.count == 0) return ts;

    ts.avg_score = static_cast<double>(score_sum) / ts.count;
    ts.avg_grade = static_cast<double>(grade_sum) / ts.count;
    ts.pass_rate = static_cast<double>(passed) / ts.count * 100.0;
    return ts;
}

Statistics Dataset::statistics() const {
    Statistics st;
    if (records_.empty()) return st;

    const int n = static_cast<int>(records_.size());
    long score_sum = 0, grade_sum = 0;
    std::vector<int> scores;
    scores.reserve(records_.size());

    for (const auto& r : records_) {
        score_sum += r.score;
        grade_sum += r.grade;
        scores.push_back(r.score);
        if (r.passed()) ++st.passed_count;
    }

    st.count = n;
    st.failed_count = n - st.passed_count;
    st.avg_score = static_cast<double>(score_sum) / n;
    st.avg_grade = static_cast<double>(grade_sum) / n;
    st.pass_rate = static_cast<double>(st.passed_count) / n * 100.0;

    std::sort(scores.begin(), scores.end());
    st.min_score = scores.front();
    st.max_score = scores.back();
    if (n % 2 == 1)
        st.median_score = scores[n / 2];
    else
        st.median_score = (scores[n / 2 - 1] + scores[n / 2]) / 2.0;

    // Sample standard deviation (n - 1 in the denominator).
    if (n > 1) {
        double ss = 0.0;
        for (int s : scores) {
            double d = s - st.avg_score;
            ss += d * d;
        }
        st.std_score = std::sqrt(ss / (n - 1));
    }

    st.grade_distribution = grade_distribution();
    for (const auto& t : terms())
        st.term_stats[t] = term_statistics(t);

    return st;
}

// ==========================
// Derived views
// ==========================

Dataset Dataset::filter_by_term(const std::string& term) const {
    return select([&](const StudentRecord& r) { return r.term == term; });
}

Dataset Dataset::filter_by_grade(int grade) const {
    return select([&](const StudentRecord& r) { return r.grade == grade; });
}

Dataset Dataset::filter_by_score_range(int min_score, int max_score) const {
    return select([&](const StudentRecord& r) {
        return r.score >= min_score && r.score <= max_score;
        });
}

Dataset Dataset::search(const std::string& query) const {
    const std::string q = fold_case(query);
    return select([&](const StudentRecord& r) {
        return fold_case(r.first_name).find(q) != std::string::npos
            || fold_case(r.last_name).find(q) != std::string::npos;
        });
}

Dataset Dataset::sorted_by(SortField field, bool descending) const {
    std::vector<StudentRecord> out = records_;

    auto less = [field](const StudentRecord& a, const StudentRecord& b) {
        switch (field) {
        case SortField::StudentId: return a.student_id < b.student_id;
        case SortField::FirstName: return a.first_name < b.first_name;
        case SortField::LastName:  return a.last_name < b.last_name;
        case SortField::Term:      return a.term < b.term;
        case SortField::Score:     return a.score < b.score;
        case SortField::Grade:     return a.grade < b.grade;
        }
        return false;
        };

    if (descending)
        std::stable_sort(out.begin(), out.end(),
            [&](const StudentRecord& a, const StudentRecord& b) { return less(b, a); });
    else
        std::stable_sort(out.begin(), out.end(), less);

    return Dataset(Trusted{}, std::move(out), source_path_);
}

// ==========================
// Case folding
// ==========================

// Lower-case counterpart of a code point in U+0000..U+017F, or cp itself.
static unsigned lower_code_point(unsigned cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;  // Latin-1
    if (cp == 0x178) return 0xFF;                                  // Ÿ
    if (cp == 0x130) return 'i';                                   // İ
    // Latin Extended-A alternates upper/lower, with the parity flipping
    // after U+0138 and again after U+0149 and U+0178.
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177))
        return (cp % 2 == 0) ? cp + 1 : cp;
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E))
        return (cp % 2 == 1) ? cp + 1 : cp;
    return cp;
}

std::string fold_case(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(lower_code_point(c)));
            continue;
        }
        // Two-byte sequence 110xxxxx 10xxxxxx covers everything we fold.
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()
            && (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80) {
            unsigned cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
            unsigned lo = lower_code_point(cp);
            if (lo < 0x80) {
                out.push_back(static_cast<char>(lo));
                ++i;
                continue;
            }
            out.push_back(static_cast<char>(0xC0 | (lo >> 6)));
            out.push_back(static_cast<char>(0x80 | (lo & 0x3F)));
            ++i;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}
