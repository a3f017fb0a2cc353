#include "helpers.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Text views of a Dataset for the console
-------------------------------------------------------------------------------
Apart from apply_name_search everything here is output only. Column widths
are counted in bytes, so names with accented letters can push a row one or two
characters to the right.
-------------------------------------------------------------------------------
*/

void show_records(const Dataset& d, std::size_t limit) {
    if (d.empty()) {
        std::cout << "No records.\n";
        return;
    }
    std::cout << std::left
        << std::setw(6) << "ID"
        << std::setw(14) << "First name"
        << std::setw(16) << "Last name"
        << std::setw(10) << "Term"
        << std::right
        << std::setw(6) << "Score"
        << std::setw(7) << "Grade" << "\n";
    std::cout << std::string(59, '-') << "\n";

    std::size_t shown = 0;
    for (const auto& r : d) {
        if (limit && shown == limit) break;
        std::cout << std::left
            << std::setw(6) << r.student_id
            << std::setw(14) << r.first_name
            << std::setw(16) << r.last_name
            << std::setw(10) << r.term
            << std::right
            << std::setw(6) << r.score
            << std::setw(7) << r.grade
            << (r.passed() ? "" : "  (fail)") << "\n";
        ++shown;
    }
    if (shown < d.record_count())
        std::cout << "... " << (d.record_count() - shown) << " more\n";
}

void show_statistics(const Dataset& d) {
    const Statistics s = d.statistics();
    if (s.count == 0) {
        std::cout << "No records - nothing to summarize.\n";
        return;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "--- ********************** ---\n";
    std::cout << "          Statistics          \n";
    std::cout << "--- ********************** ---\n";
    std::cout << "Students:      " << s.count << "\n"
        << "Average grade: " << s.avg_grade << "\n"
        << "Average score: " << s.avg_score << " (std " << s.std_score << ")\n"
        << "Min / Max:     " << s.min_score << " / " << s.max_score << "\n"
        << "Median score:  " << s.median_score << "\n"
        << "Pass rate:     " << s.pass_rate << "% ("
        << s.passed_count << " passed, " << s.failed_count << " failed)\n";

    std::cout << "Grades:       ";
    for (const auto& [grade, count] : s.grade_distribution)
        std::cout << " " << grade << ":" << count;
    std::cout << "\n";

    std::cout << "Per term:\n";
    for (const auto& [term, ts] : s.term_stats) {
        std::cout << "  " << std::left << std::setw(10) << term << std::right
            << " n=" << std::setw(4) << ts.count
            << "  avg score " << std::setw(6) << ts.avg_score
            << "  avg grade " << std::setw(4) << ts.avg_grade
            << "  pass " << std::setw(6) << ts.pass_rate << "%\n";
    }
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}

void show_grade_histogram(const Dataset& d) {
    const auto dist = d.grade_distribution();
    if (dist.empty()) {
        std::cout << "No records.\n";
        return;
    }
    int peak = 0;
    for (const auto& kv : dist) peak = std::max(peak, kv.second);

    for (int g = kMinGrade; g <= kMaxGrade; ++g) {
        auto it = dist.find(g);
        int count = (it == dist.end()) ? 0 : it->second;
        int width = peak ? (count * 40 + peak - 1) / peak : 0;
        std::cout << "  " << g << " | " << std::string(width, '#')
            << " " << count << "\n";
    }
}

void show_terms(const Dataset& d) {
    const auto terms = d.terms();
    if (terms.empty()) { std::cout << "No terms.\n"; return; }
    std::cout << "Terms:";
    for (const auto& t : terms) std::cout << " " << t;
    std::cout << "\n";
}

std::string dataset_label(const Dataset& d) {
    if (d.empty() && !d.source_path()) return "no data loaded";
    std::string out = std::to_string(d.record_count()) + " records";
    if (d.source_path())
        out += " from '" + *d.source_path() + "'";
    else
        out += " (generated)";
    return out;
}

std::string sort_field_label(SortField f) {
    switch (f) {
    case SortField::StudentId: return "student id";
    case SortField::FirstName: return "first name";
    case SortField::LastName:  return "last name";
    case SortField::Term:      return "term";
    case SortField::Score:     return "score";
    case SortField::Grade:     return "grade";
    }
    return "?";
}

bool apply_name_search(const Dataset& active, std::optional<Dataset>& view,
    const std::string& query) {
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) return false;
    view = (view ? *view : active).search(query);
    return true;
}
