#pragma once
#include <map>
#include <string>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain structs
-------------------------------------------------------------------------------
Defines plain data structures for the exam-results domain:
  - StudentRecord  (one exam result: who, which term, score, grade)
  - TermStats      (aggregates for a single exam term)
  - Statistics     (aggregates for a whole Dataset)
  - ScoreBand      (one row of the score-distribution table used by Generator)

These are simple value types with public fields. Constraints on the fields are
enforced where records enter a Dataset (see dataset.hpp), not here.
-------------------------------------------------------------------------------
*/

// Lowest passing grade. Grade 1 is a fail.
constexpr int kPassingGrade = 2;

constexpr int kMinScore = 0;
constexpr int kMaxScore = 100;
constexpr int kMinGrade = 1;
constexpr int kMaxGrade = 5;

// One exam result
struct StudentRecord {
    int student_id{ 0 };     // positive, unique within a Dataset
    std::string first_name;
    std::string last_name;
    std::string term;        // exam sitting, e.g. 2025-06
    int score{ 0 };          // 0..100
    int grade{ 0 };          // 1..5, stored as supplied

    std::string full_name() const {
        return first_name + " " + last_name;
    }

    bool passed() const {
        return grade >= kPassingGrade;
    }
};

inline bool operator==(const StudentRecord& a, const StudentRecord& b) {
    return a.student_id == b.student_id
        && a.first_name == b.first_name
        && a.last_name == b.last_name
        && a.term == b.term
        && a.score == b.score
        && a.grade == b.grade;
}

inline bool operator!=(const StudentRecord& a, const StudentRecord& b) {
    return !(a == b);
}

// Aggregates for the records of one exam term
struct TermStats {
    int count{ 0 };
    double avg_score{ 0.0 };
    double avg_grade{ 0.0 };
    double pass_rate{ 0.0 };  // percent
};

// Aggregates for a whole Dataset. All zero / empty when the Dataset is empty.
struct Statistics {
    int count{ 0 };
    double avg_grade{ 0.0 };
    double avg_score{ 0.0 };
    double std_score{ 0.0 };     // sample standard deviation, 0 when count <= 1
    int min_score{ 0 };
    int max_score{ 0 };
    double median_score{ 0.0 };
    double pass_rate{ 0.0 };     // percent, grade >= 2
    int passed_count{ 0 };
    int failed_count{ 0 };
    std::map<int, int> grade_distribution;        // grade -> count
    std::map<std::string, TermStats> term_stats;  // term  -> stats
};

// One band of the score-distribution table. A uniform draw r in [0,1) selects
// the first band whose upper_bound is greater than r.
struct ScoreBand {
    double upper_bound{ 0.0 };  // cumulative probability
    double mean{ 0.0 };
    double stddev{ 0.0 };
    int clamp_min{ 0 };
    int clamp_max{ 0 };
};
