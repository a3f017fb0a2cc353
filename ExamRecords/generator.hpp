#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "dataset.hpp"

/*
-------------------------------------------------------------------------------
 generator.hpp — Synthetic exam results
-------------------------------------------------------------------------------
Generator::generate(count) builds `count` records with ids 1..count, unique
"first last" names, a random term, a score drawn from the banded distribution
and the grade that score earns under the threshold table.

Failure modes
  - ConfigurationError        count < 1, count > max_unique_names(), or a
                              malformed GeneratorConfig. Raised before any
                              random draw.
  - GenerationExhaustedError  1000 consecutive name collisions for one record.
  - IoError                   save_path given and the CSV could not be written.

The engine is seeded from std::random_device unless a seed is passed.
-------------------------------------------------------------------------------
*/

struct GeneratorConfig {
    std::vector<std::string> male_names;
    std::vector<std::string> female_names;
    std::vector<std::string> surnames;
    std::vector<std::string> exam_terms;
    std::vector<ScoreBand> score_distribution;
    std::map<int, int> grade_thresholds;  // grade -> minimum score

    // Croatian name pools, four 2025 terms, five score bands, 90/80/65/50/0.
    static GeneratorConfig defaults();
};

// Highest grade whose threshold is <= score, checked from the top grade down.
// Returns 1 when the score is below every threshold.
int score_to_grade(int score, const std::map<int, int>& thresholds);

class Generator {
public:
    static constexpr int kMaxNameAttempts = 1000;

    explicit Generator(GeneratorConfig config = GeneratorConfig::defaults());
    Generator(GeneratorConfig config, std::uint32_t seed);

    const GeneratorConfig& config() const { return config_; }

    // (male + female) * surnames
    long max_unique_names() const;

    Dataset generate(int count, const std::optional<std::string>& save_path = std::nullopt);

private:
    void check_config(int count) const;
    int draw_score();

    GeneratorConfig config_;
    std::mt19937 rng_;
};
