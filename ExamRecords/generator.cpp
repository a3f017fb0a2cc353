/*
-------------------------------------------------------------------------------
 generator.cpp — Random exam results for demos and testing
-------------------------------------------------------------------------------
Scores
  A uniform r in [0,1) picks a band from score_distribution; the score is a
  normal draw with that band's mean/stddev, clamped to the band's range and
  rounded. Clamping before rounding keeps every score inside the band even for
  far tails, so the default table yields roughly 15% fails.

Names
  Each record picks the male or female pool with equal probability, then a
  first name and a surname uniformly. A name already used in this run is
  redrawn, at most kMaxNameAttempts times.
-------------------------------------------------------------------------------
*/

#include "generator.hpp"
#include "csv.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

GeneratorConfig GeneratorConfig::defaults() {
    GeneratorConfig c;
    c.male_names = {
        "Luka", "Ivan", "Marko", "Petar", "Josip", "Matej", "Filip", "Ante", "Tomislav",
        "Karlo", "Leon", "David", "Antonio", "Nikola", "Fran", "Lovro", "Borna", "Domagoj",
        "Tin", "Jan", "Roko", "Matija", "Jakov", "Andrija", "Marin", "Bruno", "Leo"
    };
    c.female_names = {
        "Ana", "Marija", "Ivana", "Petra", "Lucija", "Maja", "Sara", "Lana", "Eva",
        "Ema", "Mia", "Nika", "Lara", "Nina", "Tea", "Lea", "Paula", "Helena",
        "Karla", "Marta", "Katarina", "Valentina", "Klara", "Gabriela", "Nikolina"
    };
    c.surnames = {
        "Horvat", "Kovačević", "Babić", "Marić", "Novak", "Jurić", "Kovač", "Knežević",
        "Vuković", "Božić", "Blažević", "Perić", "Tomić", "Matić", "Pavlović", "Radić",
        "Šimić", "Nikolić", "Grgić", "Filipović", "Barić", "Lončar", "Pavić", "Šarić",
        "Jakić", "Klarić", "Vidović", "Mihaljević", "Tadić", "Lovrić", "Petrović"
    };
    c.exam_terms = { "2025-01", "2025-02", "2025-06", "2025-09" };
    c.score_distribution = {
        { 0.15, 25, 10,  0,  49 },
        { 0.30, 55,  8, 50,  64 },
        { 0.55, 70,  6, 65,  79 },
        { 0.80, 85,  5, 80,  89 },
        { 1.00, 93,  4, 90, 100 },
    };
    c.grade_thresholds = { { 5, 90 }, { 4, 80 }, { 3, 65 }, { 2, 50 }, { 1, 0 } };
    return c;
}

int score_to_grade(int score, const std::map<int, int>& thresholds) {
    for (auto it = thresholds.rbegin(); it != thresholds.rend(); ++it)
        if (score >= it->second) return it->first;
    return 1;
}

Generator::Generator(GeneratorConfig config)
    : config_(std::move(config)), rng_(std::random_device{}()) {}

Generator::Generator(GeneratorConfig config, std::uint32_t seed)
    : config_(std::move(config)), rng_(seed) {}

long Generator::max_unique_names() const {
    return static_cast<long>(config_.male_names.size() + config_.female_names.size())
        * static_cast<long>(config_.surnames.size());
}

void Generator::check_config(int count) const {
    if (count < 1)
        throw ConfigurationError("Student count must be at least 1 (got " + std::to_string(count) + ").");

    if (config_.male_names.empty() || config_.female_names.empty())
        throw ConfigurationError("Both first-name pools must be non-empty.");
    if (config_.surnames.empty())
        throw ConfigurationError("Surname pool must be non-empty.");
    if (config_.exam_terms.empty())
        throw ConfigurationError("Exam term list must be non-empty.");

    const auto& bands = config_.score_distribution;
    if (bands.empty())
        throw ConfigurationError("Score distribution table must be non-empty.");
    for (std::size_t i = 0; i < bands.size(); ++i) {
        const auto& b = bands[i];
        if (i > 0 && b.upper_bound < bands[i - 1].upper_bound)
            throw ConfigurationError("Score distribution bounds must be ascending.");
        if (b.clamp_min < kMinScore || b.clamp_max > kMaxScore || b.clamp_min > b.clamp_max)
            throw ConfigurationError("Score band " + std::to_string(i + 1)
                + " clamp range must lie within 0-100.");
        if (b.stddev < 0)
            throw ConfigurationError("Score band " + std::to_string(i + 1)
                + " has a negative standard deviation.");
    }
    if (bands.back().upper_bound < 1.0)
        throw ConfigurationError("Last score band must reach cumulative probability 1.0.");

    int prev_min = kMinScore;
    for (const auto& [grade, min_score] : config_.grade_thresholds) {
        if (grade < kMinGrade || grade > kMaxGrade || min_score < kMinScore || min_score > kMaxScore)
            throw ConfigurationError("Grade thresholds must map grades 1-5 to scores 0-100.");
        // std::map iterates grades ascending.
        if (min_score < prev_min)
            throw ConfigurationError("Grade " + std::to_string(grade)
                + " needs a minimum score of at least " + std::to_string(prev_min) + ".");
        prev_min = min_score;
    }

    const long max_names = max_unique_names();
    if (count > max_names)
        throw ConfigurationError("Student count (" + std::to_string(count)
            + ") exceeds the number of unique name combinations ("
            + std::to_string(max_names) + ").");
}

int Generator::draw_score() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const double roll = unit(rng_);

    const auto& bands = config_.score_distribution;
    auto band = std::find_if(bands.begin(), bands.end(),
        [roll](const ScoreBand& b) { return b.upper_bound > roll; });
    if (band == bands.end()) --band;  // upper_bound == 1.0 and roll rounding up

    // normal_distribution needs stddev > 0; a zero-width band is its mean.
    double raw = band->mean;
    if (band->stddev > 0) {
        std::normal_distribution<double> normal(band->mean, band->stddev);
        raw = normal(rng_);
    }
    double clamped = std::clamp(raw, static_cast<double>(band->clamp_min),
        static_cast<double>(band->clamp_max));
    return static_cast<int>(std::lround(clamped));
}

Dataset Generator::generate(int count, const std::optional<std::string>& save_path) {
    check_config(count);

    std::bernoulli_distribution pick_male(0.5);
    auto pick = [this](const std::vector<std::string>& pool) -> const std::string& {
        std::uniform_int_distribution<std::size_t> d(0, pool.size() - 1);
        return pool[d(rng_)];
        };

    std::vector<StudentRecord> records;
    records.reserve(count);
    std::unordered_set<std::string> used_names;

    for (int id = 1; id <= count; ++id) {
        StudentRecord r;
        r.student_id = id;

        bool unique = false;
        for (int attempt = 0; attempt < kMaxNameAttempts && !unique; ++attempt) {
            r.first_name = pick(pick_male(rng_) ? config_.male_names : config_.female_names);
            r.last_name = pick(config_.surnames);
            unique = used_names.insert(r.full_name()).second;
        }
        if (!unique)
            throw GenerationExhaustedError(kMaxNameAttempts, id);

        r.term = pick(config_.exam_terms);
        r.score = draw_score();
        r.grade = score_to_grade(r.score, config_.grade_thresholds);
        records.push_back(std::move(r));
    }

    if (!save_path) return Dataset(std::move(records));

    Dataset data(std::move(records), *save_path);
    write_csv(data, *save_path);
    return data;
}
