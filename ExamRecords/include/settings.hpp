#pragma once
#include <string>

/*
-------------------------------------------------------------------------------
 settings.hpp — Application defaults
-------------------------------------------------------------------------------
Plain value type handed to the console at start-up. There is no settings file
and no global instance; main() owns one AppSettings and passes values down.
Generation defaults (name pools, terms, score bands, thresholds) live in
GeneratorConfig::defaults().
-------------------------------------------------------------------------------
*/

struct AppSettings {
    std::string default_csv_path = "studenti_ispit.csv";  // generate + save target
    std::string snapshot_path = "exam_records.db";        // SQLite snapshot file
    int default_student_count = 50;
    int max_student_count = 500;   // cap for the generate prompt
    int preview_rows = 20;         // rows shown by "View records"
};
