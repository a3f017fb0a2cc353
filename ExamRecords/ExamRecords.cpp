/*
-------------------------------------------------------------------------------
 ExamRecords.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for exam results. Generates or loads a Dataset, shows its
   statistics and lets the user narrow it down with filters, search and sort.

 Data flow (very important):
   - `active` is the Dataset last produced by generate / load CSV / load
     snapshot. Each of those replaces it wholesale.
   - `view` is an optional Dataset derived from `active` (or from the current
     view) with Dataset's own filter/search/sort. "Clear filter" drops it.
   - Displays, export and snapshot save work on the view when there is one,
     otherwise on `active`.

 Error model:
   - Core calls throw ExamDataError subclasses. Every menu action catches them
     here, prints the message and leaves `active`/`view` as they were.
   - Snapshot calls return bool and print their own SQLite diagnostics.

 User input model:
   - Prompts from validation.hpp; Back returns to the menu, Exit quits.

 Usage:
   ExamRecords [file.csv]    optional CSV to load at start-up

 Build:
   - Requires SQLite3 dev headers/libs and a C++17 (or later) compiler.
-------------------------------------------------------------------------------
*/

#include <iostream>
#include <limits>
#include <optional>
#include "settings.hpp"
#include "errors.hpp"
#include "dataset.hpp"
#include "generator.hpp"    // synthetic data
#include "loader.hpp"       // CSV -> validated Dataset
#include "db.hpp"           // SQLite snapshot store
#include "validation.hpp"   // prompt helpers and InputCtl enum
#include "helpers.hpp"      // show_records, show_statistics, ...

// Prints the welcome banner once at startup.
static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "                  Exam Results Records               \n";
    std::cout << "-----------------------------------------------------\n\n";
}

// Save `data` to the snapshot file, opening and closing the DB around it.
static bool save_snapshot(const std::string& path, const Dataset& data) {
    sqlite3* db = nullptr;
    if (!db_open(db, path)) return false;
    bool ok = db_init(db) && db_save_dataset(db, data);
    db_close(db);
    return ok;
}

// Load the snapshot file into `out`. `out` is untouched on failure.
static bool load_snapshot(const std::string& path, Dataset& out, DbCounts& counts) {
    sqlite3* db = nullptr;
    if (!db_open(db, path)) return false;
    bool ok = db_init(db) && db_get_counts(db, counts) && db_load_dataset(db, out);
    db_close(db);
    return ok;
}

//-----------------------------------------
int main(int argc, char** argv) {
    showWelcome();

    const AppSettings settings{};
    Generator generator;

    Dataset active;
    std::optional<Dataset> view;
    auto current = [&]() -> const Dataset& { return view ? *view : active; };

    // Optional CSV on the command line.
    if (argc > 1) {
        try {
            active = load(argv[1]);
            std::cout << "Loaded " << dataset_label(active) << ".\n";
        }
        catch (const ExamDataError& e) {
            std::cerr << "Could not load '" << argv[1] << "': " << e.what() << "\n";
        }
    }

    // --- Menu loop ----------------------------------------------------------
    int choice = -1;

    // Utility to reset the cin state and discard the rest of the current line.
    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "  Data: " << dataset_label(active) << "\n";
        if (view)
            std::cout << "  View: " << view->record_count() << " records (filtered)\n";
        std::cout
            << "-----------------------------------------------------\n"
            << "  [1]  Generate data     [2]  Load CSV               \n"
            << "  [3]  Statistics        [4]  View records           \n"
            << "  [5]  Grade histogram                               \n"
            << "-----------------------------------------------------\n"
            << " FILTER:                                             \n"
            << "  [6]  By term           [7]  By grade               \n"
            << "  [8]  By score range    [9]  Search name            \n"
            << "  [10] Sort              [11] Clear filter           \n"
            << "-----------------------------------------------------\n"
            << " SAVE:                                               \n"
            << "  [12] Export CSV        [13] Save snapshot          \n"
            << "  [14] Load snapshot                                 \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }
        clear_input();

        try {
            // ---- 1) Generate ------------------------------------------------
            if (choice == 1) {
                int count = settings.default_student_count;
                auto n = prompt_int_or_back("Number of students", count, 1, settings.max_student_count);
                if (n == InputCtl::Back) continue;
                if (n == InputCtl::Exit) { choice = 0; break; }

                auto c = confirm_or_back("Also save to '" + settings.default_csv_path + "'?");
                if (c == InputCtl::Exit) { choice = 0; break; }

                std::optional<std::string> save;
                if (c == InputCtl::Ok) save = settings.default_csv_path;

                active = generator.generate(count, save);
                view.reset();
                std::cout << "Generated " << dataset_label(active) << ".\n";
            }

            // ---- 2) Load CSV ------------------------------------------------
            else if (choice == 2) {
                std::string path;
                auto p = prompt_until_valid_or_back("CSV path", path, is_valid_csv_path,
                    "Path must end in .csv");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                // Pre-flight so a bad file never replaces the active data.
                auto [ok, reason] = can_load(path);
                if (!ok) { std::cout << "Cannot load: " << reason << "\n"; continue; }

                active = load(path);
                view.reset();
                std::cout << "Loaded " << dataset_label(active) << ".\n";
            }

            // ---- 3) Statistics ----------------------------------------------
            else if (choice == 3) {
                show_statistics(current());
            }

            // ---- 4) View records --------------------------------------------
            else if (choice == 4) {
                show_records(current(), static_cast<std::size_t>(settings.preview_rows));
            }

            // ---- 5) Grade histogram -----------------------------------------
            else if (choice == 5) {
                show_grade_histogram(current());
            }

            // ---- 6) Filter by term ------------------------------------------
            else if (choice == 6) {
                show_terms(current());
                std::string term;
                auto p = prompt_until_valid_or_back("Term", term, is_valid_term, "Enter a term code.");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }
                view = current().filter_by_term(term);
                std::cout << view->record_count() << " records in term " << term << ".\n";
            }

            // ---- 7) Filter by grade -----------------------------------------
            else if (choice == 7) {
                int grade = 0;
                auto p = prompt_int_or_back("Grade", grade, kMinGrade, kMaxGrade);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }
                view = current().filter_by_grade(grade);
                std::cout << view->record_count() << " records with grade " << grade << ".\n";
            }

            // ---- 8) Filter by score range -----------------------------------
            else if (choice == 8) {
                int lo = 0, hi = 0;
                auto p1 = prompt_int_or_back("Min score", lo, kMinScore, kMaxScore);
                if (p1 == InputCtl::Back) continue;
                if (p1 == InputCtl::Exit) { choice = 0; break; }
                auto p2 = prompt_int_or_back("Max score", hi, lo, kMaxScore);
                if (p2 == InputCtl::Back) continue;
                if (p2 == InputCtl::Exit) { choice = 0; break; }
                view = current().filter_by_score_range(lo, hi);
                std::cout << view->record_count() << " records scoring " << lo << "-" << hi << ".\n";
            }

            // ---- 9) Search --------------------------------------------------
            else if (choice == 9) {
                std::string q;
                auto p = prompt_text_or_back("Name contains", q);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }
                if (apply_name_search(active, view, q))
                    std::cout << view->record_count() << " matches.\n";
                else
                    std::cout << "No name filter applied.\n";
            }

            // ---- 10) Sort ---------------------------------------------------
            else if (choice == 10) {
                std::cout << "  1=id 2=first name 3=last name 4=term 5=score 6=grade\n";
                int f = 1;
                auto p = prompt_int_or_back("Sort by", f, 1, 6);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }
                auto field = static_cast<SortField>(f - 1);

                auto c = confirm_or_back("Descending?");
                if (c == InputCtl::Exit) { choice = 0; break; }

                view = current().sorted_by(field, c == InputCtl::Ok);
                std::cout << "Sorted by " << sort_field_label(field) << ".\n";
            }

            // ---- 11) Clear filter -------------------------------------------
            else if (choice == 11) {
                view.reset();
                std::cout << "Filter cleared.\n";
            }

            // ---- 12) Export CSV ---------------------------------------------
            else if (choice == 12) {
                if (current().empty()) { std::cout << "Nothing to export.\n"; continue; }
                std::string path;
                auto p = prompt_until_valid_or_back("Export to", path, is_valid_csv_path,
                    "Path must end in .csv");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }
                write_csv(current(), path);
                std::cout << "Exported " << current().record_count() << " records to " << path << ".\n";
            }

            // ---- 13) Save snapshot ------------------------------------------
            else if (choice == 13) {
                if (current().empty()) { std::cout << "Nothing to save.\n"; continue; }
                auto c = confirm_or_back("Overwrite snapshot '" + settings.snapshot_path + "'?");
                if (c == InputCtl::Back) continue;
                if (c == InputCtl::Exit) { choice = 0; break; }
                if (save_snapshot(settings.snapshot_path, current()))
                    std::cout << "Snapshot saved.\n";
                else
                    std::cout << "Could not save snapshot.\n";
            }

            // ---- 14) Load snapshot ------------------------------------------
            else if (choice == 14) {
                DbCounts counts;
                if (load_snapshot(settings.snapshot_path, active, counts)) {
                    view.reset();
                    std::cout << "Snapshot loaded: " << counts.records << " records, "
                        << counts.terms << " terms.\n";
                }
                else {
                    std::cout << "Could not load snapshot.\n";
                }
            }

            // ---- Unknown option guard ---------------------------------------
            else if (choice != 0) {
                std::cout << "Unknown option.\n";
            }
        }
        catch (const ExamDataError& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }

    return 0;
}
