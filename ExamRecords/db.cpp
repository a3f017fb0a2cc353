/*
-------------------------------------------------------------------------------
 db.cpp — SQLite snapshot store for ExamRecords
-------------------------------------------------------------------------------
Purpose
  - Saves the active Dataset into an SQLite file and loads it back, as an
    alternative to exporting CSV.

Design notes
  - Each function returns a bool for success/failure. Errors are printed with
    sqlite3_errmsg so the console does not need to know about SQLite.
  - Writes use prepared statements with bound parameters to avoid quoting
    problems in names.
  - db_save_dataset wraps DELETE + INSERTs in BEGIN/COMMIT and rolls back on
    any failure, so a snapshot is never half written.
  - CHECK constraints mirror the Dataset field rules; loaded rows still go
    through Dataset construction.

Schema
  records(seq, student_id UNIQUE, first_name, last_name, term, score, grade)
    seq keeps Dataset order.
  meta(key, value)
    'source_path' holds the Dataset provenance when it has one.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "errors.hpp"
#include <cstddef>
#include <iostream>
#include <vector>

// Small helper to run a raw SQL string with sqlite3_exec and report errors.
static bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) { std::cerr << "SQL error: " << err << "\n"; sqlite3_free(err); }
        return false;
    }
    return true;
}

// Print the connection's last error with some context.
static void report(sqlite3* db, const char* what) {
    std::cerr << what << ": " << sqlite3_errmsg(db) << "\n";
}

// True if every sqlite3_bind_* result is SQLITE_OK.
template <std::size_t N>
static bool all_ok(const int (&codes)[N]) {
    for (int rc : codes)
        if (rc != SQLITE_OK) return false;
    return true;
}

// Column text as std::string; NULL becomes "" and is rejected by Dataset.
static std::string column_string(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Open (or create) the SQLite database file at `path`.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

bool db_init(sqlite3* db) {
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS records ("
        "  seq         INTEGER PRIMARY KEY,"
        "  student_id  INTEGER NOT NULL UNIQUE CHECK (student_id > 0),"
        "  first_name  TEXT NOT NULL CHECK (first_name <> ''),"
        "  last_name   TEXT NOT NULL CHECK (last_name <> ''),"
        "  term        TEXT NOT NULL CHECK (term <> ''),"
        "  score       INTEGER NOT NULL CHECK (score BETWEEN 0 AND 100),"
        "  grade       INTEGER NOT NULL CHECK (grade BETWEEN 1 AND 5)"
        ");"

        "CREATE TABLE IF NOT EXISTS meta ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT"
        ");";
    return exec_sql(db, ddl);
}

bool db_save_dataset(sqlite3* db, const Dataset& data) {
    if (!exec_sql(db, "BEGIN;")) return false;

    auto rollback = [&] {
        exec_sql(db, "ROLLBACK;");
        return false;
        };

    if (!exec_sql(db, "DELETE FROM records; DELETE FROM meta;")) return rollback();

    // --- records ------------------------------------------------------------
    {
        const char* sql =
            "INSERT INTO records(seq,student_id,first_name,last_name,term,score,grade) "
            "VALUES(?,?,?,?,?,?,?);";
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            report(db, "Prepare insert failed");
            return rollback();
        }
        int seq = 0;
        for (const auto& r : data) {
            const int bound[] = {
                sqlite3_bind_int(st, 1, ++seq),
                sqlite3_bind_int(st, 2, r.student_id),
                sqlite3_bind_text(st, 3, r.first_name.c_str(), -1, SQLITE_TRANSIENT),
                sqlite3_bind_text(st, 4, r.last_name.c_str(), -1, SQLITE_TRANSIENT),
                sqlite3_bind_text(st, 5, r.term.c_str(), -1, SQLITE_TRANSIENT),
                sqlite3_bind_int(st, 6, r.score),
                sqlite3_bind_int(st, 7, r.grade),
            };
            if (!all_ok(bound)) {
                report(db, "Bind record failed");
                sqlite3_finalize(st);
                return rollback();
            }
            if (sqlite3_step(st) != SQLITE_DONE) {
                report(db, "Insert record failed");
                sqlite3_finalize(st);
                return rollback();
            }
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);
        }
        sqlite3_finalize(st);
    }

    // --- provenance ---------------------------------------------------------
    if (data.source_path()) {
        const char* sql = "INSERT INTO meta(key,value) VALUES('source_path',?);";
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            report(db, "Prepare meta failed");
            return rollback();
        }
        if (sqlite3_bind_text(st, 1, data.source_path()->c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
            report(db, "Bind meta failed");
            sqlite3_finalize(st);
            return rollback();
        }
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) {
            report(db, "Insert meta failed");
            return rollback();
        }
    }

    if (!exec_sql(db, "COMMIT;")) return rollback();
    return true;
}

bool db_load_dataset(sqlite3* db, Dataset& out) {
    std::vector<StudentRecord> records;
    std::optional<std::string> source_path;

    // --- load records -------------------------------------------------------
    {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db,
            "SELECT student_id,first_name,last_name,term,score,grade FROM records ORDER BY seq;",
            -1, &st, nullptr) != SQLITE_OK) {
            report(db, "Load records failed");
            return false;
        }
        int rc;
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            StudentRecord r;
            r.student_id = sqlite3_column_int(st, 0);
            r.first_name = column_string(st, 1);
            r.last_name = column_string(st, 2);
            r.term = column_string(st, 3);
            r.score = sqlite3_column_int(st, 4);
            r.grade = sqlite3_column_int(st, 5);
            records.push_back(std::move(r));
        }
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) {
            report(db, "Load records failed");
            return false;
        }
    }

    // --- load provenance ----------------------------------------------------
    {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT value FROM meta WHERE key='source_path';",
            -1, &st, nullptr) != SQLITE_OK) {
            report(db, "Load meta failed");
            return false;
        }
        if (sqlite3_step(st) == SQLITE_ROW && sqlite3_column_type(st, 0) != SQLITE_NULL)
            source_path = column_string(st, 0);
        sqlite3_finalize(st);
    }

    if (records.empty()) {
        std::cerr << "Snapshot is empty.\n";
        return false;
    }

    try {
        out = Dataset(std::move(records), std::move(source_path));
    }
    catch (const ValidationError& e) {
        std::cerr << "Snapshot rejected: " << e.what() << "\n";
        return false;
    }
    return true;
}

// Quick counts for the menu header. One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM records) AS r, "
        " (SELECT COUNT(DISTINCT term) FROM records) AS t;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, SQL, -1, &st, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out.records = sqlite3_column_int(st, 0);
        out.terms = sqlite3_column_int(st, 1);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok;
}
