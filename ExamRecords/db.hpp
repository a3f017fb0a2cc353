#pragma once
#include <string>
#include "sqlite3.h"
#include "dataset.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — SQLite snapshot store for a whole Dataset
-------------------------------------------------------------------------------

This header declares the functions that save a Dataset into an SQLite file and
read it back. A snapshot is always written and read wholesale: saving replaces
whatever the file held before.

Design:
  - Each function returns `bool` to indicate success/failure and prints the
    SQLite error text on std::cerr.
  - Loaded rows go through Dataset construction, so a snapshot edited by hand
    is validated exactly like a CSV file.
  - `DbCounts` provides quick counts (records, terms) for menus.

Usage convention:
  - Call `db_open` then `db_init` before any other call.
  - Always call `db_close` when done.
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Create tables if missing. Safe to call on every open.
bool db_init(sqlite3* db);

/// Replace the stored snapshot with `data` (one transaction).
bool db_save_dataset(sqlite3* db, const Dataset& data);

/// Rebuild the stored snapshot into `out`. `out` is untouched on failure.
bool db_load_dataset(sqlite3* db, Dataset& out);

/// Simple struct with live counts from DB.
struct DbCounts {
    int records = 0;
    int terms = 0;   // distinct terms
};

/// Populate `out` with counts of records and distinct terms.
/// Returns true on success.
bool db_get_counts(sqlite3* db, DbCounts& out);
