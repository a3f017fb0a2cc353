#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "dataset.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp — Console rendering of a Dataset
-------------------------------------------------------------------------------
These functions print a Dataset or its statistics to std::cout. They only read
through the Dataset's public accessors and never change it.

Naming convention:
  - show_*     -> print a view of the data.
  - *_label    -> short text used inside menus.
  - apply_*    -> update the console's filtered view.
-------------------------------------------------------------------------------
*/

/// Print up to `limit` records as a table (0 = all), then "... N more".
void show_records(const Dataset& d, std::size_t limit);

/// Print the full statistics block including per-term lines.
void show_statistics(const Dataset& d);

/// Print one bar per grade, scaled to 40 columns.
void show_grade_histogram(const Dataset& d);

/// Print the distinct terms on one line.
void show_terms(const Dataset& d);

/// "123 records from 'file.csv'" / "50 records (generated)" / "no data loaded".
std::string dataset_label(const Dataset& d);

/// Display name for a SortField.
std::string sort_field_label(SortField f);

/// Narrow `view` (or `active` when there is no view) to names containing
/// `query`. A blank query leaves `view` untouched and returns false.
bool apply_name_search(const Dataset& active, std::optional<Dataset>& view,
    const std::string& query);
