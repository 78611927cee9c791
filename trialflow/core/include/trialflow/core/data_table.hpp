#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trialflow::core {

class ResultRow;

/// @brief Rectangular, header-driven table of text cells.
/// @ingroup core_results
///
/// Every stored row has exactly one cell per header, in header order.
/// Rows can be added positionally (add_row) or as (column, cell) pairs in
/// any order (add_complete_row); either way a row that does not cover the
/// schema exactly is rejected with SchemaViolationError, so the CSV output
/// always has the same field count on every line.
///
/// Tables are plain values. Handing one to a persistence job copies it,
/// which freezes the snapshot for the background thread.
///
/// @see build_results_table, Tracker::data
class DataTable {
public:
    /// @brief One row given as (column, cell) pairs in any order.
    using NamedRow = std::vector<std::pair<std::string, std::string>>;

    /// @brief Construct an empty table with the given schema.
    /// @param headers Column names, in output order.
    /// @throws SchemaViolationError if a header is repeated.
    explicit DataTable(std::vector<std::string> headers);

    /// @brief Append a row given positionally.
    /// @param cells One cell per header, in header order.
    /// @throws SchemaViolationError if `cells.size() != column_count()`.
    void add_row(std::vector<std::string> cells);

    /// @brief Append a row given as (column, cell) pairs.
    ///
    /// Each header must appear exactly once; unknown columns are rejected.
    ///
    /// @throws SchemaViolationError on a missing, repeated or unknown column.
    void add_complete_row(const NamedRow& row);

    /// @brief Column names in order.
    [[nodiscard]] const std::vector<std::string>& headers() const noexcept { return headers_; }

    /// @brief Stored rows, each of width column_count().
    [[nodiscard]] const std::vector<std::vector<std::string>>& rows() const noexcept { return rows_; }

    [[nodiscard]] std::size_t column_count() const noexcept { return headers_.size(); }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    /// @brief Position of @p header in the schema.
    /// @throws SchemaViolationError if the column does not exist.
    [[nodiscard]] std::size_t column_index(std::string_view header) const;

    /// @brief All cells of one column, top to bottom.
    /// @throws SchemaViolationError if the column does not exist.
    [[nodiscard]] std::vector<std::string> column(std::string_view header) const;

    /// @brief Materialise the table as CSV lines (header line first).
    ///
    /// Fields are comma-delimited and never quoted. Commas inside a cell
    /// are replaced with `_` and line breaks with a space.
    ///
    /// @return `row_count() + 1` lines without trailing newlines.
    [[nodiscard]] std::vector<std::string> to_csv_lines() const;

    /// @brief Write to_csv_lines() to @p out, one line per row.
    void write_csv(std::ostream& out) const;

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

/// @brief Make a value safe to place in an unquoted CSV field.
/// @param field Raw cell text.
/// @return @p field with `,` replaced by `_` and CR/LF replaced by a space.
/// @ingroup core_results
[[nodiscard]] std::string sanitize_csv_field(std::string_view field);

/// @brief Reconcile per-trial result rows into one table.
///
/// First pass: the schema is the union of every row's columns, in order of
/// first appearance scanning rows in order. Second pass: each row yields
/// one table row, with absent columns left empty and present values
/// rendered through Value::to_string() and sanitize_csv_field().
///
/// Null entries in @p results (trials that never began) are skipped and
/// contribute neither columns nor rows.
///
/// @param results Result rows in trial order; entries may be nullptr.
/// @return Table with one row per non-null entry.
/// @ingroup core_results
[[nodiscard]] DataTable build_results_table(const std::vector<const ResultRow*>& results);

} // namespace trialflow::core
