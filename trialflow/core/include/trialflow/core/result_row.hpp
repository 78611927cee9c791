#pragma once

#include <trialflow/core/value.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trialflow::core {

/// @brief Ordered column -> value record holding one trial's results.
/// @ingroup core_results
///
/// Columns keep the order in which they were declared or first inserted.
/// A row is constructed from a list of declared headers, each starting
/// out null (rendered as an empty cell).
///
/// In strict mode, writing to a column that was not declared raises
/// SchemaViolationError at the call site. In ad-hoc mode the column is
/// appended and later reconciled into the results table schema.
///
/// @see Trial::result, build_results_table
class ResultRow {
public:
    /// @brief A single (column, value) entry.
    using Entry = std::pair<std::string, Value>;

    /// @brief Construct an empty ad-hoc row.
    ResultRow() = default;

    /// @brief Construct a row with declared columns.
    /// @param headers Declared columns, in order. Duplicates are ignored.
    /// @param ad_hoc  If true, undeclared columns may be added later.
    explicit ResultRow(const std::vector<std::string>& headers, bool ad_hoc = false);

    /// @brief Set the value of a column.
    /// @throws SchemaViolationError in strict mode if @p key was not declared.
    void set(const std::string& key, Value value);

    /// @brief Access a column for assignment (`row["score"] = 5`).
    /// @throws SchemaViolationError in strict mode if @p key was not declared.
    Value& operator[](const std::string& key);

    /// @brief Read a column.
    /// @throws SchemaViolationError if the column does not exist.
    [[nodiscard]] const Value& at(const std::string& key) const;

    /// @brief Append a column to the declared set, even in strict mode.
    ///
    /// Used for columns the library itself generates, such as the
    /// storage locations written by Trial::save_data_table. If the
    /// column already exists its value is overwritten.
    void add_column(const std::string& key, Value value);

    /// @brief Returns true if the column exists (declared or added).
    [[nodiscard]] bool contains(const std::string& key) const;

    /// @brief Column names in order.
    [[nodiscard]] std::vector<std::string> keys() const;

    /// @brief Entries in column order.
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

    /// @brief Number of columns.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// @brief Returns true if undeclared columns are accepted.
    [[nodiscard]] bool ad_hoc() const noexcept { return ad_hoc_; }

private:
    Value& slot(const std::string& key, bool allow_new);

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    bool ad_hoc_{true};
};

} // namespace trialflow::core
