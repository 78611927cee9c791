#include <trialflow/core/data_table.hpp>
#include <trialflow/core/error.hpp>
#include <trialflow/core/result_row.hpp>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace trialflow::core {

DataTable::DataTable(std::vector<std::string> headers)
    : headers_(std::move(headers)) {
    std::unordered_set<std::string_view> seen;
    for (const auto& header : headers_) {
        if (!seen.insert(header).second) {
            throw SchemaViolationError("duplicate column '" + header + "' in table header");
        }
    }
}

void DataTable::add_row(std::vector<std::string> cells) {
    if (cells.size() != headers_.size()) {
        throw SchemaViolationError("row has " + std::to_string(cells.size()) +
                                   " cells but the table has " +
                                   std::to_string(headers_.size()) + " columns");
    }
    rows_.push_back(std::move(cells));
}

void DataTable::add_complete_row(const NamedRow& row) {
    std::vector<std::string> cells(headers_.size());
    std::vector<bool> filled(headers_.size(), false);

    for (const auto& [key, cell] : row) {
        std::size_t idx = column_index(key);
        if (filled[idx]) {
            throw SchemaViolationError("column '" + key + "' given twice in one row");
        }
        cells[idx] = cell;
        filled[idx] = true;
    }

    auto missing = std::find(filled.begin(), filled.end(), false);
    if (missing != filled.end()) {
        auto idx = static_cast<std::size_t>(std::distance(filled.begin(), missing));
        throw SchemaViolationError("row is missing column '" + headers_[idx] + "'");
    }
    rows_.push_back(std::move(cells));
}

std::size_t DataTable::column_index(std::string_view header) const {
    auto it = std::find(headers_.begin(), headers_.end(), header);
    if (it == headers_.end()) {
        throw SchemaViolationError("unknown column '" + std::string(header) + "'");
    }
    return static_cast<std::size_t>(std::distance(headers_.begin(), it));
}

std::vector<std::string> DataTable::column(std::string_view header) const {
    std::size_t idx = column_index(header);
    std::vector<std::string> result;
    result.reserve(rows_.size());
    for (const auto& row : rows_) {
        result.push_back(row[idx]);
    }
    return result;
}

std::vector<std::string> DataTable::to_csv_lines() const {
    auto join = [](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) {
                line += ',';
            }
            line += sanitize_csv_field(fields[i]);
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows_.size() + 1);
    lines.push_back(join(headers_));
    for (const auto& row : rows_) {
        lines.push_back(join(row));
    }
    return lines;
}

void DataTable::write_csv(std::ostream& out) const {
    for (const auto& line : to_csv_lines()) {
        out << line << '\n';
    }
}

std::string sanitize_csv_field(std::string_view field) {
    std::string out(field);
    for (char& c : out) {
        if (c == ',') {
            c = '_';
        } else if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

DataTable build_results_table(const std::vector<const ResultRow*>& results) {
    // Pass 1: schema discovery
    std::vector<std::string> headers;
    std::unordered_set<std::string> known;
    for (const ResultRow* result : results) {
        if (result == nullptr) {
            continue;
        }
        for (const auto& entry : result->entries()) {
            if (known.insert(entry.first).second) {
                headers.push_back(entry.first);
            }
        }
    }

    // Pass 2: row materialisation
    DataTable table(headers);
    for (const ResultRow* result : results) {
        if (result == nullptr) {
            continue;
        }
        std::unordered_map<std::string_view, const Value*> lookup;
        for (const auto& entry : result->entries()) {
            lookup.emplace(entry.first, &entry.second);
        }

        std::vector<std::string> cells;
        cells.reserve(headers.size());
        for (const auto& header : headers) {
            auto it = lookup.find(header);
            if (it != lookup.end()) {
                cells.push_back(sanitize_csv_field(it->second->to_string()));
            } else {
                cells.emplace_back();
            }
        }
        table.add_row(std::move(cells));
    }
    return table;
}

} // namespace trialflow::core
