#include <trialflow/core/result_row.hpp>
#include <trialflow/core/error.hpp>

namespace trialflow::core {

ResultRow::ResultRow(const std::vector<std::string>& headers, bool ad_hoc)
    : ad_hoc_(ad_hoc) {
    entries_.reserve(headers.size());
    for (const auto& header : headers) {
        if (index_.find(header) == index_.end()) {
            index_.emplace(header, entries_.size());
            entries_.emplace_back(header, Value{});
        }
    }
}

Value& ResultRow::slot(const std::string& key, bool allow_new) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return entries_[it->second].second;
    }
    if (!allow_new) {
        throw SchemaViolationError("column '" + key +
                                   "' was not declared; add it to the custom headers "
                                   "or enable ad-hoc headers");
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, Value{});
    return entries_.back().second;
}

void ResultRow::set(const std::string& key, Value value) {
    slot(key, ad_hoc_) = std::move(value);
}

Value& ResultRow::operator[](const std::string& key) {
    return slot(key, ad_hoc_);
}

const Value& ResultRow::at(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw SchemaViolationError("column '" + key + "' does not exist");
    }
    return entries_[it->second].second;
}

void ResultRow::add_column(const std::string& key, Value value) {
    slot(key, true) = std::move(value);
}

bool ResultRow::contains(const std::string& key) const {
    return index_.find(key) != index_.end();
}

std::vector<std::string> ResultRow::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace trialflow::core
