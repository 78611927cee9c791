#include <trialflow/core/tracker.hpp>
#include <trialflow/core/error.hpp>

#include <iomanip>
#include <sstream>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace trialflow::core {

Tracker::Tracker(std::string object_name, std::string measurement_descriptor,
                 std::vector<std::string> custom_header)
    : object_name_(std::move(object_name))
    , measurement_descriptor_(std::move(measurement_descriptor))
    , custom_header_(std::move(custom_header)) {
    std::unordered_set<std::string_view> seen{"time"};
    for (const auto& column : custom_header_) {
        if (!seen.insert(column).second) {
            throw SchemaViolationError("tracker '" + data_name() + "' declares column '" + column +
                                       "' more than once or shadows the time column");
        }
    }
}

void Tracker::start_recording() {
    rows_.clear();
    recording_ = true;
}

void Tracker::sample(double time) {
    if (!recording_) {
        return;
    }

    std::vector<std::string> values = current_values();
    if (values.size() != custom_header_.size()) {
        throw SchemaViolationError("tracker '" + data_name() + "' produced " +
                                   std::to_string(values.size()) + " values but declares " +
                                   std::to_string(custom_header_.size()) + " columns");
    }

    std::ostringstream oss;
    oss << std::setprecision(10) << time;

    std::vector<std::string> row;
    row.reserve(values.size() + 1);
    row.push_back(oss.str());
    for (auto& value : values) {
        row.push_back(std::move(value));
    }
    rows_.push_back(std::move(row));
}

DataTable Tracker::data() const {
    DataTable table(header());
    for (const auto& row : rows_) {
        table.add_row(row);
    }
    return table;
}

std::vector<std::string> Tracker::header() const {
    std::vector<std::string> result;
    result.reserve(custom_header_.size() + 1);
    result.emplace_back("time");
    result.insert(result.end(), custom_header_.begin(), custom_header_.end());
    return result;
}

std::string Tracker::data_name() const {
    return object_name_ + "_" + measurement_descriptor_;
}

} // namespace trialflow::core
