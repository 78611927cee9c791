#include <trialflow/io/event_writers.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace trialflow::io {

// =============================================================================
// JsonEventWriter
// =============================================================================

JsonEventWriter::JsonEventWriter(std::ostream& output)
    : output_(output)
    , writer_(buffer_) {
    output_ << "[\n";
}

JsonEventWriter::~JsonEventWriter() {
    finalize();
}

void JsonEventWriter::begin(double time) {
    buffer_.Clear();
    writer_.Reset(buffer_);
    writer_.StartObject();
    key("time");
    writer_.Double(time);
}

void JsonEventWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonEventWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonEventWriter::field(std::string_view key_name, int64_t value) {
    key(key_name);
    writer_.Int64(value);
}

void JsonEventWriter::field(std::string_view key_name, double value) {
    key(key_name);
    writer_.Double(value);
}

void JsonEventWriter::field(std::string_view key_name, std::string_view value) {
    key(key_name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonEventWriter::end() {
    writer_.EndObject();
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  " << buffer_.GetString();
}

void JsonEventWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryEventWriter
// =============================================================================

void MemoryEventWriter::begin(double time) {
    current_ = EventRecord{};
    current_.time = time;
}

void MemoryEventWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryEventWriter::field(std::string_view key, int64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryEventWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryEventWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryEventWriter::end() {
    records_.push_back(std::move(current_));
    current_ = EventRecord{};
}

std::size_t MemoryEventWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
                                                  [type](const EventRecord& r) { return r.type == type; }));
}

// =============================================================================
// TextEventWriter
// =============================================================================

TextEventWriter::TextEventWriter(std::ostream& output)
    : output_(output) {}

void TextEventWriter::begin(double time) {
    current_time_ = time;
    current_type_.clear();
    current_fields_.clear();
}

void TextEventWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextEventWriter::field(std::string_view key, int64_t value) {
    current_fields_.emplace_back(std::string(key), std::to_string(value));
}

void TextEventWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.emplace_back(std::string(key), oss.str());
}

void TextEventWriter::field(std::string_view key, std::string_view value) {
    current_fields_.emplace_back(std::string(key), std::string(value));
}

void TextEventWriter::end() {
    std::ostringstream line;
    line << "[" << std::setw(12) << std::fixed << std::setprecision(5) << current_time_ << "] "
         << std::setw(16) << std::right << current_type_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        line << (i > 0 ? ", " : " ") << current_fields_[i].first << " = " << current_fields_[i].second;
    }

    output_ << line.str() << "\n";
}

} // namespace trialflow::io
