#pragma once

/// @file event_writers.hpp
/// @brief Concrete EventWriter implementations for session logs.
///
/// Provides writers implementing @ref core::EventWriter: a JSON array
/// writer for machine consumption, an aligned textual writer for
/// terminals, and an in-memory buffer for tests.
///
/// @ingroup io_writers

#include <trialflow/core/event_writer.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace trialflow::io {

/// @brief Event writer that streams a JSON array of records.
///
/// Each record is an object `{"time": t, "type": "...", key: value...}`
/// serialised with rapidjson and written when the record ends. Call
/// @ref finalize to emit the closing bracket.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::EventWriter, TextEventWriter
class JsonEventWriter : public core::EventWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonEventWriter(std::ostream& output);

    /// @brief Calls @ref finalize if not already called.
    ~JsonEventWriter() override;

    JsonEventWriter(const JsonEventWriter&) = delete;
    JsonEventWriter& operator=(const JsonEventWriter&) = delete;
    JsonEventWriter(JsonEventWriter&&) = delete;
    JsonEventWriter& operator=(JsonEventWriter&&) = delete;

    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Write the closing bracket of the JSON array. Idempotent.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::StringBuffer buffer_;
    rapidjson::Writer<rapidjson::StringBuffer> writer_;
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A single event record stored in memory.
/// @ingroup io_writers
/// @see MemoryEventWriter
struct EventRecord {
    double time{0.0};   ///< Session-clock time of the event (seconds).
    std::string type;   ///< Event type (e.g. "trial_end").
    /// @brief Named fields attached to the event.
    std::map<std::string, std::variant<int64_t, double, std::string>> fields;
};

/// @brief Event writer that buffers all records in memory.
///
/// Intended for tests that assert on what a session logged.
///
/// @ingroup io_writers
class MemoryEventWriter : public core::EventWriter {
public:
    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<EventRecord>& records() const { return records_; }

    /// @brief Number of records of type @p type.
    [[nodiscard]] std::size_t count(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<EventRecord> records_;
    EventRecord current_;
};

/// @brief Human-readable event writer, one aligned line per record.
///
/// Format: `[    12.50000]        trial_end: trial = 3, duration = 1.2`
///
/// @ingroup io_writers
class TextEventWriter : public core::EventWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit TextEventWriter(std::ostream& output);

    TextEventWriter(const TextEventWriter&) = delete;
    TextEventWriter& operator=(const TextEventWriter&) = delete;
    TextEventWriter(TextEventWriter&&) = delete;
    TextEventWriter& operator=(TextEventWriter&&) = delete;

    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    double current_time_{0.0};
    std::string current_type_;
    std::vector<std::pair<std::string, std::string>> current_fields_;
};

} // namespace trialflow::io
