#pragma once

#include <cstdint>
#include <string_view>

namespace trialflow::core {

/// @brief Abstract sink for structured session events (the library's log).
/// @ingroup core_logging
///
/// Records are built incrementally:
///   1. begin() -- open a record stamped with the session clock
///   2. type()  -- event name (`"trial_begin"`, `"session_exists"`, ...)
///   3. field() -- (repeated) key/value data
///   4. end()   -- close the record
///
/// The Session holds an optional pointer to a writer; with none
/// installed, logging costs a single null check.
///
/// @see Session::set_event_writer
class EventWriter {
public:
    virtual ~EventWriter() = default;

    /// @brief Open a record at @p time (seconds on the session clock).
    virtual void begin(double time) = 0;

    /// @brief Name the event of the current record.
    virtual void type(std::string_view name) = 0;

    /// @brief Attach an integer field.
    virtual void field(std::string_view key, int64_t value) = 0;

    /// @brief Attach a floating-point field.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Attach a string field.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Close the current record.
    virtual void end() = 0;

protected:
    EventWriter() = default;
    EventWriter(const EventWriter&) = default;
    EventWriter& operator=(const EventWriter&) = default;
    EventWriter(EventWriter&&) = default;
    EventWriter& operator=(EventWriter&&) = default;
};

} // namespace trialflow::core
