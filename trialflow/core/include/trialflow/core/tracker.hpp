#pragma once

#include <trialflow/core/data_table.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace trialflow::core {

/// @brief Continuous per-tick sampler attached to one tracked entity.
/// @ingroup core_trackers
///
/// A Tracker buffers rows of `[time, value...]` while recording is armed.
/// How the values are obtained is left to subclasses through
/// current_values(); the host calls sample() once per frame/tick.
///
/// Lifecycle:
///   1. start_recording() -- clear the buffer and arm
///   2. sample()          -- (repeated) append one row while armed
///   3. data()            -- frozen copy of the buffer for persistence
///   4. stop_recording()  -- disarm (Trial::end does this)
///
/// The buffer only ever holds one trial's worth of data: the next
/// start_recording() clears it, so it must be persisted first.
///
/// @see Session::add_tracker, Trial::end
class Tracker {
public:
    /// @brief Construct a tracker.
    /// @param object_name            Name of the tracked entity (e.g. "left_hand").
    /// @param measurement_descriptor Kind of measurement (e.g. "movement").
    /// @param custom_header          One column name per sampled value.
    /// @throws SchemaViolationError if a column repeats or is named `time`.
    Tracker(std::string object_name, std::string measurement_descriptor,
            std::vector<std::string> custom_header);

    virtual ~Tracker() = default;

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;
    Tracker(Tracker&&) = delete;
    Tracker& operator=(Tracker&&) = delete;

    /// @brief Clear the buffer and begin recording.
    void start_recording();

    /// @brief Stop appending rows; the buffer is kept.
    void pause_recording() noexcept { recording_ = false; }

    /// @brief Stop appending rows; the buffer is kept until the next start.
    void stop_recording() noexcept { recording_ = false; }

    /// @brief Returns true while rows are being appended.
    [[nodiscard]] bool recording() const noexcept { return recording_; }

    /// @brief Take one sample if recording.
    ///
    /// Calls current_values() and appends `[time, values...]`.
    /// Does nothing when not recording.
    ///
    /// @param time Timestamp of the tick, in seconds.
    /// @throws SchemaViolationError if current_values() returns a vector
    ///         whose size differs from custom_header().size().
    void sample(double time);

    /// @brief Copy of the buffered rows as a table with header().
    [[nodiscard]] DataTable data() const;

    /// @brief Number of buffered rows.
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    [[nodiscard]] const std::string& object_name() const noexcept { return object_name_; }
    [[nodiscard]] const std::string& measurement_descriptor() const noexcept { return measurement_descriptor_; }
    [[nodiscard]] const std::vector<std::string>& custom_header() const noexcept { return custom_header_; }

    /// @brief Full table header: `time` followed by custom_header().
    [[nodiscard]] std::vector<std::string> header() const;

    /// @brief Logical name used when saving: `<object>_<measurement>`.
    [[nodiscard]] std::string data_name() const;

protected:
    /// @brief Acquire this tick's values, one per custom header column.
    [[nodiscard]] virtual std::vector<std::string> current_values() = 0;

private:
    std::string object_name_;
    std::string measurement_descriptor_;
    std::vector<std::string> custom_header_;
    bool recording_{false};
    std::vector<std::vector<std::string>> rows_;
};

} // namespace trialflow::core
