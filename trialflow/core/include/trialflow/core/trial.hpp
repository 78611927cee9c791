#pragma once

#include <trialflow/core/data_handler.hpp>
#include <trialflow/core/result_row.hpp>
#include <trialflow/core/settings.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trialflow::core {

class Block;
class DataTable;
class Session;

/// @brief Lifecycle state of a Trial.
/// @ingroup core_experiment
enum class TrialStatus {
    NotDone,     ///< Created, never begun.
    InProgress,  ///< Between begin() and end().
    Done,        ///< Ended; terminal.
};

/// @brief Lower-case name of a TrialStatus ("not_done", "in_progress", "done").
/// @ingroup core_experiment
[[nodiscard]] const char* to_string(TrialStatus status) noexcept;

/// @brief One measured attempt; the atomic unit of an experiment.
/// @ingroup core_experiment
///
/// Trials are created by their Block and never move between blocks.
/// Their numbers are derived from position, so reordering is not
/// possible once created.
///
/// State machine: NotDone -> InProgress -> Done. Calling begin() or end()
/// from any other state throws InvalidTransitionError.
///
/// @see Block, Session
class Trial {
public:
    /// @brief Construction token: only a Block can create trials.
    class Key {
        friend class Block;
        Key() = default;
    };

    Trial(Key key, Block& block);

    Trial(const Trial&) = delete;
    Trial& operator=(const Trial&) = delete;
    Trial(Trial&&) = delete;
    Trial& operator=(Trial&&) = delete;

    /// @brief 1-based position in the session-wide trial sequence.
    [[nodiscard]] std::size_t number() const;

    /// @brief 1-based position within this trial's block.
    [[nodiscard]] std::size_t number_in_block() const;

    [[nodiscard]] TrialStatus status() const noexcept { return status_; }
    [[nodiscard]] Block& block() noexcept { return block_; }
    [[nodiscard]] const Block& block() const noexcept { return block_; }
    [[nodiscard]] Session& session() noexcept;
    [[nodiscard]] const Session& session() const noexcept;

    /// @brief Trial-level settings; unresolved keys fall through to the block.
    [[nodiscard]] Settings& settings() noexcept { return settings_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    /// @brief Start the trial.
    ///
    /// Sets the session's current trial and block counters, stamps the
    /// start time, creates a fresh result row seeded with the session
    /// headers, arms every tracker and fires the trial-begin callbacks.
    ///
    /// @throws UninitializedUseError if the session has not begun.
    /// @throws InvalidTransitionError if this trial is not NotDone, or
    ///         another trial is still in progress.
    void begin();

    /// @brief Finish the trial.
    ///
    /// Stamps the end time, saves each tracker's buffer through the data
    /// handlers, logs the configured settings into the result row, marks
    /// the trial Done and fires the trial-end callbacks.
    ///
    /// @throws InvalidTransitionError if the trial is not InProgress.
    /// @throws KeyNotFoundError if a settings-to-log key does not resolve.
    void end();

    /// @brief Results for this trial.
    /// @throws InvalidTransitionError if the trial has never begun.
    [[nodiscard]] ResultRow& result();

    /// @brief Results for this trial, or nullptr if it has never begun.
    [[nodiscard]] const ResultRow* result_if_any() const noexcept;

    /// @brief Session-clock time of begin(), once begun.
    [[nodiscard]] std::optional<double> start_time() const noexcept { return start_time_; }

    /// @brief Session-clock time of end(), once ended.
    [[nodiscard]] std::optional<double> end_time() const noexcept { return end_time_; }

    /// @name Saving
    /// @brief Fan a payload out to every active data handler.
    ///
    /// The stored name is `<name>_T<trial number, 3 digits>`. Each handler's
    /// returned location is recorded in the result row under
    /// `<name>_location_<handler index>`.
    ///
    /// @return The locations, in handler order.
    /// @throws InvalidTransitionError if the trial has never begun.
    /// @{
    std::vector<std::string> save_data_table(const DataTable& table, const std::string& name,
                                             DataType type = DataType::Other);
    std::vector<std::string> save_json(const Value& value, const std::string& name,
                                       DataType type = DataType::Other);
    std::vector<std::string> save_text(std::string_view text, const std::string& name,
                                       DataType type = DataType::Other);
    std::vector<std::string> save_bytes(std::span<const std::uint8_t> bytes, const std::string& name,
                                        DataType type = DataType::Other);
    /// @}

private:
    template<typename F>
    std::vector<std::string> fan_out(const std::string& name, DataType type, F&& handle);

    Block& block_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Settings settings_;
    TrialStatus status_{TrialStatus::NotDone};
    std::optional<ResultRow> result_;
    std::optional<double> start_time_;
    std::optional<double> end_time_;
};

} // namespace trialflow::core
