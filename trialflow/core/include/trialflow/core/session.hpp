#pragma once

#include <trialflow/core/block.hpp>
#include <trialflow/core/data_handler.hpp>
#include <trialflow/core/event_writer.hpp>
#include <trialflow/core/persistence_worker.hpp>
#include <trialflow/core/settings.hpp>
#include <trialflow/core/trial.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trialflow::core {

class Tracker;

/// @brief Switches controlling what a Session records and when it ends.
/// @ingroup core_experiment
struct SessionOptions {
    /// Save a `settings` JSON snapshot of the session settings on begin().
    bool copy_settings{true};
    /// Save a `participant_details` table on begin(), even when empty.
    bool copy_participant_details{true};
    /// End the session automatically when the last trial ends.
    bool end_after_last_trial{false};
    /// Accept result columns that were not declared in custom_headers.
    bool ad_hoc_header_add{false};
    /// Result columns the experiment plans to fill (dependent variables).
    std::vector<std::string> custom_headers;
    /// Settings (independent variables) copied into each trial's results.
    std::vector<std::string> settings_to_log;
};

/// @brief One run of an experiment for one participant.
/// @ingroup core_experiment
///
/// The Session owns the block list, the root Settings node, the
/// participant details and the persistence worker. It tracks the current
/// position with plain 1-based counters (0 = none) rather than object
/// references.
///
/// Lifecycle:
///   1. construct (inert); optionally create blocks, add trackers/handlers
///   2. begin()   -- fix identity and settings, start the worker
///   3. trial begin()/end() cycles
///   4. end()     -- save results, drain all writes, reset to inert
///
/// The Session is non-copyable and non-movable: blocks, trials and
/// settings hold references back into it.
///
/// @code
/// core::Session session;
/// io::FileSaver saver(session.persistence_worker(), "data");
/// session.add_data_handler(saver);
/// session.begin("stroop", "p01", "data");
/// auto& block = session.create_block(10);
/// for (std::size_t i = 1; i <= block.trial_count(); ++i) {
///     auto& trial = block.trial(i);
///     trial.begin();
///     trial.result()["rt"] = 0.42;
///     trial.end();
/// }
/// session.end();
/// @endcode
///
/// @see Block, Trial, DataHandler, PersistenceWorker
class Session {
public:
    /// @brief Source of timestamps in seconds.
    using Clock = std::function<double()>;
    using SessionCallback = std::function<void(Session&)>;
    using TrialCallback = std::function<void(Trial&)>;
    using CleanUpCallback = std::function<void()>;

    /// @brief Construct an inert session.
    /// @param options Recording switches and declared headers.
    /// @param clock   Timestamp source; defaults to a steady clock
    ///                counting seconds from construction.
    explicit Session(SessionOptions options = {}, Clock clock = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    /// @name Lifecycle
    /// @{

    /// @brief Start the session.
    ///
    /// A relative @p base_path is resolved against the working directory.
    /// If the folder `base/experiment/participant/S###` already exists a
    /// `session_exists` warning is logged and writes may overwrite it.
    ///
    /// @param experiment          Experiment name.
    /// @param participant         Participant identifier (ppid).
    /// @param base_path           Existing directory under which data is stored.
    /// @param session_number      Session number for this participant.
    /// @param participant_details Free-form participant information.
    /// @param settings            Session-level settings.
    /// @throws InvalidTransitionError if the session has already begun.
    /// @throws PathNotFoundError if @p base_path is not an existing directory.
    void begin(std::string experiment, std::string participant,
               const std::filesystem::path& base_path, int session_number = 1,
               Object participant_details = {}, Object settings = {});

    /// @brief End the session.
    ///
    /// No-op unless initialised. Otherwise: force-ends an in-progress
    /// trial, saves the aggregated `trial_results` table, runs clean-up
    /// callbacks, blocks until every queued write has completed, fires
    /// the session-end callbacks and resets to an inert, reusable state.
    ///
    /// A failing stage does not stop the later ones: the results table is
    /// still submitted when the forced trial end throws, and the reset
    /// still happens when a callback throws.
    ///
    /// @throws The first failure raised by any stage (forced trial end,
    ///         results save, a callback or a background write job); the
    ///         session is already reset when it propagates.
    void end();

    /// @brief Returns true between begin() and end().
    [[nodiscard]] bool initialised() const noexcept { return initialised_; }

    /// @}

    /// @name Blocks and trials
    /// @{

    /// @brief Append a block holding @p trial_count new trials.
    /// @return Reference to the new block (stable until end()).
    Block& create_block(std::size_t trial_count);

    [[nodiscard]] std::size_t block_count() const noexcept { return blocks_.size(); }

    /// @brief Total number of trials across all blocks.
    [[nodiscard]] std::size_t trial_count() const noexcept;

    /// @brief Access a block by its 1-based number.
    /// @throws NoSuchBlockError if out of range.
    [[nodiscard]] Block& block(std::size_t number);

    /// @brief The block of the current trial.
    /// @throws NoSuchBlockError if no trial has begun yet.
    [[nodiscard]] Block& current_block();

    /// @brief All trials, block order then trial order.
    [[nodiscard]] std::vector<Trial*> trials() const;

    /// @brief Access a trial by its 1-based session-wide number.
    /// @throws NoSuchTrialError if out of range.
    [[nodiscard]] Trial& trial(std::size_t number);

    /// @brief The most recently begun trial (in progress or ended).
    /// @throws NoSuchTrialError if no trial has begun yet.
    [[nodiscard]] Trial& current_trial();

    /// @brief The trial after the current one (the first if none has begun).
    /// @throws NoSuchTrialError past the last trial.
    [[nodiscard]] Trial& next_trial();

    /// @brief The trial before the current one.
    /// @throws NoSuchTrialError at or before the first trial.
    [[nodiscard]] Trial& prev_trial();

    /// @throws NoSuchTrialError if there are no blocks or the first block is empty.
    [[nodiscard]] Trial& first_trial();

    /// @throws NoSuchTrialError if there are no blocks or the last block is empty.
    [[nodiscard]] Trial& last_trial();

    /// @brief Returns true if the current trial is in progress.
    [[nodiscard]] bool in_trial() const noexcept;

    [[nodiscard]] std::size_t current_trial_num() const noexcept { return current_trial_num_; }
    [[nodiscard]] std::size_t current_block_num() const noexcept { return current_block_num_; }

    /// @brief Begin next_trial().
    void begin_next_trial();

    /// @brief End current_trial().
    void end_current_trial();

    /// @brief Begin the next trial unless the current one is the last.
    void begin_next_trial_safe();

    /// @brief End the session if @p trial is the last trial.
    void end_if_last_trial(const Trial& trial);

    /// @}

    /// @name Identity and paths
    /// @{
    [[nodiscard]] const std::string& experiment() const noexcept { return experiment_; }
    [[nodiscard]] const std::string& participant() const noexcept { return participant_; }
    [[nodiscard]] int number() const noexcept { return number_; }
    [[nodiscard]] const std::filesystem::path& base_path() const noexcept { return base_path_; }
    [[nodiscard]] std::filesystem::path experiment_path() const;
    [[nodiscard]] std::filesystem::path participant_path() const;
    [[nodiscard]] std::filesystem::path full_path() const;
    /// @brief Session folder name, e.g. `S001`.
    [[nodiscard]] std::string folder_name() const;
    /// @brief `experiment/participant/S###`, with forward slashes.
    [[nodiscard]] std::string directory() const;

    /// @brief Format a session number as a folder name (`3` -> `S003`).
    [[nodiscard]] static std::string session_number_to_name(int number);

    /// @brief Returns true if `base/experiment/participant/S###` exists.
    [[nodiscard]] static bool session_exists(std::string_view experiment, std::string_view participant,
                                             const std::filesystem::path& base_path, int session_number);
    /// @}

    /// @name Configuration
    /// @{

    /// @brief Root settings node; blocks chain to it.
    [[nodiscard]] Settings& settings() noexcept { return settings_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    [[nodiscard]] const Object& participant_details() const noexcept { return participant_details_; }

    [[nodiscard]] SessionOptions& options() noexcept { return options_; }
    [[nodiscard]] const SessionOptions& options() const noexcept { return options_; }

    /// @brief Columns every result row is seeded with, in order.
    ///
    /// Base columns, then settings-to-log, then custom headers, then one
    /// `<tracker>_location_<i>` column per tracker and active handler.
    [[nodiscard]] std::vector<std::string> headers() const;

    /// @brief The fixed columns present in every result row.
    [[nodiscard]] static const std::vector<std::string>& base_headers();

    /// @}

    /// @name Trackers and storage
    /// @{

    /// @brief Register a tracker (not owned; must outlive the session's use of it).
    void add_tracker(Tracker& tracker);
    [[nodiscard]] const std::vector<Tracker*>& trackers() const noexcept { return trackers_; }

    /// @brief Register a storage backend (not owned). Fan-out order is
    ///        registration order.
    void add_data_handler(DataHandler& handler);

    /// @brief Handlers currently receiving data, in fan-out order.
    [[nodiscard]] std::vector<DataHandler*> active_data_handlers() const;

    /// @brief The session's ordered background write queue.
    [[nodiscard]] PersistenceWorker& persistence_worker() noexcept { return worker_; }

    /// @brief Save session-level data to every active handler under @p name.
    /// @return The locations, in handler order.
    /// @throws UninitializedUseError before begin().
    std::vector<std::string> save_data_table(const DataTable& table, const std::string& name,
                                             DataType type = DataType::Other);
    std::vector<std::string> save_json(const Value& value, const std::string& name,
                                       DataType type = DataType::Other);
    std::vector<std::string> save_text(std::string_view text, const std::string& name,
                                       DataType type = DataType::Other);
    std::vector<std::string> save_bytes(std::span<const std::uint8_t> bytes, const std::string& name,
                                        DataType type = DataType::Other);

    /// @brief Queue a copy of @p file into full_path().
    /// @throws UninitializedUseError before begin().
    void copy_file_to_session_folder(const std::filesystem::path& file);

    /// @}

    /// @name Notifications
    /// @brief Callbacks run synchronously, in registration order.
    /// @{
    void on_session_begin(SessionCallback callback);
    void on_trial_begin(TrialCallback callback);
    void on_trial_end(TrialCallback callback);
    /// @brief Runs during end(), before writes are drained.
    void on_clean_up(CleanUpCallback callback);
    /// @brief Runs during end(), after every write has completed.
    void on_session_end(SessionCallback callback);
    /// @}

    /// @name Logging
    /// @{

    /// @brief Install the event writer (not owned). Pass nullptr to disable.
    void set_event_writer(EventWriter* writer) noexcept { event_writer_ = writer; }

    /// @brief Emit one event record if a writer is installed.
    /// @tparam F Callable with signature void(EventWriter&).
    template<typename F>
    void log(F&& func);

    /// @}

    /// @brief Current time on the session clock, in seconds.
    [[nodiscard]] double now() const { return clock_(); }

private:
    friend class Block;
    friend class Trial;

    void require_initialised(const char* operation) const;
    void save_results();
    [[nodiscard]] DataTarget target(const std::string& name, DataType type) const;
    [[nodiscard]] bool owns(const Block& block) const noexcept;
    /// @brief The list (current or retired) holding @p block.
    [[nodiscard]] const std::vector<std::unique_ptr<Block>>& block_list(const Block& block) const;

    template<typename F>
    std::vector<std::string> fan_out(const std::string& name, DataType type, F&& handle);

    SessionOptions options_;
    Clock clock_;

    std::string experiment_;
    std::string participant_;
    int number_{0};
    std::filesystem::path base_path_;
    Object participant_details_;
    Settings settings_;

    std::vector<std::unique_ptr<Block>> blocks_;
    // Blocks from the previous run, kept alive until the next begin() so
    // that callbacks still holding a Trial& during end() stay valid.
    std::vector<std::unique_ptr<Block>> retired_blocks_;
    std::size_t current_trial_num_{0};
    std::size_t current_block_num_{0};
    bool initialised_{false};
    bool ending_{false};

    std::vector<Tracker*> trackers_;
    std::vector<DataHandler*> data_handlers_;
    PersistenceWorker worker_;

    std::vector<SessionCallback> session_begin_callbacks_;
    std::vector<TrialCallback> trial_begin_callbacks_;
    std::vector<TrialCallback> trial_end_callbacks_;
    std::vector<CleanUpCallback> clean_up_callbacks_;
    std::vector<SessionCallback> session_end_callbacks_;

    EventWriter* event_writer_{nullptr};
};

// Template implementation
template<typename F>
void Session::log(F&& func) {
    if (event_writer_) {
        event_writer_->begin(now());
        func(*event_writer_);
        event_writer_->end();
    }
}

} // namespace trialflow::core
