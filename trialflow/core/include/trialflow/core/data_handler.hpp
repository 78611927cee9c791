#pragma once

#include <trialflow/core/data_table.hpp>
#include <trialflow/core/value.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace trialflow::core {

/// @brief Category of a saved payload, used by handlers to pick a destination.
/// @ingroup core_storage
enum class DataType {
    SessionInfo,  ///< Settings and participant-details snapshots.
    Trials,       ///< The aggregated trial results table.
    Trackers,     ///< Per-trial tracker recordings.
    Other,        ///< Anything else saved by the experiment.
};

/// @brief Lower-case name of a DataType ("session_info", "trials", ...).
/// @ingroup core_storage
[[nodiscard]] const char* to_string(DataType type) noexcept;

/// @brief Identity of one saved payload.
///
/// Handlers derive their storage location from these fields; the
/// session fills them in from its own identity.
///
/// @ingroup core_storage
struct DataTarget {
    std::string experiment;           ///< Experiment name.
    std::string participant;          ///< Participant identifier (ppid).
    int session_number{1};            ///< Session number (folder `S###`).
    std::string name;                 ///< Logical payload name (no extension).
    DataType type{DataType::Other};   ///< Payload category.
};

/// @brief Abstract storage backend receiving experiment data.
/// @ingroup core_storage
///
/// A Session fans every save out to all of its active handlers, in
/// registration order. Each handler persists the payload however it
/// sees fit and returns a location string (path, URI, key) that the
/// trial records in its results so every copy stays traceable.
///
/// Handlers are called on the foreground thread. Implementations that
/// do I/O should copy the payload and hand the actual write to a
/// PersistenceWorker so the caller is not blocked. Errors raised from
/// a handle_* call propagate to the caller unchanged; the session does
/// not retry.
///
/// @see Session::add_data_handler, Trial::save_data_table, PersistenceWorker
class DataHandler {
public:
    virtual ~DataHandler() = default;

    /// @brief Persist a table (typically as CSV).
    /// @return Location of the stored table.
    virtual std::string handle_table(const DataTable& table, const DataTarget& target) = 0;

    /// @brief Persist a JSON-serialisable object or array.
    /// @return Location of the stored document.
    virtual std::string handle_json(const Value& value, const DataTarget& target) = 0;

    /// @brief Persist a block of text.
    /// @return Location of the stored text.
    virtual std::string handle_text(std::string_view text, const DataTarget& target) = 0;

    /// @brief Persist raw bytes.
    /// @return Location of the stored bytes.
    virtual std::string handle_bytes(std::span<const std::uint8_t> bytes, const DataTarget& target) = 0;

    /// @brief Inactive handlers are skipped by the fan-out.
    [[nodiscard]] bool active() const noexcept { return active_; }

    /// @brief Enable or disable this handler.
    void set_active(bool active) noexcept { active_ = active; }

protected:
    DataHandler() = default;
    DataHandler(const DataHandler&) = default;
    DataHandler& operator=(const DataHandler&) = default;
    DataHandler(DataHandler&&) = default;
    DataHandler& operator=(DataHandler&&) = default;

private:
    bool active_{true};
};

} // namespace trialflow::core
