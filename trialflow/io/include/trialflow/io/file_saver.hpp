#pragma once

/// @file file_saver.hpp
/// @brief Data handler writing experiment data to the local filesystem.
/// @ingroup io_handlers

#include <trialflow/core/data_handler.hpp>
#include <trialflow/core/persistence_worker.hpp>

#include <filesystem>
#include <string>

namespace trialflow::io {

/// @brief Stores every payload as a file under a session folder.
///
/// Layout below `base/experiment/participant/S###/`:
///
/// | DataType    | Directory        |
/// |-------------|------------------|
/// | Trials      | (session folder) |
/// | Trackers    | `trackers/`      |
/// | SessionInfo | `session_info/`  |
/// | Other       | `other/`         |
///
/// Tables are written as CSV (`.csv`), values as JSON (`.json`), text as
/// `.txt` and bytes as `.bin`. Each handle_* call copies the payload and
/// queues the write on the persistence worker, then returns the location
/// immediately. Directories are created by the write job. Existing files
/// are overwritten.
///
/// Write failures throw IoError on the worker thread; the worker rethrows
/// the first one from drain()/end().
///
/// @ingroup io_handlers
/// @see core::DataHandler, core::PersistenceWorker
class FileSaver : public core::DataHandler {
public:
    /// @param worker             Queue the writes run on (usually the session's).
    /// @param base_path          Root directory of all experiments.
    /// @param relative_locations Return locations relative to the session
    ///                           folder (default) instead of full paths.
    FileSaver(core::PersistenceWorker& worker, std::filesystem::path base_path, bool relative_locations = true);

    std::string handle_table(const core::DataTable& table, const core::DataTarget& target) override;
    std::string handle_json(const core::Value& value, const core::DataTarget& target) override;
    std::string handle_text(std::string_view text, const core::DataTarget& target) override;
    std::string handle_bytes(std::span<const std::uint8_t> bytes, const core::DataTarget& target) override;

    /// @brief Full path a payload with @p target and @p extension is written to.
    [[nodiscard]] std::filesystem::path path_for(const core::DataTarget& target, std::string_view extension) const;

    [[nodiscard]] const std::filesystem::path& base_path() const noexcept { return base_path_; }
    [[nodiscard]] bool relative_locations() const noexcept { return relative_locations_; }

private:
    [[nodiscard]] std::string location_for(const core::DataTarget& target, const std::filesystem::path& path) const;
    [[nodiscard]] std::filesystem::path session_path(const core::DataTarget& target) const;

    core::PersistenceWorker& worker_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::filesystem::path base_path_;
    bool relative_locations_;
};

} // namespace trialflow::io
