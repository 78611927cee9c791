#pragma once

/// @file experiment_loader.hpp
/// @brief Loading experiment definitions (blocks, settings, headers) from JSON.
/// @ingroup io_loaders

#include <trialflow/core/value.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialflow::core {
class Session;
}

namespace trialflow::io {

/// @brief One block of an experiment definition.
/// @ingroup io_loaders
struct BlockDefinition {
    std::size_t trials{0};   ///< Number of trials in the block.
    core::Object settings;   ///< Block-level settings.
};

/// @brief A complete experiment definition.
///
/// JSON layout:
/// @code{.json}
/// {
///   "settings": { "difficulty": 1 },
///   "settings_to_log": ["difficulty"],
///   "custom_headers": ["response", "rt"],
///   "ad_hoc_headers": false,
///   "blocks": [
///     { "trials": 10 },
///     { "trials": 10, "settings": { "difficulty": 2 } }
///   ]
/// }
/// @endcode
///
/// Every member is optional.
///
/// @ingroup io_loaders
/// @see load_experiment, apply_definition
struct ExperimentDefinition {
    core::Object settings;                      ///< Session-level settings.
    std::vector<std::string> settings_to_log;   ///< Settings copied into each result row.
    std::vector<std::string> custom_headers;    ///< Declared result columns.
    std::optional<bool> ad_hoc_headers;         ///< Overrides SessionOptions::ad_hoc_header_add if set.
    std::vector<BlockDefinition> blocks;        ///< Blocks, in order.
};

/// @brief Load an experiment definition from a JSON file.
/// @throws IoError if the file cannot be read or is invalid.
/// @see load_experiment_from_string
[[nodiscard]] ExperimentDefinition load_experiment(const std::filesystem::path& path);

/// @brief Load an experiment definition from a JSON string.
/// @throws IoError if the JSON is malformed or a member has the wrong type.
[[nodiscard]] ExperimentDefinition load_experiment_from_string(std::string_view json);

/// @brief Configure @p session from @p definition.
///
/// Appends the settings-to-log and custom headers to the session
/// options, applies the ad-hoc switch, and creates one block per block
/// definition with its settings. Session-level settings are not
/// applied here: pass `definition.settings` to Session::begin.
///
/// @ingroup io_loaders
void apply_definition(core::Session& session, const ExperimentDefinition& definition);

} // namespace trialflow::io
