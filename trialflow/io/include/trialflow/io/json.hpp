#pragma once

/// @file json.hpp
/// @brief Conversion between JSON text and core::Value.
/// @ingroup io_json

#include <trialflow/core/value.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace trialflow::io {

/// @brief Parse a JSON document into a Value.
///
/// Objects become core::Object, arrays core::Array; integral numbers
/// that fit in 64 bits are kept as integers, other numbers as doubles.
///
/// @throws IoError on malformed JSON.
/// @ingroup io_json
[[nodiscard]] core::Value parse_json(std::string_view json);

/// @brief Read a settings file (a JSON object) into a settings table.
///
/// Nested objects and arrays are preserved.
///
/// @param path  Path to the JSON file.
/// @return The top-level object.
/// @throws IoError if the file cannot be read, is not valid JSON, or
///         its root is not an object.
/// @ingroup io_json
/// @see load_settings_from_string, core::Settings
[[nodiscard]] core::Object load_settings(const std::filesystem::path& path);

/// @brief Parse a settings table from a JSON string.
/// @throws IoError on malformed JSON or a non-object root.
/// @ingroup io_json
[[nodiscard]] core::Object load_settings_from_string(std::string_view json);

/// @brief Serialise @p value as compact JSON to @p out.
/// @ingroup io_json
void write_json(const core::Value& value, std::ostream& out);

/// @brief Serialise @p value as compact JSON.
/// @ingroup io_json
[[nodiscard]] std::string to_json_string(const core::Value& value);

} // namespace trialflow::io
