#pragma once

/// @file error.hpp
/// @brief Exception type for the trialflow I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace trialflow::io {

/// @brief Exception for I/O errors (reading, parsing, writing files).
///
/// Thrown when a settings or experiment file cannot be read, contains
/// malformed JSON or misses required fields, and by background write
/// jobs when a file cannot be created.
///
/// @ingroup io
/// @see load_settings, load_experiment, FileSaver
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct an IoError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  File path or field name the error relates to.
    IoError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace trialflow::io
