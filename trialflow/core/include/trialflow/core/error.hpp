#pragma once

#include <stdexcept>
#include <string>

namespace trialflow::core {

/// @brief Base exception for all experiment errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch experiment-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidTransitionError, NoSuchTrialError, SchemaViolationError
/// @ingroup core
class ExperimentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a lifecycle method is called out of sequence.
///
/// For example, ending a trial that was never begun, or beginning a
/// trial that is already in progress or done.
///
/// @see Trial::begin, Trial::end
/// @ingroup core
class InvalidTransitionError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when a requested trial position does not exist.
///
/// Asking for the next trial after the last one is the normal
/// end-of-experiment signal, so this type is kept distinct from
/// programming errors.
///
/// @see Session::next_trial, Session::trial
/// @ingroup core
class NoSuchTrialError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when a requested block position does not exist.
/// @see Session::block, Session::current_block
/// @ingroup core
class NoSuchBlockError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when data does not match its declared schema.
///
/// Raised by a strict ResultRow receiving an undeclared column, by a
/// Tracker sampling a row of the wrong width, and by a DataTable given
/// an incomplete row.
///
/// @see ResultRow, Tracker::sample, DataTable::add_complete_row
/// @ingroup core
class SchemaViolationError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when Session::begin is given a base path that does not exist.
/// @ingroup core
class PathNotFoundError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when session data is used before Session::begin.
/// @ingroup core
class UninitializedUseError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

/// @brief Thrown when a settings key is found neither in a node nor its ancestors.
/// @see Settings::get
/// @ingroup core
class KeyNotFoundError : public ExperimentError {
public:
    /// @brief Construct from the missing key.
    /// @param key The key that could not be resolved.
    explicit KeyNotFoundError(const std::string& key)
        : ExperimentError("setting '" + key + "' not found")
        , key_(key) {}

    /// @brief The key that could not be resolved.
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// @brief Thrown when a Value is read as a kind it does not hold.
/// @see Value::as_bool, Value::as_string
/// @ingroup core
class ValueTypeError : public ExperimentError {
public:
    using ExperimentError::ExperimentError;
};

} // namespace trialflow::core
