#pragma once

/// @defgroup core Core Library
/// @brief Experiment lifecycle, settings, results, trackers and persistence.
///
/// The core library drives a Session -> Block -> Trial experiment: it
/// resolves hierarchical settings, collects per-trial results into one
/// table, buffers tracker samples and hands every payload to pluggable
/// data handlers through an ordered background write queue. It has no
/// dependencies on file formats or third-party libraries.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Dynamic values, objects and arrays.

/// @defgroup core_settings Settings
/// @ingroup core
/// @brief Settings nodes with a single-parent override chain.

/// @defgroup core_results Results
/// @ingroup core
/// @brief Result rows and tabular data.

/// @defgroup core_trackers Trackers
/// @ingroup core
/// @brief Per-tick samplers buffered for one trial.

/// @defgroup core_storage Storage
/// @ingroup core
/// @brief Data handler interface and the persistence worker.

/// @defgroup core_logging Logging
/// @ingroup core
/// @brief Structured event records.

/// @defgroup core_experiment Experiment
/// @ingroup core
/// @brief Session, Block and Trial.

// Convenience header for the core library
#include <trialflow/core/value.hpp>
#include <trialflow/core/error.hpp>
#include <trialflow/core/settings.hpp>
#include <trialflow/core/event_writer.hpp>

// Results and storage
#include <trialflow/core/result_row.hpp>
#include <trialflow/core/data_table.hpp>
#include <trialflow/core/data_handler.hpp>
#include <trialflow/core/persistence_worker.hpp>
#include <trialflow/core/tracker.hpp>

#include <trialflow/core/trial.hpp>
#include <trialflow/core/block.hpp>
#include <trialflow/core/session.hpp>
