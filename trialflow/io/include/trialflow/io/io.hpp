#pragma once

/// @defgroup io I/O Library
/// @brief JSON settings, experiment definitions, data handlers and event logs.
///
/// The I/O library connects the core to the outside world: reading
/// settings and experiment definitions from JSON, storing session data
/// on disk or in memory, and writing the session event log.
/// Depends on core only.

/// @defgroup io_json JSON
/// @ingroup io
/// @brief Conversion between JSON and core values.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Experiment definition loader.

/// @defgroup io_handlers Data Handlers
/// @ingroup io
/// @brief Filesystem and in-memory storage backends.

/// @defgroup io_writers Event Writers
/// @ingroup io
/// @brief JSON, textual and memory event writers.

// Convenience header for the I/O library

#include <trialflow/io/error.hpp>
#include <trialflow/io/json.hpp>
#include <trialflow/io/experiment_loader.hpp>
#include <trialflow/io/file_saver.hpp>
#include <trialflow/io/memory_data_handler.hpp>
#include <trialflow/io/event_writers.hpp>
