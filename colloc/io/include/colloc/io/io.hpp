#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading of allocations and configuration, metric output.
///
/// The I/O library handles all external data formats: loading the
/// allocation configuration and workload allocations from JSON, writing
/// allocations back as JSON, and exporting metrics as JSON or text.
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Configuration and allocation JSON loaders.

/// @defgroup io_writers Metric Writers
/// @ingroup io
/// @brief JSON and text metric writers.

// Convenience header for the I/O library

#include <colloc/io/error.hpp>
#include <colloc/io/config_loader.hpp>
#include <colloc/io/allocations_loader.hpp>
#include <colloc/io/metric_writers.hpp>
