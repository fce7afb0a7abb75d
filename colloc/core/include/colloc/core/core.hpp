#pragma once

/// @defgroup core Core Library
/// @brief Allocation model, changeset calculator and metric encoding.
///
/// The core library holds the reconciliation engine: the allocation value
/// model, the schemata codec, the changeset calculator, metric encoding
/// and the allocator interface. It performs no I/O and keeps no state
/// between calls.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Resource kinds.

/// @defgroup core_schemata Schemata
/// @ingroup core
/// @brief Domain-keyed partition strings.

/// @defgroup core_allocation Allocation Values
/// @ingroup core
/// @brief Scalar and cache/bandwidth allocations and their maps.

/// @defgroup core_changeset Changeset
/// @ingroup core
/// @brief Target state and minimal changeset computation.

/// @defgroup core_metrics Metrics
/// @ingroup core
/// @brief Observability events.

/// @defgroup core_allocator Allocator
/// @ingroup core
/// @brief Policy interface, anomalies, configuration and cycle.

// Convenience header for the core library
#include <colloc/core/error.hpp>
#include <colloc/core/resource_kind.hpp>
#include <colloc/core/metric.hpp>
#include <colloc/core/schemata.hpp>
#include <colloc/core/cache_bandwidth_allocation.hpp>
#include <colloc/core/allocation.hpp>
#include <colloc/core/changeset.hpp>
#include <colloc/core/metrics_encoder.hpp>

#include <colloc/core/configuration.hpp>
#include <colloc/core/platform.hpp>
#include <colloc/core/anomaly.hpp>
#include <colloc/core/allocator.hpp>
#include <colloc/core/cycle.hpp>
