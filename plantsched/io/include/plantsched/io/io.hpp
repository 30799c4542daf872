#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, schedule and trace output, and metrics.
///
/// The I/O library handles all external data formats: loading plant and
/// order JSON files, rendering the production schedule (JSON and console
/// text), writing dispatcher traces (JSON, textual, in-memory) and
/// computing post-run metrics. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Plant and order JSON loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Schedule writers and JSON, textual, memory and null trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Per-unit energy and utilization, operators per day, makespan.

// Convenience header for libplantsched-io

#include <plantsched/io/error.hpp>
#include <plantsched/io/trace_writers.hpp>
#include <plantsched/io/plant_loader.hpp>
#include <plantsched/io/order_loader.hpp>
#include <plantsched/io/schedule_writer.hpp>
#include <plantsched/io/metrics.hpp>
