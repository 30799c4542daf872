#pragma once

/// @defgroup core Core Library
/// @brief Plant model: catalog, orders, timelines, operator pool, log.
///
/// The core library holds the static plant description and the mutable
/// bookkeeping the dispatcher works on. It has no dependency on the
/// dispatch algorithm or on I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for minutes, power, energy, rates and days.

/// @defgroup core_catalog Resource Catalog
/// @ingroup core
/// @brief Machine types, machine units, plant constants, product routing.

/// @defgroup core_orders Orders
/// @ingroup core

/// @defgroup core_estimation Time Estimation
/// @ingroup core

/// @defgroup core_calendar Calendar
/// @ingroup core

/// @defgroup core_timeline Unit Timelines
/// @ingroup core

/// @defgroup core_operators Operator Ledger
/// @ingroup core

/// @defgroup core_log Production Log
/// @ingroup core

#include <plantsched/core/types.hpp>
#include <plantsched/core/error.hpp>
#include <plantsched/core/trace_writer.hpp>

#include <plantsched/core/machine_type.hpp>
#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/catalog.hpp>
#include <plantsched/core/routing.hpp>

#include <plantsched/core/order.hpp>
#include <plantsched/core/estimation.hpp>
#include <plantsched/core/calendar.hpp>
#include <plantsched/core/timeline.hpp>
#include <plantsched/core/operator_ledger.hpp>
#include <plantsched/core/production_log.hpp>
