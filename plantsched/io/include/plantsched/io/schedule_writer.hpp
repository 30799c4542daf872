#pragma once

/// @file schedule_writer.hpp
/// @brief Rendering of a finished run: production log, totals, failures.
/// @ingroup io_writers

#include <plantsched/core/order.hpp>
#include <plantsched/core/production_log.hpp>

#include <ostream>
#include <vector>

namespace plantsched::io {

/// @brief Order counts of a run, derived from order statuses.
/// @ingroup io_writers
using ScheduleTotals = core::OrderTally;
using core::tally_orders;

/// @brief Write the schedule as a JSON document.
///
/// Layout:
/// @code{.json}
/// { "entries": [ { "order_id": "P-001", "product_type": "Yane600",
///                  "thickness": "0.5mm", "workflow": "forming",
///                  "unit": "Yane600_1", "day": 1, "day_label": "Day 1",
///                  "start_minute": 0, "end_minute": 300,
///                  "duration_minutes": 300, "operators": 1,
///                  "energy_kwh": 55 } ],
///   "summary": { "submitted": 3, "placed": 1, "rejected": 1,
///                "unschedulable": 1, "pending": 0, "total_energy_kwh": 55 },
///   "failures": [ { "order_id": "X", "status": "rejected",
///                   "reason": "...", "attempts": 0 } ] }
/// @endcode
///
/// @param log     Production log of the run.
/// @param orders  Every submitted order, in submission order.
/// @param output  Destination stream.
void write_schedule_json(const core::ProductionLog& log, const std::vector<core::Order>& orders,
                         std::ostream& output);

/// @brief Write the schedule as a console report.
///
/// One line per log entry (placement order), then the placed/submitted
/// count and cumulative energy, then every order that was not placed with
/// its reason.
///
/// @param log     Production log of the run.
/// @param orders  Every submitted order, in submission order.
/// @param output  Destination stream.
void write_schedule_text(const core::ProductionLog& log, const std::vector<core::Order>& orders,
                         std::ostream& output);

} // namespace plantsched::io
