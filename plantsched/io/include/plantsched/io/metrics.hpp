#pragma once

/// @file metrics.hpp
/// @brief Post-run aggregates derived from the production log.
///
/// Energy and busy time per machine unit, utilization of each unit over
/// the days it was in use, operator head-count per day, and the span of
/// calendar days the schedule covers.
///
/// @ingroup io_metrics

#include <plantsched/core/catalog.hpp>
#include <plantsched/core/production_log.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace plantsched::io {

/// @brief Usage of one machine unit over the run.
/// @ingroup io_metrics
struct UnitUsage {
    std::string label;            ///< Unit label ("Yane600_1").
    std::size_t orders{0};        ///< Placements on the unit.
    core::Minutes busy{0.0};      ///< Total occupied minutes.
    core::Energy energy{0.0};     ///< Energy of those placements.
    double utilization{0.0};      ///< busy / (production days * daily window), in [0, 1].
};

/// @brief Aggregated metrics of a run.
///
/// Every schedulable unit of the catalog appears in @ref units, idle ones
/// included, in catalog order.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct ScheduleMetrics {
    core::Energy total_energy{0.0};
    std::vector<UnitUsage> units;

    /// Operators committed on each day that had a placement.
    std::map<uint32_t, uint32_t> operators_per_day;
    uint32_t peak_operators{0};

    std::size_t production_days{0}; ///< Distinct days with at least one placement.
    uint32_t first_day{0};          ///< 0 when nothing was placed.
    uint32_t last_day{0};
    uint32_t makespan_days{0};      ///< Calendar days from first to last, inclusive.
};

/// @brief Compute run metrics from a production log.
///
/// @param log      Production log of the run.
/// @param catalog  Catalog the run used (finalized).
/// @return Populated ScheduleMetrics.
[[nodiscard]] ScheduleMetrics compute_metrics(const core::ProductionLog& log,
                                              const core::ResourceCatalog& catalog);

/// @brief Write metrics as an indented console block.
void write_metrics_text(const ScheduleMetrics& metrics, std::ostream& output);

} // namespace plantsched::io
