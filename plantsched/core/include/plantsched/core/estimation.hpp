#pragma once

/// @file estimation.hpp
/// @brief Estimated time to completion (ETC) and energy of a production step.
/// @ingroup core_estimation

#include <plantsched/core/types.hpp>

#include <cstdint>

namespace plantsched::core {

/// @brief ETC of a forming run: length divided by line speed.
///
/// @param total_length_m Product length in metres.
/// @param rate           Line speed of the forming machine.
/// @return Minutes of machine time, or kUnboundedMinutes when the rate is
///         zero or negative.
[[nodiscard]] Minutes estimate_forming(double total_length_m, LengthRate rate) noexcept;

/// @brief ETC of a bending run: bends times seconds per bend, in minutes.
///
/// @param total_bends Number of bend operations.
/// @param rate        Seconds per bend of the bending machine.
/// @return Minutes of machine time, or kUnboundedMinutes when the rate is
///         zero or negative.
[[nodiscard]] Minutes estimate_bending(int64_t total_bends, CycleRate rate) noexcept;

/// @brief Energy consumed by a machine running for @p duration.
///
/// Linear in the duration: running for 60 minutes consumes exactly
/// @p power.kw kWh. Negative durations clamp to zero energy.
///
/// @param power    Power draw of the machine.
/// @param duration Run time.
/// @return Energy in kWh.
[[nodiscard]] Energy estimate_energy(Power power, Minutes duration) noexcept;

} // namespace plantsched::core
