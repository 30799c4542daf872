#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>

namespace plantsched::core {

/// @brief Time span or offset inside a working day, in minutes.
///
/// Estimated completion times are fractional (a bending job of 7 bends at
/// 4 s/bend lasts 0.4666... minutes), so the count is a double.
///
/// @see kUnboundedMinutes
/// @ingroup core_types
struct Minutes {
    double count; ///< Number of minutes.

    constexpr bool operator==(const Minutes&) const = default;
    constexpr auto operator<=>(const Minutes&) const = default;

    /// @brief Add two spans.
    /// @param rhs Minutes to add.
    /// @return Sum of the two spans.
    constexpr Minutes operator+(Minutes rhs) const noexcept { return Minutes{count + rhs.count}; }

    /// @brief Subtract a span.
    /// @param rhs Minutes to subtract.
    /// @return Difference of the two spans.
    constexpr Minutes operator-(Minutes rhs) const noexcept { return Minutes{count - rhs.count}; }

    /// @brief Accumulate a span in place.
    /// @param rhs Minutes to add.
    /// @return Reference to this.
    constexpr Minutes& operator+=(Minutes rhs) noexcept {
        count += rhs.count;
        return *this;
    }
};

/// @brief Sentinel duration for work that can never fit in a day.
///
/// Returned by the estimators when a machine rate is zero or negative.
/// Compares greater than any finite working window.
inline constexpr Minutes kUnboundedMinutes{std::numeric_limits<double>::infinity()};

/// @brief Strong type for machine power draw in kilowatts.
/// @ingroup core_types
struct Power {
    double kw; ///< Power value in kilowatts.

    constexpr bool operator==(const Power&) const = default;
    constexpr auto operator<=>(const Power&) const = default;
};

/// @brief Strong type for energy consumption in kilowatt-hours.
/// @ingroup core_types
struct Energy {
    double kwh; ///< Energy value in kilowatt-hours.

    constexpr bool operator==(const Energy&) const = default;
    constexpr auto operator<=>(const Energy&) const = default;

    /// @brief Accumulate energy.
    /// @param other Energy to add.
    /// @return Reference to this.
    constexpr Energy& operator+=(const Energy& other) {
        kwh += other.kwh;
        return *this;
    }
};

/// @brief Forming machine speed: metres of product per minute.
/// @ingroup core_types
struct LengthRate {
    double metres_per_minute;

    constexpr bool operator==(const LengthRate&) const = default;
};

/// @brief Cycle machine speed: seconds per discrete operation (one bend).
/// @ingroup core_types
struct CycleRate {
    double seconds_per_operation;

    constexpr bool operator==(const CycleRate&) const = default;
};

/// @brief One calendar day of the run, 1-based.
///
/// Day numbers count every calendar day, working or not; the WorkCalendar
/// decides which of them receive allocations.
///
/// @see WorkCalendar
/// @ingroup core_types
struct Day {
    uint32_t number{1}; ///< Calendar day number (Day 1 is the first day).

    constexpr bool operator==(const Day&) const = default;
    constexpr auto operator<=>(const Day&) const = default;
};

/// @brief Human-readable label for a day (e.g. "Day 8").
/// @param day Day to render.
/// @return Label string.
[[nodiscard]] std::string day_label(Day day);

} // namespace plantsched::core
