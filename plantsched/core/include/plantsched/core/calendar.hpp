#pragma once

#include <plantsched/core/types.hpp>

#include <cstdint>

namespace plantsched::core {

/// @brief Fixed work-week calendar.
/// @ingroup core_calendar
///
/// Every week starts with @c work_days_per_week working days followed by
/// the non-working remainder of a @c week_length day week. Day 1 is the
/// first working day of week one, so with a 5/7 calendar days 1-5, 8-12,
/// 15-19, ... are working days.
class WorkCalendar {
public:
    /// @brief Construct a calendar.
    /// @param work_days_per_week Working days at the start of each week.
    /// @param week_length        Calendar days per week.
    /// @throws InvalidConfigurationError unless 1 <= work days <= week length.
    explicit WorkCalendar(uint32_t work_days_per_week, uint32_t week_length = 7);

    [[nodiscard]] uint32_t work_days_per_week() const noexcept { return work_days_per_week_; }
    [[nodiscard]] uint32_t week_length() const noexcept { return week_length_; }

    /// @brief First day of the run (always a working day).
    [[nodiscard]] static constexpr Day first_day() noexcept { return Day{1}; }

    /// @brief Whether @p day falls inside the working part of its week.
    [[nodiscard]] bool is_working_day(Day day) const noexcept;

    /// @brief The next working day strictly after @p day.
    ///
    /// Skips the non-working span in one step: after Day 5 of a 5/7
    /// calendar comes Day 8.
    [[nodiscard]] Day next_working_day(Day day) const noexcept;

private:
    uint32_t work_days_per_week_;
    uint32_t week_length_;
};

} // namespace plantsched::core
