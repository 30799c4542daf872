#include <plantsched/core/calendar.hpp>
#include <plantsched/core/error.hpp>

#include <string>

namespace plantsched::core {

WorkCalendar::WorkCalendar(uint32_t work_days_per_week, uint32_t week_length)
    : work_days_per_week_(work_days_per_week)
    , week_length_(week_length) {
    if (week_length_ == 0 || work_days_per_week_ == 0 || work_days_per_week_ > week_length_) {
        throw InvalidConfigurationError("invalid work week: " + std::to_string(work_days_per_week_) +
                                        " working days in a " + std::to_string(week_length_) +
                                        "-day week");
    }
}

bool WorkCalendar::is_working_day(Day day) const noexcept {
    if (day.number == 0) {
        return false;
    }
    return (day.number - 1) % week_length_ < work_days_per_week_;
}

Day WorkCalendar::next_working_day(Day day) const noexcept {
    Day next{day.number + 1};
    if (!is_working_day(next)) {
        // Jump to the first day of the following week
        uint32_t offset = (next.number - 1) % week_length_;
        next.number += week_length_ - offset;
    }
    return next;
}

} // namespace plantsched::core
