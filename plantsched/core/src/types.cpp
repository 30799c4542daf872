#include <plantsched/core/types.hpp>

namespace plantsched::core {

std::string day_label(Day day) {
    return "Day " + std::to_string(day.number);
}

} // namespace plantsched::core
