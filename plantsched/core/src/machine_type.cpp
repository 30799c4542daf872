#include <plantsched/core/machine_type.hpp>
#include <plantsched/core/error.hpp>

#include <string>

namespace plantsched::core {

MachineType::MachineType(std::size_t id, std::string_view name, MachineSpeed speed, Power power,
                         uint32_t unit_count, uint32_t operators_per_unit)
    : id_(id)
    , name_(name)
    , speed_(speed)
    , power_(power)
    , unit_count_(unit_count)
    , operators_per_unit_(operators_per_unit) {
    bool has_speed = !std::holds_alternative<std::monostate>(speed_);
    if (unit_count_ > 0 && !has_speed) {
        throw InvalidConfigurationError("machine type '" + name_ +
                                        "' has units but no speed figure");
    }
    if (unit_count_ == 0 && has_speed) {
        throw InvalidConfigurationError("process role '" + name_ +
                                        "' must not carry a speed figure");
    }
    if (power_.kw < 0.0) {
        throw InvalidConfigurationError("machine type '" + name_ + "' has negative power");
    }
}

LengthRate MachineType::length_rate() const noexcept {
    if (const auto* rate = std::get_if<LengthRate>(&speed_)) {
        return *rate;
    }
    return LengthRate{0.0};
}

CycleRate MachineType::cycle_rate() const noexcept {
    if (const auto* rate = std::get_if<CycleRate>(&speed_)) {
        return *rate;
    }
    return CycleRate{0.0};
}

} // namespace plantsched::core
