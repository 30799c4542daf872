#include <plantsched/core/estimation.hpp>

namespace plantsched::core {

Minutes estimate_forming(double total_length_m, LengthRate rate) noexcept {
    if (rate.metres_per_minute <= 0.0) {
        return kUnboundedMinutes;
    }
    return Minutes{total_length_m / rate.metres_per_minute};
}

Minutes estimate_bending(int64_t total_bends, CycleRate rate) noexcept {
    if (rate.seconds_per_operation <= 0.0) {
        return kUnboundedMinutes;
    }
    return Minutes{static_cast<double>(total_bends) * rate.seconds_per_operation / 60.0};
}

Energy estimate_energy(Power power, Minutes duration) noexcept {
    if (duration.count < 0.0) {
        return Energy{0.0};
    }
    // kWh = kW * hours
    return Energy{power.kw * duration.count / 60.0};
}

} // namespace plantsched::core
