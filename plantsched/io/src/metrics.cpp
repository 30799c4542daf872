#include <plantsched/io/metrics.hpp>

#include <plantsched/core/machine_unit.hpp>

#include <algorithm>
#include <iomanip>
#include <set>

namespace plantsched::io {

ScheduleMetrics compute_metrics(const core::ProductionLog& log,
                                const core::ResourceCatalog& catalog) {
    ScheduleMetrics metrics;
    metrics.total_energy = log.total_energy();

    // Map unit key -> position in metrics.units
    std::map<core::UnitKey, std::size_t> index;
    for (std::size_t idx = 0; idx < catalog.unit_count(); ++idx) {
        const auto& unit = catalog.unit(idx);
        index[unit.key()] = metrics.units.size();
        metrics.units.push_back(UnitUsage{unit.label()});
    }

    std::set<uint32_t> days;
    for (const auto& entry : log.entries()) {
        auto iter = index.find(entry.unit);
        if (iter != index.end()) {
            auto& usage = metrics.units[iter->second];
            ++usage.orders;
            usage.busy += entry.duration;
            usage.energy += entry.energy;
        }
        metrics.operators_per_day[entry.day.number] += entry.operators;
        days.insert(entry.day.number);
    }

    for (const auto& [day, operators] : metrics.operators_per_day) {
        metrics.peak_operators = std::max(metrics.peak_operators, operators);
    }

    metrics.production_days = days.size();
    if (!days.empty()) {
        metrics.first_day = *days.begin();
        metrics.last_day = *days.rbegin();
        metrics.makespan_days = metrics.last_day - metrics.first_day + 1;

        double capacity = static_cast<double>(days.size()) *
                          catalog.constants().daily_work_minutes.count;
        for (auto& usage : metrics.units) {
            usage.utilization = usage.busy.count / capacity;
        }
    }
    return metrics;
}

void write_metrics_text(const ScheduleMetrics& metrics, std::ostream& output) {
    output << std::fixed << std::setprecision(2);
    output << "\nMetrics\n";
    output << "  Total energy:      " << metrics.total_energy.kwh << " kWh\n";
    output << "  Production days:   " << metrics.production_days << "\n";
    if (metrics.production_days > 0) {
        output << "  Makespan:          Day " << metrics.first_day << " .. Day "
               << metrics.last_day << " (" << metrics.makespan_days << " calendar days)\n";
        output << "  Peak operators:    " << metrics.peak_operators << "\n";
    }

    output << "  Units:\n";
    for (const auto& usage : metrics.units) {
        output << "    " << std::left << std::setw(12) << usage.label << std::right
               << std::setw(4) << usage.orders << " orders" << std::setw(10) << usage.busy.count
               << " min" << std::setw(10) << usage.energy.kwh << " kWh" << std::setw(8)
               << usage.utilization * 100.0 << " %\n";
    }

    if (!metrics.operators_per_day.empty()) {
        output << "  Operators per day:\n";
        for (const auto& [day, operators] : metrics.operators_per_day) {
            output << "    Day " << std::setw(3) << day << ": " << operators << "\n";
        }
    }
}

} // namespace plantsched::io
