#include <plantsched/core/production_log.hpp>

#include <utility>

namespace plantsched::core {

void ProductionLog::append(ProductionLogEntry entry) {
    total_energy_ += entry.energy;
    entries_.push_back(std::move(entry));
}

const ProductionLogEntry* ProductionLog::find(std::string_view order_id) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.order_id == order_id) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace plantsched::core
