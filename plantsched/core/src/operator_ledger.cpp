#include <plantsched/core/operator_ledger.hpp>
#include <plantsched/core/error.hpp>

namespace plantsched::core {

void OperatorLedger::ensure_day(Day day) {
    committed_.try_emplace(day, 0);
}

uint32_t OperatorLedger::committed(Day day) const noexcept {
    auto it = committed_.find(day);
    return it == committed_.end() ? 0 : it->second;
}

void OperatorLedger::commit(Day day, uint32_t required) {
    uint32_t free = available(day);
    if (required > free) {
        throw AdmissionError(required, free);
    }
    committed_[day] += required;
}

} // namespace plantsched::core
