#pragma once

#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/routing.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace plantsched::core {

/// @brief Immutable record of one successful placement.
/// @ingroup core_log
struct ProductionLogEntry {
    std::string order_id;
    std::string product_type;
    std::string thickness;
    Workflow workflow;
    UnitKey unit;
    std::string unit_label;
    Day day;
    std::string day_label;
    Minutes start;
    Minutes end;
    Minutes duration;
    uint32_t operators;
    Energy energy;
};

/// @brief Append-only log of placements, in placement order.
/// @ingroup core_log
///
/// The log length always equals the number of placed orders. Entries are
/// never modified after append().
class ProductionLog {
public:
    /// @brief Append a placement.
    void append(ProductionLogEntry entry);

    [[nodiscard]] const std::vector<ProductionLogEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief Cumulative energy of every placement.
    [[nodiscard]] Energy total_energy() const noexcept { return total_energy_; }

    /// @brief Find the entry of an order.
    /// @return Pointer to the entry, or nullptr if the order was not placed.
    [[nodiscard]] const ProductionLogEntry* find(std::string_view order_id) const noexcept;

private:
    std::vector<ProductionLogEntry> entries_;
    Energy total_energy_{0.0};
};

} // namespace plantsched::core
