#pragma once

#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace plantsched::core {

/// @brief Speed figure of a machine type.
///
/// Exactly one alternative is populated for schedulable types; process
/// roles (unit count 0) carry @c std::monostate.
using MachineSpeed = std::variant<std::monostate, LengthRate, CycleRate>;

/// @brief Static catalog entry describing a family of identical machines.
/// @ingroup core_catalog
///
/// A type with a unit count of zero is a *process role*: it has operators
/// but no timeline of its own (shearing, forklift handling). Such roles are
/// only ever consumed from the operator budget.
///
/// MachineTypes are created and owned by ResourceCatalog and are
/// non-copyable but movable.
///
/// @see ResourceCatalog::add_machine_type, MachineUnit
class MachineType {
public:
    /// @brief Construct a new MachineType.
    /// @param id                 Catalog-issued identifier.
    /// @param name               Machine name (e.g. "Yane600", "Bending").
    /// @param speed              Length rate, cycle rate, or monostate for roles.
    /// @param power              Power draw of one running unit.
    /// @param unit_count         Number of physical units (0 for process roles).
    /// @param operators_per_unit Operators needed while one unit is active.
    /// @throws InvalidConfigurationError if a schedulable type has no speed
    ///         figure or a role carries one.
    MachineType(std::size_t id, std::string_view name, MachineSpeed speed, Power power,
                uint32_t unit_count, uint32_t operators_per_unit);

    [[nodiscard]] std::size_t id() const noexcept { return id_; }
    [[nodiscard]] std::string_view name() const noexcept { return name_; }
    [[nodiscard]] const MachineSpeed& speed() const noexcept { return speed_; }
    [[nodiscard]] Power power() const noexcept { return power_; }
    [[nodiscard]] uint32_t unit_count() const noexcept { return unit_count_; }
    [[nodiscard]] uint32_t operators_per_unit() const noexcept { return operators_per_unit_; }

    /// @brief True for types that only contribute operators, never machine time.
    [[nodiscard]] bool is_process_role() const noexcept { return unit_count_ == 0; }

    /// @brief Length rate for forming machines.
    /// @return The rate, or a zero rate if the type is not length-rated.
    [[nodiscard]] LengthRate length_rate() const noexcept;

    /// @brief Cycle rate for per-operation machines.
    /// @return The rate, or a zero rate if the type is not cycle-rated.
    [[nodiscard]] CycleRate cycle_rate() const noexcept;

    MachineType(const MachineType&) = delete;
    MachineType& operator=(const MachineType&) = delete;
    /// @cond INTERNAL
    MachineType(MachineType&&) = default;
    MachineType& operator=(MachineType&&) = default;
    /// @endcond

private:
    std::size_t id_;
    std::string name_;
    MachineSpeed speed_;
    Power power_;
    uint32_t unit_count_;
    uint32_t operators_per_unit_;
};

} // namespace plantsched::core
