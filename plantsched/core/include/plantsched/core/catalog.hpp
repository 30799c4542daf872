#pragma once

#include <plantsched/core/machine_type.hpp>
#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace plantsched::core {

/// @brief Plant-wide constants used by every scheduling decision.
/// @ingroup core_catalog
struct PlantConstants {
    uint32_t operator_pool{10};       ///< Operators available per day.
    Minutes daily_work_minutes{480.0}; ///< Length of the working window.
    uint32_t work_days_per_week{5};   ///< Working days at the start of each week.
    uint32_t week_length{7};          ///< Calendar days per week.
};

/// @brief Read-only description of the plant: machine types, their units,
///        and plant-wide constants.
/// @ingroup core_catalog
///
/// Built in two phases, like a hardware platform:
/// 1. add_machine_type() / set_constants() while open;
/// 2. finalize(), which creates one MachineUnit per declared unit and
///    locks the catalog. The Dispatcher requires a finalized catalog.
///
/// Types and units are heap-allocated so references handed out remain
/// valid as the catalog grows.
///
/// @see MachineType, MachineUnit, make_reference_catalog
class ResourceCatalog {
public:
    ResourceCatalog() = default;

    /// @brief Register a machine type or process role.
    ///
    /// @param name               Unique machine name.
    /// @param speed              Speed figure (monostate for process roles).
    /// @param power              Power draw of one running unit.
    /// @param unit_count         Number of physical units (0 for roles).
    /// @param operators_per_unit Operators needed per active unit.
    /// @return Reference to the new machine type.
    /// @throws AlreadyFinalizedError if called after finalize().
    /// @throws InvalidConfigurationError if the name is already taken or the
    ///         speed figure does not match the unit count.
    MachineType& add_machine_type(std::string_view name, MachineSpeed speed, Power power,
                                  uint32_t unit_count, uint32_t operators_per_unit);

    /// @brief Replace the plant-wide constants.
    /// @param constants New constants.
    /// @throws AlreadyFinalizedError if called after finalize().
    /// @throws InvalidConfigurationError if the working window is not
    ///         positive or the work week does not fit the calendar week.
    void set_constants(const PlantConstants& constants);

    /// @brief Create machine units and lock the catalog.
    ///
    /// Units are created in type registration order, then by index.
    /// Calling finalize() twice is a no-op.
    void finalize();

    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    [[nodiscard]] const PlantConstants& constants() const noexcept { return constants_; }

    [[nodiscard]] std::size_t machine_type_count() const noexcept { return machine_types_.size(); }
    [[nodiscard]] std::size_t unit_count() const noexcept { return units_.size(); }

    /// @brief Access a machine type by id.
    /// @throws OutOfRangeError if @p id was never issued.
    [[nodiscard]] const MachineType& machine_type(std::size_t id) const;

    /// @brief Look up a machine type by name.
    /// @return Pointer to the type, or nullptr if no type has that name.
    [[nodiscard]] const MachineType* find_machine_type(std::string_view name) const noexcept;

    /// @brief Access a unit by position in creation order.
    [[nodiscard]] const MachineUnit& unit(std::size_t idx) const { return *units_[idx]; }

    /// @brief Access a unit by structured key.
    /// @throws OutOfRangeError if no unit carries @p key.
    [[nodiscard]] const MachineUnit& unit(const UnitKey& key) const;

    /// @brief All units of one machine type, in index order.
    /// @param type_id MachineType::id() of the type.
    /// @return Possibly empty list (always empty for process roles or
    ///         before finalize()).
    [[nodiscard]] std::span<const MachineUnit* const> units_of(std::size_t type_id) const;

    ResourceCatalog(const ResourceCatalog&) = delete;
    ResourceCatalog& operator=(const ResourceCatalog&) = delete;
    ResourceCatalog(ResourceCatalog&&) = default;
    ResourceCatalog& operator=(ResourceCatalog&&) = default;

private:
    bool finalized_{false};
    PlantConstants constants_;

    std::vector<std::unique_ptr<MachineType>> machine_types_;
    std::vector<std::unique_ptr<MachineUnit>> units_;
    std::vector<std::vector<const MachineUnit*>> units_by_type_;
};

/// @brief Build the reference rollforming plant.
///
/// Three forming lines (Yane600 x2, Yane672, Yane750), two bending units,
/// and the shearing and forklift process roles; ten operators, an
/// eight-hour day and a five-day week. The catalog is returned finalized.
[[nodiscard]] ResourceCatalog make_reference_catalog();

} // namespace plantsched::core
