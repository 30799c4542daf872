#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace plantsched::core {

class MachineType;

/// @brief Structured identifier of one physical machine unit.
///
/// Ordered by machine type first, then by instance index, which is the
/// order units are tried in when several can start at the same minute.
///
/// @ingroup core_catalog
struct UnitKey {
    std::size_t type_id; ///< MachineType::id() of the owning type.
    uint32_t index;      ///< 0-based instance index within the type.

    constexpr bool operator==(const UnitKey&) const = default;
    constexpr auto operator<=>(const UnitKey&) const = default;
};

/// @brief A concrete instance of a schedulable MachineType.
/// @ingroup core_catalog
///
/// Units are created once by ResourceCatalog::finalize() for every type
/// with a positive unit count and live as long as the catalog.
///
/// @see ResourceCatalog, UnitTimelineStore
class MachineUnit {
public:
    /// @brief Construct a unit of @p type with the given instance index.
    /// @param type  Owning machine type (must outlive the unit).
    /// @param index 0-based instance index.
    MachineUnit(const MachineType& type, uint32_t index);

    [[nodiscard]] const UnitKey& key() const noexcept { return key_; }
    [[nodiscard]] const MachineType& type() const noexcept { return type_; }
    [[nodiscard]] uint32_t index() const noexcept { return key_.index; }

    /// @brief Plant-floor label: type name and 1-based index ("Yane600_2").
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    MachineUnit(const MachineUnit&) = delete;
    MachineUnit& operator=(const MachineUnit&) = delete;

private:
    const MachineType& type_;
    UnitKey key_;
    std::string label_;
};

} // namespace plantsched::core
