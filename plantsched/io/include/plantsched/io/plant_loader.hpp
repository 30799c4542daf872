#pragma once

/// @file plant_loader.hpp
/// @brief Loading plant descriptions (machines, constants, routes) from JSON.
/// @ingroup io_loaders

#include <plantsched/core/catalog.hpp>
#include <plantsched/core/routing.hpp>

#include <filesystem>
#include <string_view>

namespace plantsched::io {

/// @brief A loaded plant: finalized catalog plus routing table.
/// @ingroup io_loaders
struct PlantConfig {
    core::ResourceCatalog catalog;
    core::ProductRoutingTable routing;
};

/// @brief Load a plant description from a JSON file.
///
/// Expected layout:
/// @code{.json}
/// {
///   "constants": { "operator_pool": 10, "daily_work_minutes": 480,
///                  "work_days_per_week": 5, "week_length": 7 },
///   "machine_types": [
///     { "name": "Yane600", "speed_m_per_min": 16, "power_kw": 11,
///       "units": 2, "operators_per_unit": 1 },
///     { "name": "Bending", "seconds_per_bend": 4, "power_kw": 9.7,
///       "units": 2, "operators_per_unit": 2 },
///     { "name": "Shearing", "operators_per_unit": 2 }
///   ],
///   "routes": [
///     { "product": "SD680", "workflow": "forming", "machine": "Yane750" },
///     { "product": "Aksesoris", "workflow": "shearing_bending",
///       "machine": "Bending", "support_roles": ["Shearing", "Forklift"] }
///   ]
/// }
/// @endcode
///
/// `constants` and each of its members are optional and default to the
/// reference plant. A machine type without `units` is a process role.
///
/// @param path  Filesystem path to the JSON plant description.
/// @return The plant, with its catalog finalized.
/// @throws LoaderError  If the file cannot be read, the JSON is invalid, or
///                      the description is rejected by the catalog.
///
/// @see load_plant_from_string
[[nodiscard]] PlantConfig load_plant(const std::filesystem::path& path);

/// @brief Load a plant description from a JSON string.
/// @see load_plant
[[nodiscard]] PlantConfig load_plant_from_string(std::string_view json);

} // namespace plantsched::io
