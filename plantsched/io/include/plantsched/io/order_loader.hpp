#pragma once

/// @file order_loader.hpp
/// @brief Order intake from JSON.
/// @ingroup io_loaders

#include <plantsched/core/order.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace plantsched::io {

/// @brief Load production orders from a JSON file.
///
/// Expected layout:
/// @code{.json}
/// { "orders": [
///     { "id": "P-001", "product_type": "Yane600", "priority": "Urgent",
///       "thickness": "0.5mm", "total_length_m": 4800 },
///     { "id": "A-001", "product_type": "Aksesoris", "priority": "Normal",
///       "bends_per_item": 4, "item_count": 120 }
/// ] }
/// @endcode
///
/// `id` and `product_type` are required strings; a record without them is
/// a structural error. Problems local to one order (unknown priority,
/// missing or non-numeric quantity, both quantity kinds given) produce an
/// order in Rejected status carrying the reason, so it still counts as
/// submitted. Range checks on numeric quantities are left to the
/// dispatcher.
///
/// @param path  Filesystem path to the JSON order file.
/// @return Orders in file order.
/// @throws LoaderError  If the file cannot be read or is structurally invalid.
[[nodiscard]] std::vector<core::Order> load_orders(const std::filesystem::path& path);

/// @brief Load production orders from a JSON string.
/// @see load_orders
[[nodiscard]] std::vector<core::Order> load_orders_from_string(std::string_view json);

} // namespace plantsched::io
