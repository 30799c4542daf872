#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace plantsched::core {

/// @brief Production path an order follows through the plant.
/// @ingroup core_catalog
enum class Workflow {
    Forming,         ///< Sheet/coil product on one length-rated machine.
    ShearingBending  ///< Accessory: shearing, handling and one bending unit.
};

/// @brief Resolution of one product type onto plant resources.
/// @ingroup core_catalog
///
/// For ShearingBending routes, @c support_roles lists the process roles
/// whose operators join the bending unit's crew. They consume operator
/// budget only; the bending machine is the only timeline occupied.
struct ProductRoute {
    std::string product;                    ///< Product type as written on the order.
    Workflow workflow;                      ///< Path through the plant.
    std::string machine;                    ///< Machine type whose units run the order.
    std::vector<std::string> support_roles; ///< Extra crews (S&B only).
};

/// @brief Explicit product-type to machine-type table.
/// @ingroup core_catalog
///
/// Derived products that share another product's line (SD680 and Kabe325
/// running on the Yane750 line in the reference plant) are listed here
/// rather than special-cased in the dispatcher. Machine names are not
/// checked against a catalog at insertion; the dispatcher reports a
/// missing machine as a configuration error for the order concerned.
///
/// @see make_reference_routing
class ProductRoutingTable {
public:
    /// @brief Route a forming product onto a forming machine.
    /// @param product Product type.
    /// @param machine Machine type name that runs it.
    /// @throws InvalidConfigurationError if @p product is already routed.
    void add_forming_route(std::string_view product, std::string_view machine);

    /// @brief Route an accessory product onto the shearing-and-bending line.
    /// @param product         Product type.
    /// @param bending_machine Machine type holding the schedulable timeline.
    /// @param support_roles   Process roles contributing operators.
    /// @throws InvalidConfigurationError if @p product is already routed.
    void add_shearing_bending_route(std::string_view product, std::string_view bending_machine,
                                    std::vector<std::string> support_roles);

    /// @brief Look up the route for a product type.
    /// @return Pointer to the route, or nullptr when the type is unrecognised.
    [[nodiscard]] const ProductRoute* find(std::string_view product) const noexcept;

    [[nodiscard]] const std::vector<ProductRoute>& routes() const noexcept { return routes_; }

private:
    void check_unrouted(std::string_view product) const;

    std::vector<ProductRoute> routes_;
};

/// @brief Routing of the reference plant.
///
/// Yane600, Yane672 and Yane750 run on their own lines; SD680 and Kabe325
/// fall back to Yane750; "Aksesoris" goes through Bending with the
/// Shearing and Forklift crews.
[[nodiscard]] ProductRoutingTable make_reference_routing();

/// @brief Workflow name used in traces and reports ("forming", "shearing_bending").
[[nodiscard]] std::string_view to_string(Workflow workflow) noexcept;

} // namespace plantsched::core
