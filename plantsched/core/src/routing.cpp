#include <plantsched/core/routing.hpp>
#include <plantsched/core/error.hpp>

#include <utility>

namespace plantsched::core {

void ProductRoutingTable::check_unrouted(std::string_view product) const {
    if (find(product) != nullptr) {
        throw InvalidConfigurationError("product '" + std::string(product) +
                                        "' is routed twice");
    }
}

void ProductRoutingTable::add_forming_route(std::string_view product, std::string_view machine) {
    check_unrouted(product);
    routes_.push_back(ProductRoute{std::string(product), Workflow::Forming,
                                   std::string(machine), {}});
}

void ProductRoutingTable::add_shearing_bending_route(std::string_view product,
                                                     std::string_view bending_machine,
                                                     std::vector<std::string> support_roles) {
    check_unrouted(product);
    routes_.push_back(ProductRoute{std::string(product), Workflow::ShearingBending,
                                   std::string(bending_machine), std::move(support_roles)});
}

const ProductRoute* ProductRoutingTable::find(std::string_view product) const noexcept {
    for (const auto& route : routes_) {
        if (route.product == product) {
            return &route;
        }
    }
    return nullptr;
}

ProductRoutingTable make_reference_routing() {
    ProductRoutingTable table;
    table.add_forming_route("Yane600", "Yane600");
    table.add_forming_route("Yane672", "Yane672");
    table.add_forming_route("Yane750", "Yane750");
    // Derived profiles share the Yane750 line
    table.add_forming_route("SD680", "Yane750");
    table.add_forming_route("Kabe325", "Yane750");
    table.add_shearing_bending_route("Aksesoris", "Bending", {"Shearing", "Forklift"});
    return table;
}

std::string_view to_string(Workflow workflow) noexcept {
    switch (workflow) {
        case Workflow::Forming:
            return "forming";
        case Workflow::ShearingBending:
            return "shearing_bending";
    }
    return "unknown";
}

} // namespace plantsched::core
