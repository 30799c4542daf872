#pragma once

#include <stdexcept>
#include <string>

namespace plantsched::algo {

/// @brief Exception thrown when an order's product type has no route.
/// @ingroup algo
///
/// Fatal to the order only: the Dispatcher marks it unschedulable and never
/// retries it.
///
/// @see Dispatcher::plan, core::ProductRoutingTable
class ClassificationError : public std::runtime_error {
public:
    /// @brief Construct a ClassificationError for a product type.
    /// @param product_type The unrecognised product type.
    explicit ClassificationError(const std::string& product_type)
        : std::runtime_error("unknown product type '" + product_type + "'")
        , product_type_(product_type) {}

    /// @brief Get the product type that could not be classified.
    [[nodiscard]] const std::string& product_type() const noexcept { return product_type_; }

private:
    std::string product_type_;
};

/// @brief Exception thrown when a route names a machine or role that the
///        catalog does not provide.
/// @ingroup algo
///
/// Non-fatal: the Dispatcher skips the order for the current day and
/// retries it on later days until the retry ceiling is reached.
///
/// @see Dispatcher::plan
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Exception thrown when an order's quantity does not fit its
///        workflow (a length on an accessory, bends on a forming product).
/// @ingroup algo
///
/// The Dispatcher rejects such orders before they enter the loop.
class InvalidOrderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace plantsched::algo
