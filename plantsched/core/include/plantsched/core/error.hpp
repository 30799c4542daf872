#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace plantsched::core {

/// @brief Base exception for all plant model errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch plant-specific errors separately from other
/// `std::runtime_error` exceptions.
///
/// @see InvalidStateError, InvalidConfigurationError, AlreadyFinalizedError, OutOfRangeError,
///      OverlapError, AdmissionError
/// @ingroup core
class PlantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example scheduling an order that is no longer pending, or running a
/// dispatcher over an unfinalized catalog.
///
/// @see PlantError
/// @ingroup core
class InvalidStateError : public PlantError {
public:
    using PlantError::PlantError;
};

/// @brief Thrown when the static plant description breaks an invariant.
///
/// For example a negative unit count, a schedulable machine type with no
/// speed figure, a duplicate machine name, or a route naming an unknown
/// product twice.
///
/// @see ResourceCatalog, ProductRoutingTable
/// @ingroup core
class InvalidConfigurationError : public PlantError {
public:
    using PlantError::PlantError;
};

/// @brief Thrown when attempting to modify the catalog after finalize().
///
/// Once ResourceCatalog::finalize() has created the machine units, the
/// machine types and constants are locked.
///
/// @see ResourceCatalog::finalize
/// @ingroup core
class AlreadyFinalizedError : public PlantError {
public:
    using PlantError::PlantError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example requesting a machine type by an id the catalog never issued.
///
/// @ingroup core
class OutOfRangeError : public PlantError {
public:
    using PlantError::PlantError;
};

/// @brief Thrown when committing an interval that overlaps an occupied one
///        or leaves the working window.
///
/// A commit built from a fresh Timeline::find_slot() result can never raise
/// this; it signals a second writer between search and commit.
///
/// @see Timeline::insert, UnitTimelineStore::commit
/// @ingroup core
class OverlapError : public PlantError {
public:
    using PlantError::PlantError;
};

/// @brief Thrown when an operator commitment would exceed the plant pool.
///
/// @see OperatorLedger::commit
/// @ingroup core
class AdmissionError : public PlantError {
public:
    /// @brief Construct an AdmissionError with pool details.
    ///
    /// @param requested Operators requested by the commit.
    /// @param available Operators still free on that day.
    AdmissionError(uint32_t requested, uint32_t available)
        : PlantError("Cannot commit " + std::to_string(requested) +
                     " operators: only " + std::to_string(available) + " available")
        , requested_(requested)
        , available_(available) {}

    /// @brief Get the number of operators that was requested.
    /// @return Requested operator count.
    [[nodiscard]] uint32_t requested() const noexcept { return requested_; }

    /// @brief Get the number of operators free at the time of the request.
    /// @return Available operator count.
    [[nodiscard]] uint32_t available() const noexcept { return available_; }

private:
    uint32_t requested_;
    uint32_t available_;
};

} // namespace plantsched::core
