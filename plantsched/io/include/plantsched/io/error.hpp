#pragma once

/// @file error.hpp
/// @brief Exception types of the plantsched I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace plantsched::io {

/// @brief Exception for input errors (reading, parsing, validation).
///
/// Thrown by the loaders when a file cannot be read, the JSON is malformed,
/// a required field is missing or mistyped, or the plant description is
/// rejected by the catalog.
///
/// @ingroup io
/// @see load_plant, load_orders
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  File path or JSON location the error refers to.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace plantsched::io
