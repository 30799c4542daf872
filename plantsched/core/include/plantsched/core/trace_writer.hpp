#pragma once

#include <plantsched/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace plantsched::core {

/// @brief Abstract interface for recording scheduling decisions.
/// @ingroup core
///
/// Implementations of TraceWriter serialise dispatcher events to a
/// specific format (JSON, console text, memory buffer, etc.).
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record for a given calendar day
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The Dispatcher holds an optional pointer to a TraceWriter. When no
/// writer is installed the overhead is a single null-pointer check.
///
/// @see algo::Dispatcher::set_trace_writer()
class TraceWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record on the given day.
    /// @param day The calendar day the dispatcher is working on.
    virtual void begin(Day day) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"order_placed"`, `"day_exhausted"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    ///
    /// After this call the writer is ready for a new begin()/end() cycle.
    virtual void end() = 0;

protected:
    /// @brief Default constructor (protected -- instantiate subclasses only).
    TraceWriter() = default;

    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace plantsched::core
