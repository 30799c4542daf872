#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for dispatch decisions.
///
/// Writers implementing @ref core::TraceWriter: a no-op writer, a JSON
/// streaming writer, an in-memory buffer for tests and post-processing, and
/// a one-line-per-event console writer with optional ANSI colour.
///
/// @ingroup io_writers

#include <plantsched/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace plantsched::io {

/// @brief Trace writer that discards all events.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams a JSON array of event objects.
///
/// Each record becomes `{"day": N, "type": "...", <fields>}`. Call
/// @ref finalize to close the array once the run is over; the destructor
/// does it if needed. Non-finite numbers are written as `Infinity`/`NaN`.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array and flush the stream.
    ///
    /// Idempotent. Records begun after this call are ignored.
    void finalize();

private:
    using Writer = rapidjson::Writer<rapidjson::OStreamWrapper, rapidjson::UTF8<>,
                                     rapidjson::UTF8<>, rapidjson::CrtAllocator,
                                     rapidjson::kWriteNanAndInfFlag>;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    Writer writer_;
    bool in_record_{false};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    uint32_t day{0};    ///< Calendar day of the event.
    std::string type;   ///< Event type identifier (e.g. "order_placed").
    /// @brief Named fields attached to the event.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief String value of a field, if present and a string.
    [[nodiscard]] std::optional<std::string> text(const std::string& key) const;

    /// @brief Numeric value of a field (integer fields are widened).
    [[nodiscard]] std::optional<double> number(const std::string& key) const;
};

/// @brief Trace writer that buffers every event as a @ref TraceRecord.
///
/// Meant for unit tests and programmatic inspection of a run.
///
/// @ingroup io_writers
/// @see TraceRecord, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated trace records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of one event type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable console trace writer.
///
/// One line per event:
/// `[Day   8]         order_deferred: order_id = P-002, reason = operators_exhausted`
///
/// Colour highlights placements (green), deferrals (yellow) and terminal
/// failures (red). Disable it when writing to a file.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for colour.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] std::string_view color_of(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    uint32_t current_day_{0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace plantsched::io
