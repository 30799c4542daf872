#include <plantsched/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace plantsched::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::Day /*day*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    if (!finalized_) {
        finalize();
    }
}

void JsonTraceWriter::begin(core::Day day) {
    if (finalized_) {
        return;
    }
    in_record_ = true;
    writer_.StartObject();
    writer_.Key("day");
    writer_.Uint(day.number);
}

void JsonTraceWriter::type(std::string_view name) {
    if (!in_record_) {
        return;
    }
    writer_.Key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view key, double value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    if (!in_record_) {
        return;
    }
    writer_.EndObject();
    in_record_ = false;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (in_record_) {
        end();
    }
    writer_.EndArray();
    output_ << "\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TraceRecord / MemoryTraceWriter
// =============================================================================

std::optional<std::string> TraceRecord::text(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end() || !std::holds_alternative<std::string>(iter->second)) {
        return std::nullopt;
    }
    return std::get<std::string>(iter->second);
}

std::optional<double> TraceRecord::number(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<double>(&iter->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<uint64_t>(&iter->second)) {
        return static_cast<double>(*value);
    }
    return std::nullopt;
}

void MemoryTraceWriter::begin(core::Day day) {
    current_ = TraceRecord{};
    current_.day = day.number;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> result;
    for (const auto& record : records_) {
        if (record.type == type) {
            result.push_back(record);
        }
    }
    return result;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kGreen = "\033[32m";
constexpr std::string_view kYellow = "\033[33m";
constexpr std::string_view kRed = "\033[31m";
constexpr std::string_view kBold = "\033[1m";

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::Day day) {
    current_day_ = day.number;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

std::string_view TextualTraceWriter::color_of(std::string_view type) const noexcept {
    if (type == "order_placed") {
        return kGreen;
    }
    if (type == "order_deferred" || type == "order_skipped" || type == "day_exhausted") {
        return kYellow;
    }
    if (type == "order_unschedulable" || type == "order_rejected") {
        return kRed;
    }
    if (type == "day_open" || type == "run_complete") {
        return kBold;
    }
    return {};
}

void TextualTraceWriter::end() {
    // Format: [Day   N]             event_name: key = value, key = value
    output_ << "[Day " << std::setw(3) << current_day_ << "] ";

    std::string_view color = color_enabled_ ? color_of(current_type_) : std::string_view{};
    output_ << color << std::setw(22) << std::right << current_type_;
    if (!color.empty()) {
        output_ << kReset;
    }
    output_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
}

} // namespace plantsched::io
