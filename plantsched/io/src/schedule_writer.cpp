#include <plantsched/io/schedule_writer.hpp>

#include <plantsched/core/routing.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <iomanip>
#include <string>
#include <string_view>

namespace plantsched::io {

namespace {

using namespace plantsched::core;

using JsonWriter = rapidjson::Writer<rapidjson::OStreamWrapper>;

void write_string(JsonWriter& writer, std::string_view key, std::string_view value) {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_entry(JsonWriter& writer, const ProductionLogEntry& entry) {
    writer.StartObject();
    write_string(writer, "order_id", entry.order_id);
    write_string(writer, "product_type", entry.product_type);
    write_string(writer, "thickness", entry.thickness);
    write_string(writer, "workflow", to_string(entry.workflow));
    write_string(writer, "unit", entry.unit_label);
    writer.Key("day");
    writer.Uint(entry.day.number);
    write_string(writer, "day_label", entry.day_label);
    writer.Key("start_minute");
    writer.Double(entry.start.count);
    writer.Key("end_minute");
    writer.Double(entry.end.count);
    writer.Key("duration_minutes");
    writer.Double(entry.duration.count);
    writer.Key("operators");
    writer.Uint(entry.operators);
    writer.Key("energy_kwh");
    writer.Double(entry.energy.kwh);
    writer.EndObject();
}

} // anonymous namespace

void write_schedule_json(const ProductionLog& log, const std::vector<Order>& orders,
                         std::ostream& output) {
    rapidjson::OStreamWrapper stream(output);
    JsonWriter writer(stream);
    ScheduleTotals totals = tally_orders(orders);

    writer.StartObject();

    writer.Key("entries");
    writer.StartArray();
    for (const auto& entry : log.entries()) {
        write_entry(writer, entry);
    }
    writer.EndArray();

    writer.Key("summary");
    writer.StartObject();
    writer.Key("submitted");
    writer.Uint64(totals.submitted);
    writer.Key("placed");
    writer.Uint64(totals.placed);
    writer.Key("rejected");
    writer.Uint64(totals.rejected);
    writer.Key("unschedulable");
    writer.Uint64(totals.unschedulable);
    writer.Key("pending");
    writer.Uint64(totals.pending);
    writer.Key("total_energy_kwh");
    writer.Double(log.total_energy().kwh);
    writer.EndObject();

    writer.Key("failures");
    writer.StartArray();
    for (const auto& order : orders) {
        if (order.is_scheduled()) {
            continue;
        }
        writer.StartObject();
        write_string(writer, "order_id", order.id());
        write_string(writer, "status", to_string(order.status()));
        write_string(writer, "reason", order.failure_reason());
        writer.Key("attempts");
        writer.Uint(order.attempts());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    output << "\n";
}

void write_schedule_text(const ProductionLog& log, const std::vector<Order>& orders,
                         std::ostream& output) {
    ScheduleTotals totals = tally_orders(orders);

    output << "Production schedule\n";
    output << std::string(96, '=') << "\n";
    output << std::left << std::setw(12) << "Order" << std::setw(12) << "Product"
           << std::setw(12) << "Unit" << std::setw(8) << "Day" << std::right << std::setw(9)
           << "Start" << std::setw(9) << "End" << std::setw(11) << "Duration" << std::setw(8)
           << "Hours" << std::setw(6) << "Ops" << std::setw(9) << "kWh" << "\n";
    output << std::string(96, '-') << "\n";

    output << std::fixed << std::setprecision(2);
    for (const auto& entry : log.entries()) {
        output << std::left << std::setw(12) << entry.order_id << std::setw(12)
               << entry.product_type << std::setw(12) << entry.unit_label << std::setw(8)
               << entry.day_label << std::right << std::setw(9) << entry.start.count
               << std::setw(9) << entry.end.count << std::setw(11) << entry.duration.count
               << std::setw(8) << entry.duration.count / 60.0 << std::setw(6) << entry.operators
               << std::setw(9) << entry.energy.kwh << "\n";
    }
    if (log.empty()) {
        output << "(no orders placed)\n";
    }
    output << std::string(96, '-') << "\n";

    output << "Orders placed: " << totals.placed << " / " << totals.submitted << "\n";
    output << "Total energy:  " << log.total_energy().kwh << " kWh\n";
    if (totals.pending > 0) {
        output << "Still pending: " << totals.pending << "\n";
    }

    if (totals.placed == totals.submitted) {
        return;
    }
    output << "\nOrders not placed\n";
    for (const auto& order : orders) {
        if (order.is_scheduled()) {
            continue;
        }
        output << "  " << std::left << std::setw(12) << order.id() << std::setw(15)
               << to_string(order.status())
               << (order.is_pending() ? "not reached before the day limit" : order.failure_reason())
               << "\n";
    }
    output << std::right;
}

} // namespace plantsched::io
