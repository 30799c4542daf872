#include <plantsched/io/trace_writers.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>

using namespace plantsched::io;
using namespace plantsched::core;

// =============================================================================
// NullTraceWriter
// =============================================================================

TEST(TraceWritersTest, NullWriterAcceptsAllCalls) {
    NullTraceWriter writer;

    writer.begin(Day{1});
    writer.type("order_placed");
    writer.field("operators", uint64_t{2});
    writer.field("energy_kwh", 55.0);
    writer.field("order_id", "P-1");
    writer.end();
}

// =============================================================================
// JsonTraceWriter
// =============================================================================

TEST(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }
    EXPECT_EQ(oss.str(), "[]\n");
}

TEST(TraceWritersTest, JsonWriterRecordsParseBack) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(Day{1});
        writer.type("order_placed");
        writer.field("order_id", "P-1");
        writer.field("operators", uint64_t{2});
        writer.field("energy_kwh", 55.5);
        writer.end();

        writer.begin(Day{8});
        writer.type("order_deferred");
        writer.field("reason", "operators_exhausted");
        writer.end();
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2U);

    const auto& placed = doc[0];
    EXPECT_EQ(placed["day"].GetUint(), 1U);
    EXPECT_STREQ(placed["type"].GetString(), "order_placed");
    EXPECT_STREQ(placed["order_id"].GetString(), "P-1");
    EXPECT_EQ(placed["operators"].GetUint64(), 2U);
    EXPECT_DOUBLE_EQ(placed["energy_kwh"].GetDouble(), 55.5);

    const auto& deferred = doc[1];
    EXPECT_EQ(deferred["day"].GetUint(), 8U);
    EXPECT_STREQ(deferred["reason"].GetString(), "operators_exhausted");
}

TEST(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    JsonTraceWriter writer(oss);
    writer.begin(Day{1});
    writer.type("day_open");
    writer.end();

    writer.finalize();
    std::string first = oss.str();
    writer.finalize();
    EXPECT_EQ(oss.str(), first);

    // Records after finalize are dropped
    writer.begin(Day{2});
    writer.type("day_open");
    writer.end();
    EXPECT_EQ(oss.str(), first);
}

TEST(TraceWritersTest, JsonWriterClosesOpenRecordOnFinalize) {
    std::ostringstream oss;
    JsonTraceWriter writer(oss);
    writer.begin(Day{3});
    writer.type("order_attempt");
    writer.finalize();

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_EQ(doc.Size(), 1U);
    EXPECT_STREQ(doc[0]["type"].GetString(), "order_attempt");
}

TEST(TraceWritersTest, JsonWriterWritesInfinity) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(Day{1});
        writer.type("order_attempt");
        writer.field("etc_minutes", std::numeric_limits<double>::infinity());
        writer.end();
    }
    EXPECT_NE(oss.str().find("Infinity"), std::string::npos);
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

TEST(TraceWritersTest, MemoryWriterStoresRecords) {
    MemoryTraceWriter writer;

    writer.begin(Day{1});
    writer.type("order_placed");
    writer.field("order_id", "P-1");
    writer.field("operators", uint64_t{5});
    writer.field("energy_kwh", 38.8);
    writer.end();

    writer.begin(Day{2});
    writer.type("order_deferred");
    writer.field("order_id", "P-2");
    writer.end();

    ASSERT_EQ(writer.records().size(), 2U);
    const auto& record = writer.records()[0];
    EXPECT_EQ(record.day, 1U);
    EXPECT_EQ(record.type, "order_placed");
    EXPECT_EQ(record.text("order_id"), "P-1");
    EXPECT_EQ(record.number("operators"), 5.0);
    EXPECT_EQ(record.number("energy_kwh"), 38.8);

    EXPECT_FALSE(record.text("operators").has_value());
    EXPECT_FALSE(record.number("order_id").has_value());
    EXPECT_FALSE(record.text("missing").has_value());
}

TEST(TraceWritersTest, MemoryWriterFiltersByType) {
    MemoryTraceWriter writer;
    for (uint32_t day = 1; day <= 3; ++day) {
        writer.begin(Day{day});
        writer.type("day_open");
        writer.end();
        writer.begin(Day{day});
        writer.type("day_exhausted");
        writer.end();
    }

    auto opens = writer.records_of("day_open");
    ASSERT_EQ(opens.size(), 3U);
    EXPECT_EQ(opens[2].day, 3U);
    EXPECT_TRUE(writer.records_of("order_placed").empty());

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TEST(TraceWritersTest, TextualWriterLineFormat) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    writer.begin(Day{8});
    writer.type("order_placed");
    writer.field("order_id", "P-1");
    writer.field("operators", uint64_t{2});
    writer.field("energy_kwh", 55.5);
    writer.end();

    std::string expected = "[Day   8] " + std::string(10, ' ') +
                           "order_placed: order_id = P-1, operators = 2, energy_kwh = 55.5\n";
    EXPECT_EQ(oss.str(), expected);
}

TEST(TraceWritersTest, TextualWriterWithoutFields) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, false);

    writer.begin(Day{12});
    writer.type("day_exhausted");
    writer.end();

    EXPECT_EQ(oss.str(), "[Day  12] " + std::string(9, ' ') + "day_exhausted:\n");
}

TEST(TraceWritersTest, TextualWriterColour) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss, true);

    writer.begin(Day{1});
    writer.type("order_unschedulable");
    writer.end();
    writer.begin(Day{1});
    writer.type("order_attempt");
    writer.end();

    std::string output = oss.str();
    auto newline = output.find('\n');
    ASSERT_NE(newline, std::string::npos);
    std::string first = output.substr(0, newline);
    std::string second = output.substr(newline + 1);

    EXPECT_NE(first.find("\033[31m"), std::string::npos);
    EXPECT_NE(first.find("\033[0m"), std::string::npos);
    EXPECT_EQ(second.find('\033'), std::string::npos);
}
