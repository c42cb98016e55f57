// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

namespace scl {
namespace {

// ---------------------------------------------------------------------------
// Simple values
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyObject) {
  JsonWriter writer;
  writer.beginObject();
  writer.endObject();
  EXPECT_EQ(writer.toString(), "{}");
}

TEST(JsonWriterTest, EmptyArray) {
  JsonWriter writer;
  writer.beginArray();
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[]");
}

TEST(JsonWriterTest, IntAndStringValues) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("degree");
  writer.value(3);
  writer.key("text");
  writer.value("5/4");
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"degree":3,"text":"5/4"})");
}

TEST(JsonWriterTest, Int64Value) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(static_cast<int64_t>(9007199254740993LL));
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[9007199254740993]");
}

TEST(JsonWriterTest, BooleanAndNullValues) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("valid");
  writer.value(true);
  writer.key("strict");
  writer.value(false);
  writer.key("name");
  writer.valueNull();
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"valid":true,"strict":false,"name":null})");
}

// ---------------------------------------------------------------------------
// Doubles
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, WholeDoubleHasNoFraction) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(550.0);
  writer.value(687.5);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[550,687.5]");
}

TEST(JsonWriterTest, DoubleRoundTripsExactly) {
  const double freq = 459.7589598668908;
  JsonWriter writer;
  writer.beginArray();
  writer.value(freq);
  writer.endArray();

  std::string json = writer.toString();
  ASSERT_GE(json.size(), 2u);
  double parsed = std::stod(json.substr(1, json.size() - 2));
  EXPECT_EQ(parsed, freq);
}

TEST(JsonWriterTest, NanAndInfBecomeNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::numeric_limits<double>::quiet_NaN());
  writer.value(std::numeric_limits<double>::infinity());
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

// ---------------------------------------------------------------------------
// Nesting
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, ArrayOfObjects) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("pitches");
  writer.beginArray();

  writer.beginObject();
  writer.key("text");
  writer.value("9/8");
  writer.endObject();

  writer.beginObject();
  writer.key("text");
  writer.value("386.313714");
  writer.endObject();

  writer.endArray();
  writer.key("pitch_count");
  writer.value(2);
  writer.endObject();

  EXPECT_EQ(writer.toString(),
            R"({"pitches":[{"text":"9/8"},{"text":"386.313714"}],"pitch_count":2})");
}

// ---------------------------------------------------------------------------
// String escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EscapeQuotesAndBackslash) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("description");
  writer.value(std::string_view("Aaron's \"meantone\" a\\b"));
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"description":"Aaron's \"meantone\" a\\b"})");
}

TEST(JsonWriterTest, EscapeControlCharacters) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::string_view("a\nb\tc\x01"));
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["a\nb\tc\u0001"])");
}

// ---------------------------------------------------------------------------
// Pretty-print
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, PrettyPrintNested) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("freqs");
  writer.beginArray();
  writer.value(440.0);
  writer.value(880.0);
  writer.endArray();
  writer.endObject();

  EXPECT_EQ(writer.toPrettyString(2),
            "{\n"
            "  \"freqs\": [\n"
            "    440,\n"
            "    880\n"
            "  ]\n"
            "}");
}

TEST(JsonWriterTest, PrettyPrintKeepsEmptyContainersCompact) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("pitches");
  writer.beginArray();
  writer.endArray();
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(), "{\n  \"pitches\": []\n}");
}

TEST(JsonWriterTest, PrettyPrintLeavesStringContentsAlone) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("description");
  writer.value("a, b: {c} \"d\"");
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(), "{\n  \"description\": \"a, b: {c} \\\"d\\\"\"\n}");
}

}  // namespace
}  // namespace scl
