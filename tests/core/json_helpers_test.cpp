// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

namespace chordmap {
namespace {

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyContainers) {
  JsonWriter object_writer;
  object_writer.beginObject();
  object_writer.endObject();
  EXPECT_EQ(object_writer.toString(), "{}");

  JsonWriter array_writer;
  array_writer.beginArray();
  array_writer.endArray();
  EXPECT_EQ(array_writer.toString(), "[]");
}

TEST(JsonWriterTest, FieldOverloads) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("root", "C");
  writer.field("inversion", 1);
  writer.field("count", static_cast<size_t>(3));
  writer.field("merged", false);
  writer.key("current");
  writer.valueNull();
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"root":"C","inversion":1,"count":3,"merged":false,"current":null})");
}

TEST(JsonWriterTest, StringLiteralIsNotBool) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("maj7");
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["maj7"])");
}

TEST(JsonWriterTest, DoubleValues) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(10.0);
  writer.value(2.5);
  writer.value(-1.0);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[10,2.5,-1]");
}

TEST(JsonWriterTest, NonFiniteBecomesNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::nan(""));
  writer.value(std::numeric_limits<double>::infinity());
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

// ---------------------------------------------------------------------------
// Nesting
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, NestedArraysAndObjects) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("nodes");
  writer.beginArray();
  for (int idx = 0; idx < 2; ++idx) {
    writer.beginObject();
    writer.field("id", idx);
    writer.key("pitch_classes");
    writer.beginArray();
    writer.value(0);
    writer.value(4);
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();
  writer.field("state", "positioned");
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"nodes":[{"id":0,"pitch_classes":[0,4]},{"id":1,"pitch_classes":[0,4]}],)"
            R"("state":"positioned"})");
}

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EscapesSpecialCharacters) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("msg", "say \"hi\"\\\n\t");
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"msg":"say \"hi\"\\\n\t"})");
}

TEST(JsonWriterTest, ControlCharactersUseUnicodeEscape) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::string(1, '\x01'));
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["\u0001"])");
}

TEST(JsonWriterTest, Utf8PassesThrough) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("C\xE2\x99\xAF");
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[\"C\xE2\x99\xAF\"]");
}

// ---------------------------------------------------------------------------
// Pretty printing
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, PrettyPrintIndents) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("a", 1);
  writer.key("b");
  writer.beginArray();
  writer.endArray();
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(), "{\n  \"a\": 1,\n  \"b\": []\n}");
}

TEST(JsonWriterTest, PrettyPrintKeepsPunctuationInsideStrings) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("id", "0,4,7|maj|0");
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(4), "{\n    \"id\": \"0,4,7|maj|0\"\n}");
}

}  // namespace
}  // namespace chordmap
