#include <citegraph/json_writer.h>

#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

TEST(JsonWriterTest, EscapesControlCharacters) {
  EXPECT_EQ("value\\twith\\ncontrols\\\\ and \\\"quotes\\\"",
            citegraph::EscapeJsonString(
                "value\twith\ncontrols\\ and \"quotes\""));
  EXPECT_EQ("\\u0001", citegraph::EscapeJsonString(std::string(1, '\x01')));
}

TEST(JsonWriterTest, LeavesUtf8Untouched) {
  EXPECT_EQ("section \xC2\xA7 2913.01",
            citegraph::EscapeJsonString("section \xC2\xA7 2913.01"));
}

TEST(JsonWriterTest, WritesNestedStructuresInCallOrder) {
  citegraph::JsonWriter writer;
  writer.BeginObject()
      .Key("id")
      .String("2913.02")
      .Key("count")
      .Number(2)
      .Key("offset")
      .Integer(-1)
      .Key("flag")
      .Bool(true)
      .Key("missing")
      .OptionalString(std::nullopt)
      .Key("targets")
      .StringArray({"2913.01", "2913.03"})
      .Key("details")
      .BeginArray()
      .BeginObject()
      .Key("a")
      .Null()
      .EndObject()
      .BeginObject()
      .EndObject()
      .EndArray()
      .EndObject();

  EXPECT_EQ("{\"id\":\"2913.02\",\"count\":2,\"offset\":-1,\"flag\":true,"
            "\"missing\":null,\"targets\":[\"2913.01\",\"2913.03\"],"
            "\"details\":[{\"a\":null},{}]}",
            writer.str());
}

TEST(JsonWriterTest, EmptyArrayHasNoSeparators) {
  citegraph::JsonWriter writer;
  writer.BeginObject().Key("list").StringArray({}).EndObject();

  EXPECT_EQ("{\"list\":[]}", writer.str());
}

} // namespace
