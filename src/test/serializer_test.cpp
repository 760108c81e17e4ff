#include <gtest/gtest.h>

#include <json/value.h>

#include <limits>
#include <string>

#include "redisconnhashmapper.hpp"
#include "redisconnserializer.hpp"

using namespace RedisConn;

TEST(SerializerTest, StringSerializerIsIdentity) {
  StringRedisSerializer serializer;
  EXPECT_EQ(serializer.serialize("value"), "value");
  EXPECT_EQ(serializer.deserialize(std::string_view("a\0b", 3)), std::string("a\0b", 3));
}

TEST(SerializerTest, NumbersAsDecimalText) {
  GenericToStringSerializer<long long> longs;
  EXPECT_EQ(longs.serialize(-42), "-42");
  EXPECT_EQ(longs.deserialize("9000"), 9000);
  EXPECT_EQ(longs.serialize(std::numeric_limits<long long>::max()), "9223372036854775807");

  GenericToStringSerializer<double> doubles;
  EXPECT_EQ(doubles.serialize(2.5), "2.5");
  EXPECT_DOUBLE_EQ(doubles.deserialize("0.125"), 0.125);
}

TEST(SerializerTest, NumbersRejectGarbage) {
  GenericToStringSerializer<int> ints;
  EXPECT_THROW(ints.deserialize(""), SerializationError);
  EXPECT_THROW(ints.deserialize("12abc"), SerializationError);
  EXPECT_THROW(ints.deserialize(" 12"), SerializationError);
  EXPECT_THROW(ints.deserialize("99999999999"), SerializationError);
}

TEST(SerializerTest, JsonIsCompact) {
  JsonRedisSerializer serializer;
  Json::Value doc;
  doc["name"] = "ada";
  doc["age"] = 36;
  EXPECT_EQ(serializer.serialize(doc), R"({"age":36,"name":"ada"})");

  auto parsed = serializer.deserialize(R"({"age": 36, "name": "ada"})");
  EXPECT_EQ(parsed, doc);
}

TEST(SerializerTest, JsonRejectsInvalidInput) {
  JsonRedisSerializer serializer;
  EXPECT_THROW(serializer.deserialize("{\"a\":"), SerializationError);
  EXPECT_THROW(serializer.deserialize("{} trailing"), SerializationError);
  EXPECT_THROW(serializer.deserialize(""), SerializationError);
}

class JsonHashMapperTest : public ::testing::Test {
 protected:
  JsonHashMapper mapper;
  JsonRedisSerializer json;
};

TEST_F(JsonHashMapperTest, FlattensNestedDocument) {
  auto doc = json.deserialize(R"({"name":"ada","age":36,"address":{"city":"London","zip":null},"tags":["x","y"]})");
  auto hash = mapper.toHash(doc);
  EXPECT_EQ(hash, (KeyValues{{"address.city", "\"London\""},
                             {"address.zip", "null"},
                             {"age", "36"},
                             {"name", "\"ada\""},
                             {"tags.[0]", "\"x\""},
                             {"tags.[1]", "\"y\""}}));
}

TEST_F(JsonHashMapperTest, RoundTripKeepsTypes) {
  auto doc = json.deserialize(
      R"({"active":true,"score":1.5,"empty":{},"none":[],"items":[{"id":1},{"id":2}],"label":"42"})");
  auto restored = mapper.fromHash(mapper.toHash(doc));
  EXPECT_EQ(restored, doc);
  EXPECT_TRUE(restored["label"].isString());
  EXPECT_TRUE(restored["items"].isArray());
  EXPECT_EQ(restored["items"][1]["id"].asInt(), 2);
}

TEST_F(JsonHashMapperTest, OnlyObjectsMapToHashes) {
  EXPECT_THROW(mapper.toHash(Json::Value(Json::arrayValue)), std::invalid_argument);
  EXPECT_THROW(mapper.toHash(Json::Value("text")), std::invalid_argument);
  EXPECT_TRUE(mapper.toHash(Json::Value(Json::objectValue)).empty());
}

TEST_F(JsonHashMapperTest, RejectsMalformedHashes) {
  EXPECT_THROW(mapper.fromHash({{"a", "1"}, {"a.b", "2"}}), SerializationError);
  EXPECT_THROW(mapper.fromHash({{"a.[x]", "1"}}), SerializationError);
  EXPECT_THROW(mapper.fromHash({{"a..b", "1"}}), SerializationError);
  EXPECT_THROW(mapper.fromHash({{"", "1"}}), SerializationError);
  EXPECT_THROW(mapper.fromHash({{"name", "ada"}}), SerializationError);
}

TEST_F(JsonHashMapperTest, ArrayIndexIsBoundedByFieldCount) {
  EXPECT_THROW(mapper.fromHash({{"a.[4000000000]", "1"}}), SerializationError);
  EXPECT_THROW(mapper.fromHash({{"a.[2]", "1"}, {"b", "2"}}), SerializationError);

  auto document = mapper.fromHash({{"a.[1]", "\"y\""}, {"a.[0]", "\"x\""}});
  ASSERT_TRUE(document["a"].isArray());
  ASSERT_EQ(document["a"].size(), 2u);
  EXPECT_EQ(document["a"][0].asString(), "x");
  EXPECT_EQ(document["a"][1].asString(), "y");
}
