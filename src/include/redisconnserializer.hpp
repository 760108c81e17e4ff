#pragma once
#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>

#include <charconv>
#include <concepts>
#include <format>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "redisconnerrors.hpp"

namespace RedisConn {

  /**
   * @class RedisSerializer
   *
   * @brief Conversion between a value and the byte string stored in Redis
   *
   */
  template <typename T>
  class RedisSerializer {
   public:
    virtual ~RedisSerializer() = default;

    virtual std::string serialize(const T &value) const = 0;
    virtual T deserialize(std::string_view bytes) const = 0;
  };

  /**
   * @brief The identity serializer for byte strings
   *
   */
  class StringRedisSerializer : public RedisSerializer<std::string> {
   public:
    std::string serialize(const std::string &value) const override { return value; }
    std::string deserialize(std::string_view bytes) const override { return std::string(bytes); }
  };

  /**
   * @brief Serialize arithmetic values as their decimal text
   *
   * @details `deserialize()` requires the whole input to be consumed; anything else, including an
   * out-of-range value, throws `SerializationError`.
   *
   */
  template <typename T>
    requires std::is_arithmetic_v<T> && (!std::same_as<T, bool>)
  class GenericToStringSerializer : public RedisSerializer<T> {
   public:
    std::string serialize(const T &value) const override {
      char buf[64];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
      if (ec != std::errc{}) throw SerializationError("cannot serialize value");
      return std::string(buf, ptr);
    }

    T deserialize(std::string_view bytes) const override {
      T value{};
      auto [ptr, ec] = std::from_chars(bytes.data(), bytes.data() + bytes.size(), value);
      if (bytes.empty() || ec != std::errc{} || ptr != bytes.data() + bytes.size()) {
        throw SerializationError(std::format("cannot deserialize '{}'", bytes));
      }
      return value;
    }
  };

  /**
   * @brief Serialize JSON documents with jsoncpp
   *
   * @details Documents are written compactly (no indentation) and read back with a strict reader that
   * rejects comments and trailing garbage.
   *
   */
  class JsonRedisSerializer : public RedisSerializer<Json::Value> {
   public:
    JsonRedisSerializer() {
      writerBuilder["indentation"] = "";
      writerBuilder["emitUTF8"] = true;
      readerBuilder["allowComments"] = false;
      readerBuilder["collectComments"] = false;
      readerBuilder["failIfExtra"] = true;
    }

    std::string serialize(const Json::Value &value) const override { return Json::writeString(writerBuilder, value); }

    Json::Value deserialize(std::string_view bytes) const override {
      Json::Value root;
      std::string errs;
      std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());
      if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &root, &errs)) {
        throw SerializationError(std::format("cannot parse JSON: {}", errs));
      }
      return root;
    }

   private:
    Json::StreamWriterBuilder writerBuilder;
    Json::CharReaderBuilder readerBuilder;
  };
};  // namespace RedisConn
