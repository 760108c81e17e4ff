#pragma once
#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>

#include <charconv>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "redisconnconverters.hpp"
#include "redisconnerrors.hpp"

namespace RedisConn {

  /**
   * @class JsonHashMapper
   *
   * @brief Map a JSON document to a flat Redis hash and back
   *
   * @details Nested objects are flattened to dotted field names and array elements are addressed by
   * index, so
   * ```json
   * {"name": "ada", "address": {"city": "London"}, "tags": ["x", "y"]}
   * ```
   * becomes the fields `name`, `address.city`, `tags.[0]` and `tags.[1]`. Every leaf is stored as its JSON
   * text (`"ada"` with quotes, `42`, `true`, `null`), which keeps the value's type across the round trip.
   * Empty objects and arrays are stored as `{}` and `[]`. Member names must not contain `.` themselves.
   *
   */
  class JsonHashMapper {
   public:
    JsonHashMapper() {
      writerBuilder["indentation"] = "";
      writerBuilder["emitUTF8"] = true;
      readerBuilder["failIfExtra"] = true;
    }

    /**
     * @brief Flatten a JSON object into field/value pairs
     *
     */
    [[nodiscard]] KeyValues toHash(const Json::Value &document) const {
      if (!document.isObject()) throw std::invalid_argument("Only JSON objects can be mapped to a hash");
      KeyValues hash;
      for (const auto &name : document.getMemberNames()) {
        flatten(name, document[name], hash);
      }
      return hash;
    }

    /**
     * @brief Rebuild the JSON object from field/value pairs produced by `toHash()`
     *
     */
    [[nodiscard]] Json::Value fromHash(const KeyValues &hash) const {
      Json::Value root(Json::objectValue);
      for (const auto &[field, value] : hash) {
        if (field.empty()) throw SerializationError("empty hash field name");
        Json::Value *node = &root;
        std::string_view path(field);
        while (!path.empty()) {
          auto dot = path.find('.');
          auto token = path.substr(0, dot);
          path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
          node = &child(*node, token, field, hash.size());
        }
        *node = parse(value, field);
      }
      return root;
    }

   private:
    Json::StreamWriterBuilder writerBuilder;
    Json::CharReaderBuilder readerBuilder;

    void flatten(const std::string &path, const Json::Value &value, KeyValues &hash) const {
      if (value.isObject() && !value.empty()) {
        for (const auto &name : value.getMemberNames()) {
          flatten(std::format("{}.{}", path, name), value[name], hash);
        }
      } else if (value.isArray() && !value.empty()) {
        for (Json::ArrayIndex i{0}; i < value.size(); i++) {
          flatten(std::format("{}.[{}]", path, i), value[i], hash);
        }
      } else {
        hash.emplace_back(path, Json::writeString(writerBuilder, value));
      }
    }

    // an array cannot have more elements than the hash has fields, which bounds any index
    static Json::Value &child(Json::Value &node, std::string_view token, const std::string &field,
                              std::size_t fieldCount) {
      if (token.size() >= 3 && token.front() == '[' && token.back() == ']') {
        Json::ArrayIndex index{0};
        auto digits = token.substr(1, token.size() - 2);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
          throw SerializationError(std::format("invalid array index in hash field '{}'", field));
        }
        if (index >= fieldCount) {
          throw SerializationError(std::format("array index {} out of range in hash field '{}'", index, field));
        }
        if (!node.isNull() && !node.isArray()) {
          throw SerializationError(std::format("hash field '{}' conflicts with an earlier field", field));
        }
        return node[index];
      }
      if (token.empty()) throw SerializationError(std::format("empty path segment in hash field '{}'", field));
      if (!node.isNull() && !node.isObject()) {
        throw SerializationError(std::format("hash field '{}' conflicts with an earlier field", field));
      }
      return node[std::string(token)];
    }

    Json::Value parse(const std::string &text, const std::string &field) const {
      Json::Value value;
      std::string errs;
      std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());
      if (!reader->parse(text.data(), text.data() + text.size(), &value, &errs)) {
        throw SerializationError(std::format("hash field '{}' does not hold JSON: {}", field, errs));
      }
      return value;
    }
  };
};  // namespace RedisConn
