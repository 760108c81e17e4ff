#pragma once
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "redisconnerrors.hpp"
#include "redisconnreply.hpp"
#include "redisconnstream.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {
  using KeyValue = std::pair<std::string, std::string>;
  using KeyValues = std::vector<KeyValue>;
  using Properties = std::vector<KeyValue>;

  /**
   * @brief Mapping from driver-independent replies to the typed results of the command interfaces
   *
   * @details Every converter accepts both the RESP2 and the RESP3 shape of a reply: a `MAP` is read like
   * the flattened `ARRAY` a RESP2 server sends, a `SET` like an `ARRAY`, a `DOUBLE` like the bulk string
   * holding the same number. A reply of an unexpected type throws `RedisError`.
   *
   */
  namespace Converters {

    inline void requireAggregate(const Reply &reply, std::string_view what) {
      if (!reply.isAggregate()) {
        throw RedisError(std::format("expected an aggregate reply for {}, got type {}", what,
                                     static_cast<int>(reply.type)));
      }
    }

    inline long long parseLong(std::string_view s) {
      long long result{0};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
      if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw RedisError(std::format("cannot convert '{}' to an integer", s));
      }
      return result;
    }

    inline double parseDouble(std::string_view s) {
      if (s == "inf" || s == "+inf") return std::numeric_limits<double>::infinity();
      if (s == "-inf") return -std::numeric_limits<double>::infinity();
      double result{0.0};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
      if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw RedisError(std::format("cannot convert '{}' to a double", s));
      }
      return result;
    }

    inline long long toLong(const Reply &reply) {
      switch (reply.type) {
        case ReplyType::INTEGER:
        case ReplyType::BOOL:
          return reply.integer;
        case ReplyType::NIL:
          return 0;
        case ReplyType::DOUBLE:
          return static_cast<long long>(reply.dval);
        case ReplyType::STRING:
        case ReplyType::STATUS:
        case ReplyType::BIGNUM:
          return parseLong(reply.str);
        default:
          throw RedisError(std::format("cannot convert reply of type {} to an integer", static_cast<int>(reply.type)));
      }
    }

    inline std::optional<long long> toOptionalLong(const Reply &reply) {
      if (reply.isNil()) return std::nullopt;
      return toLong(reply);
    }

    /**
     * @brief Integer `1`, RESP3 `true` and status `OK` are true; nil and integer `0` are false
     *
     */
    inline bool toBoolean(const Reply &reply) {
      switch (reply.type) {
        case ReplyType::INTEGER:
        case ReplyType::BOOL:
          return reply.integer != 0;
        case ReplyType::STATUS:
          return reply.str == "OK";
        case ReplyType::NIL:
          return false;
        case ReplyType::STRING:
          return reply.str == "1" || reply.str == "OK";
        default:
          throw RedisError(std::format("cannot convert reply of type {} to a boolean", static_cast<int>(reply.type)));
      }
    }

    inline std::optional<double> toOptionalDouble(const Reply &reply) {
      if (reply.isNil()) return std::nullopt;
      if (reply.type == ReplyType::DOUBLE) return reply.dval;
      if (reply.type == ReplyType::INTEGER) return static_cast<double>(reply.integer);
      return parseDouble(reply.str);
    }

    inline double toDouble(const Reply &reply) { return toOptionalDouble(reply).value_or(0.0); }

    inline std::optional<std::string> toOptionalString(const Reply &reply) {
      if (reply.isNil()) return std::nullopt;
      if (reply.isInteger()) return std::to_string(reply.integer);
      return reply.str;
    }

    inline std::string toString(const Reply &reply) { return toOptionalString(reply).value_or(""); }

    inline void toVoid(const Reply &) {}

    inline std::vector<std::string> toStringList(const Reply &reply) {
      std::vector<std::string> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of strings");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toString(e));
      return out;
    }

    inline std::vector<std::optional<std::string>> toOptionalStringList(const Reply &reply) {
      std::vector<std::optional<std::string>> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of values");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toOptionalString(e));
      return out;
    }

    inline std::vector<long long> toLongList(const Reply &reply) {
      std::vector<long long> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of integers");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toLong(e));
      return out;
    }

    inline std::vector<bool> toBooleanList(const Reply &reply) {
      std::vector<bool> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of booleans");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toBoolean(e));
      return out;
    }

    inline std::vector<std::optional<double>> toOptionalDoubleList(const Reply &reply) {
      std::vector<std::optional<double>> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of scores");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toOptionalDouble(e));
      return out;
    }

    /**
     * @brief Field/value pairs from a flattened `ARRAY` (RESP2) or a `MAP` (RESP3)
     *
     */
    inline KeyValues toKeyValues(const Reply &reply) {
      KeyValues out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a field/value list");
      out.reserve(reply.elements.size() / 2);
      for (auto i{0u}; i + 1 < reply.elements.size(); i += 2) {
        out.emplace_back(toString(reply.elements[i]), toString(reply.elements[i + 1]));
      }
      return out;
    }

    /**
     * @brief Sorted set members with scores
     *
     * @details RESP2 answers `WITHSCORES` with a flat `member, score, member, score` array; RESP3 answers
     * with an array of two-element arrays.
     *
     */
    inline std::vector<Tuple> toTuples(const Reply &reply) {
      std::vector<Tuple> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of scored members");
      if (!reply.elements.empty() && reply.elements.front().isAggregate()) {
        out.reserve(reply.elements.size());
        for (const auto &pair : reply.elements) {
          if (pair.elements.size() < 2) throw RedisError("malformed scored member");
          out.push_back(Tuple{toString(pair.elements[0]), toDouble(pair.elements[1])});
        }
        return out;
      }
      out.reserve(reply.elements.size() / 2);
      for (auto i{0u}; i + 1 < reply.elements.size(); i += 2) {
        out.push_back(Tuple{toString(reply.elements[i]), toDouble(reply.elements[i + 1])});
      }
      return out;
    }

    inline DataType toDataType(const Reply &reply) {
      auto code = toString(reply);
      auto type = findDataType(code);
      if (!type) throw RedisError(std::format("unsupported data type '{}'", code));
      return *type;
    }

    inline uint64_t parseCursor(const Reply &reply) {
      if (reply.isInteger()) return static_cast<uint64_t>(reply.integer);
      uint64_t cursor{0};
      const auto *end = reply.str.data() + reply.str.size();
      auto [ptr, ec] = std::from_chars(reply.str.data(), end, cursor);
      if (ec != std::errc{} || ptr != end) throw RedisError(std::format("invalid scan cursor '{}'", reply.str));
      return cursor;
    }

    inline ScanCursor<std::string> toScanCursor(const Reply &reply) {
      requireAggregate(reply, "SCAN");
      if (reply.elements.size() != 2) throw RedisError("malformed SCAN reply");
      return ScanCursor<std::string>{parseCursor(reply.elements[0]), toStringList(reply.elements[1])};
    }

    inline ScanCursor<KeyValue> toKeyValueScanCursor(const Reply &reply) {
      requireAggregate(reply, "HSCAN");
      if (reply.elements.size() != 2) throw RedisError("malformed HSCAN reply");
      return ScanCursor<KeyValue>{parseCursor(reply.elements[0]), toKeyValues(reply.elements[1])};
    }

    /**
     * @brief `TIME` as milliseconds since the epoch
     *
     */
    inline std::chrono::milliseconds toTime(const Reply &reply) {
      requireAggregate(reply, "TIME");
      if (reply.elements.size() != 2) throw RedisError("malformed TIME reply");
      auto seconds = toLong(reply.elements[0]);
      auto micros = toLong(reply.elements[1]);
      return std::chrono::milliseconds{seconds * 1000 + micros / 1000};
    }

    /**
     * @brief Parse the `key:value` lines of an `INFO` reply, skipping `#` section headers
     *
     */
    inline Properties toProperties(std::string_view text) {
      Properties out;
      while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty() || line.front() == '#') continue;
        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        out.emplace_back(std::string(line.substr(0, colon)), std::string(line.substr(colon + 1)));
      }
      return out;
    }

    inline Properties toInfo(const Reply &reply) { return toProperties(toString(reply)); }

    /**
     * @brief Parse `CLIENT LIST`: one line per client of space-separated `name=value` pairs
     *
     */
    inline std::vector<Properties> toClientList(const Reply &reply) {
      std::vector<Properties> out;
      std::string_view text(reply.str);
      while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) continue;

        Properties client;
        while (!line.empty()) {
          auto sp = line.find(' ');
          auto token = line.substr(0, sp);
          line = sp == std::string_view::npos ? std::string_view{} : line.substr(sp + 1);
          auto eq = token.find('=');
          if (eq == std::string_view::npos) continue;
          client.emplace_back(std::string(token.substr(0, eq)), std::string(token.substr(eq + 1)));
        }
        out.push_back(std::move(client));
      }
      return out;
    }

    /**
     * @name Geospatial replies
     *
     */
    ///@{
    inline Point toPoint(const Reply &reply) {
      requireAggregate(reply, "a coordinate pair");
      if (reply.elements.size() != 2) throw RedisError("malformed coordinate pair");
      return Point{toDouble(reply.elements[0]), toDouble(reply.elements[1])};
    }

    // GEOPOS answers nil for members that are not in the index
    inline std::vector<std::optional<Point>> toOptionalPoints(const Reply &reply) {
      std::vector<std::optional<Point>> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "GEOPOS");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) {
        if (e.isNil()) {
          out.emplace_back(std::nullopt);
        } else {
          out.emplace_back(toPoint(e));
        }
      }
      return out;
    }

    inline std::optional<Distance> toOptionalDistance(GeoUnit unit, const Reply &reply) {
      auto value = toOptionalDouble(reply);
      if (!value) return std::nullopt;
      return Distance{*value, unit};
    }

    /**
     * @brief `GEOSEARCH` matches; each is a bare name unless distance or coordinates were requested, in
     * which case it is `[name, distance?, [longitude, latitude]?]`
     *
     */
    inline std::vector<GeoResult> toGeoResults(const GeoSearchArgs &args, const Reply &reply) {
      std::vector<GeoResult> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "GEOSEARCH");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) {
        GeoResult result;
        if (!e.isAggregate()) {
          result.name = toString(e);
          out.push_back(std::move(result));
          continue;
        }
        std::size_t expected = 1 + (args.hasDistance() ? 1 : 0) + (args.hasCoordinates() ? 1 : 0);
        if (e.elements.size() != expected) throw RedisError("malformed GEOSEARCH entry");
        std::size_t i{0};
        result.name = toString(e.elements[i++]);
        if (args.hasDistance()) result.distance = Distance{toDouble(e.elements[i++]), args.unit()};
        if (args.hasCoordinates()) result.point = toPoint(e.elements[i++]);
        out.push_back(std::move(result));
      }
      return out;
    }
    ///@}

    inline RecordId toRecordId(const Reply &reply) { return RecordId::of(toString(reply)); }

    inline std::vector<RecordId> toRecordIds(const Reply &reply) {
      std::vector<RecordId> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "a list of record ids");
      out.reserve(reply.elements.size());
      for (const auto &e : reply.elements) out.push_back(toRecordId(e));
      return out;
    }

    /**
     * @brief The entries of one stream: `[[id, [field, value, ...]], ...]`
     *
     * @details Entries whose body is nil (deleted while pending, as reported by `XCLAIM` and
     * `XREADGROUP`) are skipped.
     *
     */
    inline std::vector<ByteRecord> toRecords(std::string_view stream, const Reply &reply) {
      std::vector<ByteRecord> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "stream entries");
      out.reserve(reply.elements.size());
      for (const auto &entry : reply.elements) {
        if (entry.isNil() || entry.elements.size() < 2 || entry.elements[1].isNil()) continue;
        out.emplace_back(std::string(stream), toRecordId(entry.elements[0]), toKeyValues(entry.elements[1]));
      }
      return out;
    }

    /**
     * @brief The reply of `XREAD`/`XREADGROUP`
     *
     * @details RESP2 sends `[[stream, entries], ...]`, RESP3 sends a map `{stream: entries}`. A nil reply
     * (a blocking read that timed out) gives no records.
     *
     */
    inline std::vector<ByteRecord> toStreamReadRecords(const Reply &reply) {
      std::vector<ByteRecord> out;
      if (reply.isNil()) return out;
      requireAggregate(reply, "XREAD");

      auto append = [&out](const Reply &key, const Reply &entries) {
        auto records = toRecords(toString(key), entries);
        out.insert(out.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
      };

      if (reply.type == ReplyType::MAP) {
        for (auto i{0u}; i + 1 < reply.elements.size(); i += 2) append(reply.elements[i], reply.elements[i + 1]);
      } else {
        for (const auto &stream : reply.elements) {
          if (stream.elements.size() < 2) throw RedisError("malformed XREAD reply");
          append(stream.elements[0], stream.elements[1]);
        }
      }
      return out;
    }

    /**
     * @brief The short form of `XPENDING`: `[count, lowest, highest, [[consumer, count], ...]]`
     *
     */
    inline PendingMessagesSummary toPendingMessagesSummary(std::string_view group, const Reply &reply) {
      requireAggregate(reply, "XPENDING");
      if (reply.elements.size() < 4) throw RedisError("malformed XPENDING reply");

      PendingMessagesSummary summary;
      summary.groupName = std::string(group);
      summary.totalPendingMessages = toLong(reply.elements[0]);
      summary.lowestId = toOptionalString(reply.elements[1]);
      summary.highestId = toOptionalString(reply.elements[2]);
      const auto &consumers = reply.elements[3];
      if (consumers.type == ReplyType::MAP) {
        for (auto i{0u}; i + 1 < consumers.elements.size(); i += 2) {
          summary.pendingMessagesPerConsumer.emplace_back(toString(consumers.elements[i]),
                                                          toLong(consumers.elements[i + 1]));
        }
      } else {
        for (const auto &c : consumers.elements) {
          if (c.elements.size() < 2) continue;
          summary.pendingMessagesPerConsumer.emplace_back(toString(c.elements[0]), toLong(c.elements[1]));
        }
      }
      return summary;
    }

    /**
     * @brief The extended form of `XPENDING`: `[[id, consumer, idle-ms, deliveries], ...]`
     *
     */
    inline PendingMessages toPendingMessages(std::string_view group, const Range<std::string> &range,
                                             const Reply &reply) {
      std::vector<PendingMessage> messages;
      if (!reply.isNil()) {
        requireAggregate(reply, "XPENDING");
        messages.reserve(reply.elements.size());
        for (const auto &e : reply.elements) {
          if (e.elements.size() < 4) throw RedisError("malformed XPENDING entry");
          messages.push_back(PendingMessage{toRecordId(e.elements[0]), toString(e.elements[1]), std::string(group),
                                            std::chrono::milliseconds{toLong(e.elements[2])},
                                            toLong(e.elements[3])});
        }
      }
      return PendingMessages(std::string(group), range, std::move(messages));
    }

    inline XInfoStream toXInfoStream(const Reply &reply) {
      requireAggregate(reply, "XINFO STREAM");
      return XInfoStream(reply);
    }

    inline XInfoGroups toXInfoGroups(const Reply &reply) {
      requireAggregate(reply, "XINFO GROUPS");
      return XInfoGroups(reply);
    }

    inline XInfoConsumers toXInfoConsumers(std::string_view group, const Reply &reply) {
      requireAggregate(reply, "XINFO CONSUMERS");
      return XInfoConsumers(std::string(group), reply);
    }

    /**
     * @brief Normalize a script result to the declared `ReturnType`
     *
     */
    inline Reply toScriptResult(ReturnType returnType, const Reply &reply) {
      switch (returnType) {
        case ReturnType::BOOLEAN:
          return Reply::boolean(toBoolean(reply));
        case ReturnType::INTEGER:
          return Reply::integerValue(toLong(reply));
        case ReturnType::STATUS:
          return Reply::status(toString(reply));
        case ReturnType::MULTI:
          if (!reply.isNil()) requireAggregate(reply, "a MULTI script result");
          return reply;
        case ReturnType::VALUE:
          break;
      }
      return reply;
    }

    /**
     * @name Deferred-mode transforms
     *
     * @brief Normalizations applied to raw replies read back by `exec()` and `closePipeline()`
     *
     */
    ///@{
    inline Reply identity(const Reply &reply) { return reply; }

    inline Reply asBoolean(const Reply &reply) {
      if (reply.isError()) return reply;
      return Reply::boolean(toBoolean(reply));
    }

    inline Reply asDouble(const Reply &reply) {
      if (reply.isError() || reply.isNil()) return reply;
      auto d = toDouble(reply);
      return Reply::doubleValue(d);
    }
    ///@}
  };  // namespace Converters
};  // namespace RedisConn
