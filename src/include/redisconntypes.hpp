#pragma once
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RedisConn {
  using namespace std::chrono_literals;

  /**
   * @brief One end of a `Range`: a value that is included or excluded, or no value at all (unbounded)
   *
   */
  template <typename T>
  struct Bound {
    std::optional<T> value;
    bool inclusive{true};

    static Bound inclusiveOf(T v) { return Bound{std::move(v), true}; }
    static Bound exclusiveOf(T v) { return Bound{std::move(v), false}; }
    static Bound unbounded() { return Bound{std::nullopt, true}; }

    [[nodiscard]] bool isBounded() const noexcept { return value.has_value(); }

    friend bool operator==(const Bound &, const Bound &) = default;
  };

  /**
   * @brief An interval over stream ids, scores or lexical values
   *
   */
  template <typename T>
  class Range {
   public:
    Range(Bound<T> lower_, Bound<T> upper_) : lower{std::move(lower_)}, upper{std::move(upper_)} {}

    static Range unbounded() { return Range(Bound<T>::unbounded(), Bound<T>::unbounded()); }
    static Range closed(T from, T to) { return Range(Bound<T>::inclusiveOf(from), Bound<T>::inclusiveOf(to)); }
    static Range open(T from, T to) { return Range(Bound<T>::exclusiveOf(from), Bound<T>::exclusiveOf(to)); }
    static Range leftOpen(T from, T to) { return Range(Bound<T>::exclusiveOf(from), Bound<T>::inclusiveOf(to)); }
    static Range rightOpen(T from, T to) { return Range(Bound<T>::inclusiveOf(from), Bound<T>::exclusiveOf(to)); }
    static Range leftUnbounded(Bound<T> to) { return Range(Bound<T>::unbounded(), std::move(to)); }
    static Range rightUnbounded(Bound<T> from) { return Range(std::move(from), Bound<T>::unbounded()); }
    static Range just(T v) { return closed(v, v); }

    [[nodiscard]] const Bound<T> &lowerBound() const noexcept { return lower; }
    [[nodiscard]] const Bound<T> &upperBound() const noexcept { return upper; }

    friend bool operator==(const Range &, const Range &) = default;

   private:
    Bound<T> lower;
    Bound<T> upper;
  };

  /**
   * @brief Offset and count restriction for range queries
   *
   */
  class Limit {
   public:
    Limit() = default;

    static Limit unlimited() { return Limit{}; }
    static Limit limit() { return Limit{}; }

    [[nodiscard]] Limit offset(long long o) const {
      auto l = *this;
      l.offsetValue = o;
      return l;
    }

    [[nodiscard]] Limit count(long long c) const {
      auto l = *this;
      l.countValue = c;
      return l;
    }

    [[nodiscard]] long long getOffset() const noexcept { return offsetValue; }
    [[nodiscard]] long long getCount() const noexcept { return countValue; }
    [[nodiscard]] bool isUnlimited() const noexcept { return countValue < 0 && offsetValue <= 0; }
    [[nodiscard]] bool isLimited() const noexcept { return !isUnlimited(); }

    friend bool operator==(const Limit &, const Limit &) = default;

   private:
    long long offsetValue{0};
    long long countValue{-1};
  };

  /**
   * @brief Time-to-live for `SET`
   *
   */
  class Expiration {
   public:
    enum class Kind { PERSISTENT, SECONDS, MILLISECONDS, KEEP_TTL };

    static Expiration persistent() { return Expiration{Kind::PERSISTENT, 0}; }
    static Expiration keepTtl() { return Expiration{Kind::KEEP_TTL, 0}; }
    static Expiration seconds(long long s) { return Expiration{Kind::SECONDS, s}; }
    static Expiration milliseconds(long long ms) { return Expiration{Kind::MILLISECONDS, ms}; }

    static Expiration from(std::chrono::milliseconds ttl) {
      if (ttl.count() % 1000 == 0) return seconds(ttl.count() / 1000);
      return milliseconds(ttl.count());
    }

    [[nodiscard]] Kind kind() const noexcept { return expirationKind; }
    [[nodiscard]] long long amount() const noexcept { return value; }
    [[nodiscard]] bool isPersistent() const noexcept { return expirationKind == Kind::PERSISTENT; }
    [[nodiscard]] bool isKeepTtl() const noexcept { return expirationKind == Kind::KEEP_TTL; }

    friend bool operator==(const Expiration &, const Expiration &) = default;

   private:
    Expiration(Kind k, long long v) : expirationKind{k}, value{v} {}

    Kind expirationKind;
    long long value;
  };

  enum class SetOption { UPSERT, SET_IF_ABSENT, SET_IF_PRESENT };

  /**
   * @brief Flags for `ZADD`
   *
   */
  enum class ZAddFlag { NONE, NX, XX, GT, LT };

  /**
   * @brief A sorted set member with its score
   *
   */
  struct Tuple {
    std::string value;
    double score{0.0};

    friend bool operator==(const Tuple &, const Tuple &) = default;
  };

  enum class Aggregate { SUM, MIN, MAX };

  using Weights = std::vector<double>;

  enum class Position { BEFORE, AFTER };

  enum class Direction { LEFT, RIGHT };

  /**
   * @brief The data type reported by `TYPE`
   *
   */
  enum class DataType { NONE, STRING, LIST, SET, ZSET, HASH, STREAM };

  // empty for types this library does not model, such as those added by modules
  inline std::optional<DataType> findDataType(std::string_view code) {
    if (code == "string") return DataType::STRING;
    if (code == "list") return DataType::LIST;
    if (code == "set") return DataType::SET;
    if (code == "zset") return DataType::ZSET;
    if (code == "hash") return DataType::HASH;
    if (code == "stream") return DataType::STREAM;
    if (code == "none") return DataType::NONE;
    return std::nullopt;
  }

  inline DataType dataTypeFromCode(std::string_view code) {
    if (auto type = findDataType(code)) return *type;
    throw std::invalid_argument(std::format("unknown data type code: {}", code));
  }

  inline std::string_view dataTypeCode(DataType type) {
    switch (type) {
      case DataType::STRING:
        return "string";
      case DataType::LIST:
        return "list";
      case DataType::SET:
        return "set";
      case DataType::ZSET:
        return "zset";
      case DataType::HASH:
        return "hash";
      case DataType::STREAM:
        return "stream";
      case DataType::NONE:
        break;
    }
    return "none";
  }

  /**
   * @brief How the result of a script is to be interpreted
   *
   */
  enum class ReturnType { BOOLEAN, INTEGER, STATUS, VALUE, MULTI };

  /**
   * @brief Options for the `SCAN` family
   *
   */
  struct ScanOptions {
    std::optional<std::string> pattern;
    std::optional<long long> count;
    std::optional<DataType> type;

    static ScanOptions none() { return ScanOptions{}; }

    [[nodiscard]] ScanOptions match(std::string p) const {
      auto o = *this;
      o.pattern = std::move(p);
      return o;
    }

    [[nodiscard]] ScanOptions withCount(long long c) const {
      auto o = *this;
      o.count = c;
      return o;
    }

    [[nodiscard]] ScanOptions withType(DataType t) const {
      auto o = *this;
      o.type = t;
      return o;
    }
  };

  /**
   * @brief One step of a cursor-based iteration
   *
   */
  template <typename T>
  struct ScanCursor {
    uint64_t cursorId{0};
    std::vector<T> items;

    [[nodiscard]] bool finished() const noexcept { return cursorId == 0; }
  };

  /**
   * @brief Parameters for `SORT`
   *
   */
  struct SortParameters {
    enum class Order { ASC, DESC };

    std::optional<std::string> byPattern;
    std::optional<Limit> limit;
    std::vector<std::string> getPatterns;
    std::optional<Order> order;
    bool alpha{false};

    [[nodiscard]] SortParameters by(std::string pattern) const {
      auto p = *this;
      p.byPattern = std::move(pattern);
      return p;
    }

    [[nodiscard]] SortParameters get(std::string pattern) const {
      auto p = *this;
      p.getPatterns.push_back(std::move(pattern));
      return p;
    }

    [[nodiscard]] SortParameters limitTo(long long offset, long long count) const {
      auto p = *this;
      p.limit = Limit::limit().offset(offset).count(count);
      return p;
    }

    [[nodiscard]] SortParameters asc() const {
      auto p = *this;
      p.order = Order::ASC;
      return p;
    }

    [[nodiscard]] SortParameters desc() const {
      auto p = *this;
      p.order = Order::DESC;
      return p;
    }

    [[nodiscard]] SortParameters alphabetical() const {
      auto p = *this;
      p.alpha = true;
      return p;
    }
  };

  /**
   * @brief Render a double the way Redis expects it on the wire
   *
   */
  inline std::string formatDouble(double d) {
    if (std::isinf(d)) return d > 0 ? "+inf" : "-inf";
    return std::format("{}", d);
  }

  /**
   * @brief Render a score range as `ZRANGEBYSCORE` arguments
   *
   */
  inline std::pair<std::string, std::string> toScoreBounds(const Range<double> &range) {
    auto render = [](const Bound<double> &b, const char *inf) {
      if (!b.isBounded()) return std::string(inf);
      return (b.inclusive ? "" : "(") + formatDouble(b.value.value());
    };
    return {render(range.lowerBound(), "-inf"), render(range.upperBound(), "+inf")};
  }

  /**
   * @brief Render a stream id range as `XRANGE` arguments
   *
   */
  inline std::pair<std::string, std::string> toStreamBounds(const Range<std::string> &range) {
    auto render = [](const Bound<std::string> &b, const char *inf) {
      if (!b.isBounded()) return std::string(inf);
      return (b.inclusive ? "" : "(") + b.value.value();
    };
    return {render(range.lowerBound(), "-"), render(range.upperBound(), "+")};
  }

  /**
   * @brief Distance units understood by the `GEO` commands
   *
   */
  enum class GeoUnit { METERS, KILOMETERS, MILES, FEET };

  inline std::string_view geoUnitCode(GeoUnit unit) {
    switch (unit) {
      case GeoUnit::KILOMETERS:
        return "km";
      case GeoUnit::MILES:
        return "mi";
      case GeoUnit::FEET:
        return "ft";
      case GeoUnit::METERS:
        break;
    }
    return "m";
  }

  /**
   * @brief A longitude/latitude pair
   *
   */
  struct Point {
    double longitude{0.0};
    double latitude{0.0};

    bool operator==(const Point &) const = default;
  };

  /**
   * @brief A named member of a geospatial index
   *
   */
  struct GeoLocation {
    std::string name;
    Point point;

    bool operator==(const GeoLocation &) const = default;
  };

  struct Distance {
    double value{0.0};
    GeoUnit unit{GeoUnit::METERS};

    bool operator==(const Distance &) const = default;
  };

  /**
   * @brief One match of `GEOSEARCH`; distance and coordinates are only present when they were requested
   *
   */
  struct GeoResult {
    std::string name;
    std::optional<Distance> distance;
    std::optional<Point> point;

    bool operator==(const GeoResult &) const = default;
  };

  /**
   * @brief Where a `GEOSEARCH` starts, what shape it covers and what it returns
   *
   * @details Exactly one origin (`fromMember()` or `fromLonLat()`) and one shape (`byRadius()` or
   * `byBox()`) are required.
   *
   */
  class GeoSearchArgs {
   public:
    static GeoSearchArgs fromMember(std::string member) {
      if (member.empty()) throw std::invalid_argument("Member must not be empty");
      GeoSearchArgs a;
      a.member = std::move(member);
      return a;
    }

    static GeoSearchArgs fromLonLat(Point point) {
      GeoSearchArgs a;
      a.origin = point;
      return a;
    }

    [[nodiscard]] GeoSearchArgs byRadius(double radius, GeoUnit unit) const {
      if (radius < 0) throw std::invalid_argument("Radius must not be negative");
      auto a = *this;
      a.radius = Distance{radius, unit};
      a.box.reset();
      return a;
    }

    [[nodiscard]] GeoSearchArgs byBox(double width, double height, GeoUnit unit) const {
      if (width < 0 || height < 0) throw std::invalid_argument("Box dimensions must not be negative");
      auto a = *this;
      a.box = std::pair{Distance{width, unit}, Distance{height, unit}};
      a.radius.reset();
      return a;
    }

    [[nodiscard]] GeoSearchArgs includeDistance() const {
      auto a = *this;
      a.withDist = true;
      return a;
    }

    [[nodiscard]] GeoSearchArgs includeCoordinates() const {
      auto a = *this;
      a.withCoord = true;
      return a;
    }

    [[nodiscard]] GeoSearchArgs limit(long long n, bool any = false) const {
      if (n <= 0) throw std::invalid_argument("Count must be greater than zero");
      auto a = *this;
      a.count = n;
      a.anyMatch = any;
      return a;
    }

    [[nodiscard]] GeoSearchArgs sortAscending() const {
      auto a = *this;
      a.ascending = true;
      return a;
    }

    [[nodiscard]] GeoSearchArgs sortDescending() const {
      auto a = *this;
      a.ascending = false;
      return a;
    }

    /**
     * @brief The arguments following the key
     *
     */
    [[nodiscard]] std::vector<std::string> toArgs() const {
      std::vector<std::string> args;
      if (member) {
        args.insert(args.end(), {"FROMMEMBER", *member});
      } else {
        args.insert(args.end(), {"FROMLONLAT", formatDouble(origin.longitude), formatDouble(origin.latitude)});
      }
      if (radius) {
        args.insert(args.end(), {"BYRADIUS", formatDouble(radius->value), std::string(geoUnitCode(radius->unit))});
      } else if (box) {
        args.insert(args.end(), {"BYBOX", formatDouble(box->first.value), formatDouble(box->second.value),
                                 std::string(geoUnitCode(box->first.unit))});
      } else {
        throw std::invalid_argument("GEOSEARCH needs a radius or a box");
      }
      if (ascending) args.emplace_back(*ascending ? "ASC" : "DESC");
      if (count) {
        args.insert(args.end(), {"COUNT", std::to_string(*count)});
        if (anyMatch) args.emplace_back("ANY");
      }
      if (withCoord) args.emplace_back("WITHCOORD");
      if (withDist) args.emplace_back("WITHDIST");
      return args;
    }

    [[nodiscard]] bool hasDistance() const noexcept { return withDist; }
    [[nodiscard]] bool hasCoordinates() const noexcept { return withCoord; }

    // distances in the reply are in the unit of the shape
    [[nodiscard]] GeoUnit unit() const noexcept {
      if (radius) return radius->unit;
      if (box) return box->first.unit;
      return GeoUnit::METERS;
    }

   private:
    std::optional<std::string> member;
    Point origin;
    std::optional<Distance> radius;
    std::optional<std::pair<Distance, Distance>> box;
    std::optional<long long> count;
    std::optional<bool> ascending;
    bool anyMatch{false};
    bool withDist{false};
    bool withCoord{false};

    GeoSearchArgs() = default;
  };
};  // namespace RedisConn
