#pragma once
#include <array>
#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RedisConn {

  /**
   * @brief The kinds of value a server can send back
   *
   * @details The ordering mirrors the RESP3 reply types. RESP2 servers only ever produce `STRING`,
   * `ARRAY`, `INTEGER`, `NIL`, `STATUS` and `ERROR`.
   *
   */
  enum class ReplyType { STRING = 1, ARRAY, INTEGER, NIL, STATUS, ERROR, DOUBLE, BOOL, MAP, SET, ATTR, PUSH, BIGNUM, VERB };

  /**
   * @brief An owning, driver-independent copy of a server reply
   *
   * @details The native client hands out replies in its own representation (a `redisReply` tree for
   * hiredis) whose lifetime is tied to the driver. `Reply` copies that tree into plain values so the
   * converters can work on it without knowing which driver produced it. `MAP` replies keep their
   * elements flattened as `key, value, key, value, ...`, which is also how a RESP2 server answers the
   * same command, so converters can treat both protocols alike.
   *
   */
  struct Reply {
    ReplyType type{ReplyType::NIL};
    long long integer{0};
    double dval{0.0};
    std::string str;
    std::vector<Reply> elements;

    static Reply nil() { return Reply{}; }

    static Reply string(std::string_view s) {
      Reply r;
      r.type = ReplyType::STRING;
      r.str = std::string(s);
      return r;
    }

    static Reply status(std::string_view s) {
      Reply r;
      r.type = ReplyType::STATUS;
      r.str = std::string(s);
      return r;
    }

    static Reply error(std::string_view s) {
      Reply r;
      r.type = ReplyType::ERROR;
      r.str = std::string(s);
      return r;
    }

    static Reply integerValue(long long i) {
      Reply r;
      r.type = ReplyType::INTEGER;
      r.integer = i;
      return r;
    }

    static Reply doubleValue(double d) {
      Reply r;
      r.type = ReplyType::DOUBLE;
      r.dval = d;
      r.str = std::to_string(d);
      return r;
    }

    static Reply boolean(bool b) {
      Reply r;
      r.type = ReplyType::BOOL;
      r.integer = b ? 1 : 0;
      return r;
    }

    static Reply array(std::vector<Reply> elems) {
      Reply r;
      r.type = ReplyType::ARRAY;
      r.elements = std::move(elems);
      return r;
    }

    static Reply map(std::vector<Reply> flattened) {
      Reply r;
      r.type = ReplyType::MAP;
      r.elements = std::move(flattened);
      return r;
    }

    static Reply set(std::vector<Reply> elems) {
      Reply r;
      r.type = ReplyType::SET;
      r.elements = std::move(elems);
      return r;
    }

    static Reply push(std::vector<Reply> elems) {
      Reply r;
      r.type = ReplyType::PUSH;
      r.elements = std::move(elems);
      return r;
    }

    /**
     * @brief Build an array reply of bulk strings
     *
     */
    static Reply strings(std::initializer_list<std::string_view> values) {
      std::vector<Reply> elems;
      elems.reserve(values.size());
      for (auto v : values) elems.push_back(string(v));
      return array(std::move(elems));
    }

    [[nodiscard]] bool isNil() const noexcept { return type == ReplyType::NIL; }
    [[nodiscard]] bool isError() const noexcept { return type == ReplyType::ERROR; }
    [[nodiscard]] bool isStatus() const noexcept { return type == ReplyType::STATUS; }
    [[nodiscard]] bool isInteger() const noexcept { return type == ReplyType::INTEGER; }

    [[nodiscard]] bool isStringLike() const noexcept {
      return type == ReplyType::STRING || type == ReplyType::STATUS || type == ReplyType::VERB ||
             type == ReplyType::BIGNUM || type == ReplyType::DOUBLE;
    }

    [[nodiscard]] bool isAggregate() const noexcept {
      return type == ReplyType::ARRAY || type == ReplyType::MAP || type == ReplyType::SET ||
             type == ReplyType::PUSH;
    }

    [[nodiscard]] bool isOk() const noexcept { return type == ReplyType::STATUS && str == "OK"; }

    [[nodiscard]] std::string dump() const {
      std::ostringstream out;
      dumpR(out, *this);
      return out.str();
    }

    friend bool operator==(const Reply &, const Reply &) = default;

   private:
    static void dumpR(std::ostringstream &out, const Reply &reply, unsigned depth = 0) {
      std::string indent(depth * 6, ' ');
      constexpr auto types =
          std::array<std::string_view, 15>{"",     "STRING", "ARRAY", "INTEGER", "NIL",  "STATUS", "ERROR", "DOUBLE",
                                           "BOOL", "MAP",    "SET",   "ATTR",    "PUSH", "BIGNUM", "VERB"};
      auto type = reply.type;
      out << indent << "type: " << types[static_cast<int>(type)] << "\n";
      if (type == ReplyType::INTEGER) {
        out << indent << "integer: " << reply.integer << "\n";
      }
      if (type == ReplyType::DOUBLE) {
        out << indent << "double: " << reply.dval << "\n";
      }
      if (type == ReplyType::BOOL) {
        out << indent << "bool: " << (reply.integer ? "true" : "false") << "\n";
      }
      if (type == ReplyType::ERROR || type == ReplyType::STRING || type == ReplyType::STATUS ||
          type == ReplyType::BIGNUM || type == ReplyType::VERB) {
        out << indent << "len: " << reply.str.size() << "\n" << indent << "str: " << reply.str << "\n";
      }
      if (reply.isAggregate() || type == ReplyType::ATTR) {
        out << indent << "elements: " << reply.elements.size() << "\n";
        for (auto i{0u}; i < reply.elements.size(); i++) {
          out << indent << "  [" << i << "]:\n";
          dumpR(out, reply.elements[i], depth + 1);
        }
      }
    }
  };
};  // namespace RedisConn
