#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "redisconncommands.hpp"
#include "redisconnconverters.hpp"
#include "redisconnerrors.hpp"
#include "redisconnlog.hpp"
#include "redisconnstream.hpp"
#include "redisconntypes.hpp"

namespace RedisConn {

  /**
   * @class CommandResponse
   *
   * @brief The result of one command object, paired with the command that produced it
   *
   */
  template <typename In, typename Out>
  class CommandResponse {
   public:
    CommandResponse(In input_, Out output_) : input{std::move(input_)}, output{std::move(output_)} {}

    [[nodiscard]] const In &getInput() const noexcept { return input; }
    [[nodiscard]] const Out &getOutput() const noexcept { return output; }

   private:
    In input;
    Out output;
  };

  /*
   * Command objects. Every `with`-style method returns a modified copy; a command object is never changed after
   * construction.
   */

  /**
   * @brief A command addressed to a single key
   *
   */
  class KeyCommand {
   public:
    KeyCommand() = default;
    explicit KeyCommand(std::string_view key_) : key{key_} {}

    [[nodiscard]] const std::string &getKey() const noexcept { return key; }

    /**
     * @brief The key, or `std::invalid_argument` if none was given
     *
     */
    [[nodiscard]] const std::string &requireKey() const {
      if (key.empty()) throw std::invalid_argument("Key must not be empty");
      return key;
    }

   protected:
    std::string key;
  };

  class AcknowledgeCommand : public KeyCommand {
   public:
    static AcknowledgeCommand stream(std::string_view key) { return AcknowledgeCommand(key); }

    [[nodiscard]] AcknowledgeCommand forRecords(std::vector<RecordId> ids) const {
      auto c = *this;
      c.recordIds.insert(c.recordIds.end(), ids.begin(), ids.end());
      return c;
    }

    [[nodiscard]] AcknowledgeCommand forRecords(std::initializer_list<std::string_view> ids) const {
      std::vector<RecordId> parsed;
      for (auto id : ids) parsed.push_back(RecordId::of(id));
      return forRecords(std::move(parsed));
    }

    [[nodiscard]] AcknowledgeCommand inGroup(std::string_view group_) const {
      auto c = *this;
      c.group = std::string(group_);
      return c;
    }

    [[nodiscard]] const std::optional<std::string> &getGroup() const noexcept { return group; }
    [[nodiscard]] const std::vector<RecordId> &getRecordIds() const noexcept { return recordIds; }

   private:
    using KeyCommand::KeyCommand;

    std::optional<std::string> group;
    std::vector<RecordId> recordIds;
  };

  class AddStreamRecord : public KeyCommand {
   public:
    static AddStreamRecord of(ByteRecord record_) {
      AddStreamRecord c(record_.stream());
      c.record = std::move(record_);
      return c;
    }

    static AddStreamRecord body(ByteRecord::Fields body_) {
      return of(StreamRecords::newRecord().ofMap(std::move(body_)));
    }

    [[nodiscard]] AddStreamRecord to(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      c.record = record.withStreamKey(c.key);
      return c;
    }

    [[nodiscard]] AddStreamRecord withId(RecordId id) const {
      auto c = *this;
      c.record = record.withId(std::move(id));
      return c;
    }

    [[nodiscard]] AddStreamRecord maxlen(long long n) const {
      auto c = *this;
      c.options = options.maxlen(n);
      return c;
    }

    [[nodiscard]] AddStreamRecord approximateTrimming(bool approximate) const {
      auto c = *this;
      c.options = options.approximateTrimming(approximate);
      return c;
    }

    [[nodiscard]] AddStreamRecord makeNoStream() const {
      auto c = *this;
      c.options = options.makeNoStream();
      return c;
    }

    [[nodiscard]] const ByteRecord &getRecord() const noexcept { return record; }
    [[nodiscard]] const ByteRecord::Fields &getBody() const noexcept { return record.value(); }
    [[nodiscard]] const XAddOptions &getOptions() const noexcept { return options; }

   private:
    using KeyCommand::KeyCommand;

    ByteRecord record;
    XAddOptions options{XAddOptions::none()};
  };

  class DeleteCommand : public KeyCommand {
   public:
    static DeleteCommand stream(std::string_view key) { return DeleteCommand(key); }

    [[nodiscard]] DeleteCommand records(std::vector<RecordId> ids) const {
      auto c = *this;
      c.recordIds.insert(c.recordIds.end(), ids.begin(), ids.end());
      return c;
    }

    [[nodiscard]] const std::vector<RecordId> &getRecordIds() const noexcept { return recordIds; }

   private:
    using KeyCommand::KeyCommand;

    std::vector<RecordId> recordIds;
  };

  class RangeCommand : public KeyCommand {
   public:
    static RangeCommand stream(std::string_view key) { return RangeCommand(key); }

    [[nodiscard]] RangeCommand within(Range<std::string> range_) const {
      auto c = *this;
      c.range = std::move(range_);
      return c;
    }

    [[nodiscard]] RangeCommand limit(Limit limit_) const {
      auto c = *this;
      c.rangeLimit = limit_;
      return c;
    }

    [[nodiscard]] RangeCommand limit(long long count) const { return limit(Limit::limit().count(count)); }

    [[nodiscard]] const Range<std::string> &getRange() const noexcept { return range; }
    [[nodiscard]] const Limit &getLimit() const noexcept { return rangeLimit; }

   private:
    explicit RangeCommand(std::string_view key_) : KeyCommand(key_), range{Range<std::string>::unbounded()} {}

    Range<std::string> range;
    Limit rangeLimit{Limit::unlimited()};
  };

  /**
   * @brief `XREAD`, or `XREADGROUP` once a consumer is set
   *
   */
  class ReadCommand {
   public:
    static ReadCommand from(std::vector<StreamOffset> offsets) {
      if (offsets.empty()) throw std::invalid_argument("At least one stream offset is required");
      return ReadCommand(std::move(offsets));
    }

    static ReadCommand from(StreamOffset offset) { return from(std::vector<StreamOffset>{std::move(offset)}); }

    [[nodiscard]] ReadCommand as(Consumer consumer_) const {
      auto c = *this;
      c.consumer = std::move(consumer_);
      return c;
    }

    [[nodiscard]] ReadCommand withOptions(StreamReadOptions options) const {
      auto c = *this;
      c.readOptions = std::move(options);
      return c;
    }

    [[nodiscard]] const std::vector<StreamOffset> &getStreamOffsets() const noexcept { return streamOffsets; }
    [[nodiscard]] const std::optional<Consumer> &getConsumer() const noexcept { return consumer; }
    [[nodiscard]] const StreamReadOptions &getReadOptions() const noexcept { return readOptions; }

   private:
    explicit ReadCommand(std::vector<StreamOffset> offsets) : streamOffsets{std::move(offsets)} {}

    std::vector<StreamOffset> streamOffsets;
    std::optional<Consumer> consumer;
    StreamReadOptions readOptions{StreamReadOptions::empty()};
  };

  class TrimCommand : public KeyCommand {
   public:
    static TrimCommand stream(std::string_view key) { return TrimCommand(key); }

    [[nodiscard]] TrimCommand to(long long count_) const {
      auto c = *this;
      c.count = count_;
      return c;
    }

    [[nodiscard]] TrimCommand approximate(bool approximate_ = true) const {
      auto c = *this;
      c.approximateTrimming = approximate_;
      return c;
    }

    [[nodiscard]] const std::optional<long long> &getCount() const noexcept { return count; }
    [[nodiscard]] bool isApproximateTrimming() const noexcept { return approximateTrimming; }

   private:
    using KeyCommand::KeyCommand;

    std::optional<long long> count;
    bool approximateTrimming{false};
  };

  /**
   * @brief `XGROUP CREATE`, `XGROUP DESTROY` or `XGROUP DELCONSUMER`
   *
   */
  class GroupCommand : public KeyCommand {
   public:
    enum class GroupCommandAction { CREATE, DESTROY, DELETE_CONSUMER };

    static GroupCommand createGroup(std::string_view group) {
      return GroupCommand(GroupCommandAction::CREATE, std::string(group));
    }

    static GroupCommand destroyGroup(std::string_view group) {
      return GroupCommand(GroupCommandAction::DESTROY, std::string(group));
    }

    static GroupCommand deleteConsumer(const Consumer &consumer_) {
      auto c = GroupCommand(GroupCommandAction::DELETE_CONSUMER, consumer_.group());
      c.consumerName = consumer_.name();
      return c;
    }

    [[nodiscard]] GroupCommand forStream(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] GroupCommand at(ReadOffset offset_) const {
      auto c = *this;
      c.offset = std::move(offset_);
      return c;
    }

    [[nodiscard]] GroupCommand makeStream(bool mkStream_) const {
      auto c = *this;
      c.mkStream = mkStream_;
      return c;
    }

    [[nodiscard]] GroupCommandAction getAction() const noexcept { return action; }
    [[nodiscard]] const std::string &getGroupName() const noexcept { return groupName; }
    [[nodiscard]] const std::optional<std::string> &getConsumerName() const noexcept { return consumerName; }
    [[nodiscard]] const ReadOffset &getReadOffset() const noexcept { return offset; }
    [[nodiscard]] bool isMkStream() const noexcept { return mkStream; }

   private:
    GroupCommand(GroupCommandAction action_, std::string group)
        : action{action_}, groupName{std::move(group)}, offset{ReadOffset::latest()} {
      if (groupName.empty()) throw std::invalid_argument("Group name must not be empty");
    }

    GroupCommandAction action;
    std::string groupName;
    std::optional<std::string> consumerName;
    ReadOffset offset;
    bool mkStream{false};
  };

  /**
   * @brief The extended form of `XPENDING`
   *
   */
  class PendingRecordsCommand : public KeyCommand {
   public:
    static PendingRecordsCommand pending(std::string_view key, std::string_view group) {
      if (group.empty()) throw std::invalid_argument("Group name must not be empty");
      return PendingRecordsCommand(key, std::string(group));
    }

    [[nodiscard]] PendingRecordsCommand range(Range<std::string> range_, long long count_) const {
      auto c = *this;
      c.options = XPendingOptions::range(std::move(range_), count_);
      if (options.hasConsumer()) c.options = c.options.consumer(*options.getConsumerName());
      return c;
    }

    [[nodiscard]] PendingRecordsCommand consumer(std::string_view name) const {
      auto c = *this;
      c.options = options.consumer(name);
      return c;
    }

    [[nodiscard]] const std::string &getGroupName() const noexcept { return groupName; }
    [[nodiscard]] const XPendingOptions &getOptions() const noexcept { return options; }

   private:
    PendingRecordsCommand(std::string_view key_, std::string group)
        : KeyCommand(key_), groupName{std::move(group)}, options{XPendingOptions::unbounded()} {}

    std::string groupName;
    XPendingOptions options;
  };

  class XClaimCommand : public KeyCommand {
   public:
    XClaimCommand(std::string_view key_, std::string_view group_, std::string_view newOwner_, XClaimOptions options_)
        : KeyCommand(key_), group{group_}, newOwner{newOwner_}, options{std::move(options_)} {}

    [[nodiscard]] const std::string &getGroupName() const noexcept { return group; }
    [[nodiscard]] const std::string &getNewOwner() const noexcept { return newOwner; }
    [[nodiscard]] const XClaimOptions &getOptions() const noexcept { return options; }

   private:
    std::string group;
    std::string newOwner;
    XClaimOptions options;
  };

  /**
   * @brief `HSET`/`HMSET`, or `HSETNX` when `ifValueNotExists()` is set
   *
   */
  class HSetCommand : public KeyCommand {
   public:
    static HSetCommand value(std::string_view field, std::string_view value_) {
      return fieldValues({{std::string(field), std::string(value_)}});
    }

    static HSetCommand fieldValues(KeyValues entries) {
      if (entries.empty()) throw std::invalid_argument("At least one field/value pair is required");
      HSetCommand c;
      c.fieldMap = std::move(entries);
      return c;
    }

    [[nodiscard]] HSetCommand forKey(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] HSetCommand ifValueNotExists() const {
      auto c = *this;
      c.upsert = false;
      return c;
    }

    [[nodiscard]] const KeyValues &getFieldValueMap() const noexcept { return fieldMap; }
    [[nodiscard]] bool isUpsert() const noexcept { return upsert; }

   private:
    HSetCommand() = default;

    KeyValues fieldMap;
    bool upsert{true};
  };

  class HGetCommand : public KeyCommand {
   public:
    static HGetCommand field(std::string_view name) { return fields({std::string(name)}); }

    static HGetCommand fields(Keys names) {
      if (names.empty()) throw std::invalid_argument("At least one field is required");
      HGetCommand c;
      c.fieldNames = std::move(names);
      return c;
    }

    [[nodiscard]] HGetCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const Keys &getFields() const noexcept { return fieldNames; }

   private:
    HGetCommand() = default;

    Keys fieldNames;
  };

  class HDelCommand : public KeyCommand {
   public:
    static HDelCommand field(std::string_view name) { return fields({std::string(name)}); }

    static HDelCommand fields(Keys names) {
      if (names.empty()) throw std::invalid_argument("At least one field is required");
      HDelCommand c;
      c.fieldNames = std::move(names);
      return c;
    }

    [[nodiscard]] HDelCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const Keys &getFields() const noexcept { return fieldNames; }

   private:
    HDelCommand() = default;

    Keys fieldNames;
  };

  class HExistsCommand : public KeyCommand {
   public:
    static HExistsCommand field(std::string_view name) {
      if (name.empty()) throw std::invalid_argument("Field must not be empty");
      HExistsCommand c;
      c.fieldName = std::string(name);
      return c;
    }

    [[nodiscard]] HExistsCommand in(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const std::string &getField() const noexcept { return fieldName; }

   private:
    HExistsCommand() = default;

    std::string fieldName;
  };

  class SAddCommand : public KeyCommand {
   public:
    static SAddCommand value(std::string_view member) { return values({std::string(member)}); }

    static SAddCommand values(Values members) {
      if (members.empty()) throw std::invalid_argument("At least one value is required");
      SAddCommand c;
      c.memberValues = std::move(members);
      return c;
    }

    [[nodiscard]] SAddCommand to(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const Values &getValues() const noexcept { return memberValues; }

   private:
    SAddCommand() = default;

    Values memberValues;
  };

  class SRemCommand : public KeyCommand {
   public:
    static SRemCommand value(std::string_view member) { return values({std::string(member)}); }

    static SRemCommand values(Values members) {
      if (members.empty()) throw std::invalid_argument("At least one value is required");
      SRemCommand c;
      c.memberValues = std::move(members);
      return c;
    }

    [[nodiscard]] SRemCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const Values &getValues() const noexcept { return memberValues; }

   private:
    SRemCommand() = default;

    Values memberValues;
  };

  class SIsMemberCommand : public KeyCommand {
   public:
    static SIsMemberCommand value(std::string_view member) {
      SIsMemberCommand c;
      c.memberValue = std::string(member);
      return c;
    }

    [[nodiscard]] SIsMemberCommand of(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const std::string &getValue() const noexcept { return memberValue; }

   private:
    SIsMemberCommand() = default;

    std::string memberValue;
  };

  class SetCommand : public KeyCommand {
   public:
    static SetCommand set(std::string_view key) { return SetCommand(key); }

    [[nodiscard]] SetCommand value(std::string_view value_) const {
      auto c = *this;
      c.content = std::string(value_);
      return c;
    }

    [[nodiscard]] SetCommand expiring(Expiration expiration_) const {
      auto c = *this;
      c.expiration = expiration_;
      return c;
    }

    [[nodiscard]] SetCommand withSetOption(SetOption option_) const {
      auto c = *this;
      c.option = option_;
      return c;
    }

    [[nodiscard]] const std::optional<std::string> &getValue() const noexcept { return content; }
    [[nodiscard]] const Expiration &getExpiration() const noexcept { return expiration; }
    [[nodiscard]] SetOption getOption() const noexcept { return option; }

   private:
    explicit SetCommand(std::string_view key_) : KeyCommand(key_), expiration{Expiration::persistent()} {}

    std::optional<std::string> content;
    Expiration expiration;
    SetOption option{SetOption::UPSERT};
  };

  class MGetCommand {
   public:
    explicit MGetCommand(Keys keys_) : keys{std::move(keys_)} {
      if (keys.empty()) throw std::invalid_argument("At least one key is required");
    }

    [[nodiscard]] const Keys &getKeys() const noexcept { return keys; }

   private:
    Keys keys;
  };

  /**
   * @brief `LPUSH` or `RPUSH` of one or more values
   *
   */
  class PushCommand : public KeyCommand {
   public:
    enum class Direction { LEFT, RIGHT };

    static PushCommand left() { return PushCommand(Direction::LEFT); }
    static PushCommand right() { return PushCommand(Direction::RIGHT); }

    [[nodiscard]] PushCommand value(std::string_view element) const { return values({std::string(element)}); }

    [[nodiscard]] PushCommand values(Values elements) const {
      if (elements.empty()) throw std::invalid_argument("At least one value is required");
      auto c = *this;
      c.elements = std::move(elements);
      return c;
    }

    [[nodiscard]] PushCommand to(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] Direction getDirection() const noexcept { return direction; }
    [[nodiscard]] const Values &getValues() const noexcept { return elements; }

   private:
    explicit PushCommand(Direction direction_) : direction{direction_} {}

    Direction direction;
    Values elements;
  };

  /**
   * @brief `LPOP` or `RPOP` of a single element
   *
   */
  class PopCommand : public KeyCommand {
   public:
    static PopCommand left() { return PopCommand(PushCommand::Direction::LEFT); }
    static PopCommand right() { return PopCommand(PushCommand::Direction::RIGHT); }

    [[nodiscard]] PopCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] PushCommand::Direction getDirection() const noexcept { return direction; }

   private:
    explicit PopCommand(PushCommand::Direction direction_) : direction{direction_} {}

    PushCommand::Direction direction;
  };

  /**
   * @brief A range of list or sorted set positions; both ends are inclusive and may be negative
   *
   */
  class IndexRangeCommand : public KeyCommand {
   public:
    static IndexRangeCommand of(std::string_view key) { return IndexRangeCommand(key); }

    [[nodiscard]] IndexRangeCommand fromIndex(long long start_) const {
      auto c = *this;
      c.start = start_;
      return c;
    }

    [[nodiscard]] IndexRangeCommand toIndex(long long end_) const {
      auto c = *this;
      c.end = end_;
      return c;
    }

    [[nodiscard]] long long getStart() const noexcept { return start; }
    [[nodiscard]] long long getEnd() const noexcept { return end; }

   private:
    explicit IndexRangeCommand(std::string_view key_) : KeyCommand(key_) {}

    long long start{0};
    long long end{-1};
  };

  class ZAddCommand : public KeyCommand {
   public:
    static ZAddCommand tuple(Tuple member) { return tuples({std::move(member)}); }

    static ZAddCommand tuples(std::vector<Tuple> members) {
      if (members.empty()) throw std::invalid_argument("At least one tuple is required");
      ZAddCommand c;
      c.members = std::move(members);
      return c;
    }

    [[nodiscard]] ZAddCommand to(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] ZAddCommand withFlag(ZAddFlag flag_) const {
      auto c = *this;
      c.flag = flag_;
      return c;
    }

    [[nodiscard]] const std::vector<Tuple> &getTuples() const noexcept { return members; }
    [[nodiscard]] ZAddFlag getFlag() const noexcept { return flag; }

   private:
    ZAddCommand() = default;

    std::vector<Tuple> members;
    ZAddFlag flag{ZAddFlag::NONE};
  };

  class ZRemCommand : public KeyCommand {
   public:
    static ZRemCommand values(Values members) {
      if (members.empty()) throw std::invalid_argument("At least one value is required");
      ZRemCommand c;
      c.memberValues = std::move(members);
      return c;
    }

    [[nodiscard]] ZRemCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const Values &getValues() const noexcept { return memberValues; }

   private:
    ZRemCommand() = default;

    Values memberValues;
  };

  class ZIncrByCommand : public KeyCommand {
   public:
    static ZIncrByCommand scoreOf(std::string_view member) {
      ZIncrByCommand c;
      c.memberValue = std::string(member);
      return c;
    }

    [[nodiscard]] ZIncrByCommand by(double increment_) const {
      auto c = *this;
      c.increment = increment_;
      return c;
    }

    [[nodiscard]] ZIncrByCommand storedWithin(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] const std::string &getValue() const noexcept { return memberValue; }
    [[nodiscard]] double getIncrement() const noexcept { return increment; }

   private:
    ZIncrByCommand() = default;

    std::string memberValue;
    double increment{1.0};
  };

  class ZRangeByScoreCommand : public KeyCommand {
   public:
    static ZRangeByScoreCommand scoresWithin(Range<double> range_) {
      ZRangeByScoreCommand c;
      c.range = std::move(range_);
      return c;
    }

    [[nodiscard]] ZRangeByScoreCommand from(std::string_view key_) const {
      auto c = *this;
      c.key = std::string(key_);
      return c;
    }

    [[nodiscard]] ZRangeByScoreCommand limitTo(Limit limit_) const {
      auto c = *this;
      c.limit = limit_;
      return c;
    }

    [[nodiscard]] const Range<double> &getRange() const noexcept { return range; }
    [[nodiscard]] const Limit &getLimit() const noexcept { return limit; }

   private:
    ZRangeByScoreCommand() : range{Range<double>::unbounded()} {}

    Range<double> range;
    Limit limit;
  };

  /**
   * @brief `INCRBY`, `DECRBY` or `INCRBYFLOAT`, depending on the operation and the type of the amount
   *
   */
  template <typename T>
  class IncrByCommand : public KeyCommand {
   public:
    static IncrByCommand incr(std::string_view key) { return IncrByCommand(key); }

    [[nodiscard]] IncrByCommand by(T amount_) const {
      auto c = *this;
      c.amount = amount_;
      return c;
    }

    [[nodiscard]] const std::optional<T> &getValue() const noexcept { return amount; }

    [[nodiscard]] T requireValue() const {
      if (!amount) throw std::invalid_argument("Value must not be null");
      return *amount;
    }

   private:
    explicit IncrByCommand(std::string_view key_) : KeyCommand(key_) {}

    std::optional<T> amount;
  };

  class ReactiveRedisConnection;
  class ReactiveRedisConnection;

  /**
   * @brief Stream commands returning futures
   *
   * @details The batch forms run a list of command objects as one task and return one `CommandResponse` per
   * command; the single forms run one command.
   *
   */
  class ReactiveStreamCommands {
   public:
    explicit ReactiveStreamCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    using Records = std::vector<ByteRecord>;

    std::future<std::vector<CommandResponse<AcknowledgeCommand, long long>>> xAck(
        std::vector<AcknowledgeCommand> commands);
    std::future<std::vector<CommandResponse<AddStreamRecord, RecordId>>> xAdd(std::vector<AddStreamRecord> commands);
    std::future<std::vector<CommandResponse<DeleteCommand, long long>>> xDel(std::vector<DeleteCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, long long>>> xLen(std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<RangeCommand, Records>>> xRange(std::vector<RangeCommand> commands);
    std::future<std::vector<CommandResponse<RangeCommand, Records>>> xRevRange(std::vector<RangeCommand> commands);
    std::future<std::vector<CommandResponse<ReadCommand, Records>>> read(std::vector<ReadCommand> commands);
    std::future<std::vector<CommandResponse<TrimCommand, long long>>> xTrim(std::vector<TrimCommand> commands);
    std::future<std::vector<CommandResponse<GroupCommand, std::string>>> xGroup(std::vector<GroupCommand> commands);
    std::future<std::vector<CommandResponse<PendingRecordsCommand, PendingMessages>>> xPending(
        std::vector<PendingRecordsCommand> commands);
    std::future<std::vector<CommandResponse<XClaimCommand, Records>>> xClaim(std::vector<XClaimCommand> commands);

    std::future<long long> xAck(std::string_view key, std::string_view group, std::vector<RecordId> recordIds);
    std::future<RecordId> xAdd(ByteRecord record);
    std::future<RecordId> xAdd(std::string_view key, ByteRecord::Fields body);
    std::future<long long> xDel(std::string_view key, std::vector<RecordId> recordIds);
    std::future<long long> xLen(std::string_view key);
    std::future<Records> xRange(std::string_view key, Range<std::string> range, Limit limit = Limit::unlimited());
    std::future<Records> xRevRange(std::string_view key, Range<std::string> range, Limit limit = Limit::unlimited());
    std::future<Records> xRead(StreamReadOptions readOptions, std::vector<StreamOffset> streams);
    std::future<Records> xReadGroup(Consumer consumer, StreamReadOptions readOptions,
                                    std::vector<StreamOffset> streams);
    std::future<long long> xTrim(std::string_view key, long long count, bool approximateTrimming = false);
    std::future<std::string> xGroupCreate(std::string_view key, std::string_view group, ReadOffset readOffset,
                                          bool mkStream = false);
    std::future<std::string> xGroupDestroy(std::string_view key, std::string_view group);
    std::future<std::string> xGroupDelConsumer(std::string_view key, Consumer consumer);
    std::future<PendingMessagesSummary> xPending(std::string_view key, std::string_view group);
    std::future<PendingMessages> xPending(std::string_view key, std::string_view group, XPendingOptions options);
    std::future<Records> xClaim(std::string_view key, std::string_view group, std::string_view newOwner,
                                XClaimOptions options);

   private:
    ReactiveRedisConnection &owner;

    static long long ack(RedisConnection &c, const AcknowledgeCommand &cmd) {
      if (!cmd.getGroup().has_value()) throw std::invalid_argument("Group must not be null");
      if (cmd.getRecordIds().empty()) throw std::invalid_argument("At least one record id is required");
      return c.xAck(cmd.requireKey(), *cmd.getGroup(), cmd.getRecordIds());
    }

    static RecordId add(RedisConnection &c, const AddStreamRecord &cmd) {
      cmd.requireKey();
      return c.xAdd(cmd.getRecord(), cmd.getOptions());
    }

    static long long remove(RedisConnection &c, const DeleteCommand &cmd) {
      return c.xDel(cmd.requireKey(), cmd.getRecordIds());
    }

    static long long length(RedisConnection &c, const KeyCommand &cmd) { return c.xLen(cmd.requireKey()); }

    static Records range(RedisConnection &c, const RangeCommand &cmd) {
      return c.xRange(cmd.requireKey(), cmd.getRange(), cmd.getLimit());
    }

    static Records revRange(RedisConnection &c, const RangeCommand &cmd) {
      return c.xRevRange(cmd.requireKey(), cmd.getRange(), cmd.getLimit());
    }

    static Records readStreams(RedisConnection &c, const ReadCommand &cmd) {
      if (cmd.getConsumer().has_value()) {
        return c.xReadGroup(*cmd.getConsumer(), cmd.getReadOptions(), cmd.getStreamOffsets());
      }
      return c.xRead(cmd.getReadOptions(), cmd.getStreamOffsets());
    }

    static long long trim(RedisConnection &c, const TrimCommand &cmd) {
      if (!cmd.getCount().has_value()) throw std::invalid_argument("Count must not be null");
      return c.xTrim(cmd.requireKey(), *cmd.getCount(), cmd.isApproximateTrimming());
    }

    static std::string group(RedisConnection &c, const GroupCommand &cmd) {
      switch (cmd.getAction()) {
        case GroupCommand::GroupCommandAction::CREATE:
          return c.xGroupCreate(cmd.requireKey(), cmd.getGroupName(), cmd.getReadOffset(), cmd.isMkStream());
        case GroupCommand::GroupCommandAction::DESTROY:
          return c.xGroupDestroy(cmd.requireKey(), cmd.getGroupName()) ? "OK" : "Error";
        case GroupCommand::GroupCommandAction::DELETE_CONSUMER:
          return c.xGroupDelConsumer(cmd.requireKey(),
                                     Consumer::from(cmd.getGroupName(), cmd.getConsumerName().value_or("")))
                     ? "OK"
                     : "Error";
      }
      throw std::invalid_argument("Unknown group command action");
    }

    static PendingMessages pending(RedisConnection &c, const PendingRecordsCommand &cmd) {
      return c.xPending(cmd.requireKey(), cmd.getGroupName(), cmd.getOptions());
    }

    static Records claim(RedisConnection &c, const XClaimCommand &cmd) {
      return c.xClaim(cmd.requireKey(), cmd.getGroupName(), cmd.getNewOwner(), cmd.getOptions());
    }
  };

  /**
   * @brief Hash commands returning futures
   *
   */
  class ReactiveHashCommands {
   public:
    explicit ReactiveHashCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<HSetCommand, bool>>> hSet(std::vector<HSetCommand> commands);
    std::future<std::vector<CommandResponse<HGetCommand, std::vector<std::optional<std::string>>>>> hMGet(
        std::vector<HGetCommand> commands);
    std::future<std::vector<CommandResponse<HExistsCommand, bool>>> hExists(std::vector<HExistsCommand> commands);
    std::future<std::vector<CommandResponse<HDelCommand, long long>>> hDel(std::vector<HDelCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, long long>>> hLen(std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>> hKeys(
        std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>> hVals(
        std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, KeyValues>>> hGetAll(std::vector<KeyCommand> commands);

    std::future<bool> hSet(std::string_view key, std::string_view field, std::string_view value);
    std::future<bool> hSetNX(std::string_view key, std::string_view field, std::string_view value);
    std::future<void> hMSet(std::string_view key, KeyValues fieldValues);
    std::future<std::optional<std::string>> hGet(std::string_view key, std::string_view field);
    std::future<std::vector<std::optional<std::string>>> hMGet(std::string_view key, Keys fields);
    std::future<bool> hExists(std::string_view key, std::string_view field);
    std::future<long long> hDel(std::string_view key, Keys fields);
    std::future<long long> hLen(std::string_view key);
    std::future<std::vector<std::string>> hKeys(std::string_view key);
    std::future<std::vector<std::string>> hVals(std::string_view key);
    std::future<KeyValues> hGetAll(std::string_view key);

   private:
    ReactiveRedisConnection &owner;

    /**
     * @brief A single field uses `HSET`/`HSETNX`; several fields use `HMSET`, which only supports upsert
     *
     */
    static bool set(RedisConnection &c, const HSetCommand &cmd) {
      const auto &entries = cmd.getFieldValueMap();
      if (entries.size() == 1) {
        const auto &[field, value] = entries.front();
        return cmd.isUpsert() ? c.hSet(cmd.requireKey(), field, value) : c.hSetNX(cmd.requireKey(), field, value);
      }
      if (!cmd.isUpsert()) throw std::invalid_argument("Multi-field HSETNX is not supported");
      c.hMSet(cmd.requireKey(), entries);
      return true;
    }

    static std::vector<std::optional<std::string>> get(RedisConnection &c, const HGetCommand &cmd) {
      return c.hMGet(cmd.requireKey(), cmd.getFields());
    }

    static bool exists(RedisConnection &c, const HExistsCommand &cmd) {
      return c.hExists(cmd.requireKey(), cmd.getField());
    }

    static long long remove(RedisConnection &c, const HDelCommand &cmd) {
      return c.hDel(cmd.requireKey(), cmd.getFields());
    }
  };

  /**
   * @brief Set commands returning futures
   *
   */
  class ReactiveSetCommands {
   public:
    explicit ReactiveSetCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<SAddCommand, long long>>> sAdd(std::vector<SAddCommand> commands);
    std::future<std::vector<CommandResponse<SRemCommand, long long>>> sRem(std::vector<SRemCommand> commands);
    std::future<std::vector<CommandResponse<SIsMemberCommand, bool>>> sIsMember(
        std::vector<SIsMemberCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, long long>>> sCard(std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>> sMembers(
        std::vector<KeyCommand> commands);

    std::future<long long> sAdd(std::string_view key, Values values);
    std::future<long long> sRem(std::string_view key, Values values);
    std::future<std::optional<std::string>> sPop(std::string_view key);
    std::future<long long> sCard(std::string_view key);
    std::future<bool> sIsMember(std::string_view key, std::string_view value);
    std::future<std::vector<std::string>> sMembers(std::string_view key);

   private:
    ReactiveRedisConnection &owner;

    static long long add(RedisConnection &c, const SAddCommand &cmd) {
      return c.sAdd(cmd.requireKey(), cmd.getValues());
    }

    static long long remove(RedisConnection &c, const SRemCommand &cmd) {
      return c.sRem(cmd.requireKey(), cmd.getValues());
    }

    static bool isMember(RedisConnection &c, const SIsMemberCommand &cmd) {
      return c.sIsMember(cmd.requireKey(), cmd.getValue());
    }
  };

  /**
   * @brief Key commands returning futures
   *
   */
  class ReactiveKeyCommands {
   public:
    explicit ReactiveKeyCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<KeyCommand, bool>>> exists(std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, long long>>> del(std::vector<KeyCommand> commands);

    std::future<bool> exists(std::string_view key);
    std::future<long long> del(std::string_view key);
    std::future<long long> del(Keys keys);
    std::future<bool> expire(std::string_view key, std::chrono::seconds timeout);
    std::future<long long> ttl(std::string_view key);

   private:
    ReactiveRedisConnection &owner;
  };

  /**
   * @brief String commands returning futures
   *
   */
  class ReactiveStringCommands {
   public:
    explicit ReactiveStringCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<KeyCommand, std::optional<std::string>>>> get(
        std::vector<KeyCommand> commands);
    std::future<std::vector<CommandResponse<SetCommand, bool>>> set(std::vector<SetCommand> commands);
    std::future<std::vector<CommandResponse<MGetCommand, std::vector<std::optional<std::string>>>>> mGet(
        std::vector<MGetCommand> commands);

    std::future<std::optional<std::string>> get(std::string_view key);
    std::future<bool> set(std::string_view key, std::string_view value);
    std::future<bool> set(std::string_view key, std::string_view value, Expiration expiration, SetOption option);
    std::future<std::vector<std::optional<std::string>>> mGet(Keys keys);

   private:
    ReactiveRedisConnection &owner;

    static bool set(RedisConnection &c, const SetCommand &cmd) {
      if (!cmd.getValue().has_value()) throw std::invalid_argument("Value must not be null");
      return c.set(cmd.requireKey(), *cmd.getValue(), cmd.getExpiration(), cmd.getOption());
    }
  };

  /**
   * @brief List commands returning futures
   *
   */
  class ReactiveListCommands {
   public:
    explicit ReactiveListCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<PushCommand, long long>>> push(std::vector<PushCommand> commands);
    std::future<std::vector<CommandResponse<PopCommand, std::optional<std::string>>>> pop(
        std::vector<PopCommand> commands);
    std::future<std::vector<CommandResponse<IndexRangeCommand, std::vector<std::string>>>> lRange(
        std::vector<IndexRangeCommand> commands);
    std::future<std::vector<CommandResponse<KeyCommand, long long>>> lLen(std::vector<KeyCommand> commands);

    std::future<long long> rPush(std::string_view key, Values values);
    std::future<long long> lPush(std::string_view key, Values values);
    std::future<std::optional<std::string>> lPop(std::string_view key);
    std::future<std::optional<std::string>> rPop(std::string_view key);
    std::future<std::vector<std::string>> lRange(std::string_view key, long long start, long long end);
    std::future<long long> lLen(std::string_view key);
    std::future<std::optional<std::string>> lIndex(std::string_view key, long long index);
    std::future<void> lTrim(std::string_view key, long long start, long long end);

   private:
    ReactiveRedisConnection &owner;

    static long long push(RedisConnection &c, const PushCommand &cmd) {
      if (cmd.getValues().empty()) throw std::invalid_argument("At least one value is required");
      if (cmd.getDirection() == PushCommand::Direction::LEFT) return c.lPush(cmd.requireKey(), cmd.getValues());
      return c.rPush(cmd.requireKey(), cmd.getValues());
    }

    static std::optional<std::string> pop(RedisConnection &c, const PopCommand &cmd) {
      if (cmd.getDirection() == PushCommand::Direction::LEFT) return c.lPop(cmd.requireKey());
      return c.rPop(cmd.requireKey());
    }

    static std::vector<std::string> range(RedisConnection &c, const IndexRangeCommand &cmd) {
      return c.lRange(cmd.requireKey(), cmd.getStart(), cmd.getEnd());
    }
  };

  /**
   * @brief Sorted set commands returning futures
   *
   */
  class ReactiveZSetCommands {
   public:
    explicit ReactiveZSetCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<ZAddCommand, long long>>> zAdd(std::vector<ZAddCommand> commands);
    std::future<std::vector<CommandResponse<ZRemCommand, long long>>> zRem(std::vector<ZRemCommand> commands);
    std::future<std::vector<CommandResponse<ZIncrByCommand, double>>> zIncrBy(std::vector<ZIncrByCommand> commands);
    std::future<std::vector<CommandResponse<IndexRangeCommand, std::vector<Tuple>>>> zRangeWithScores(
        std::vector<IndexRangeCommand> commands);
    std::future<std::vector<CommandResponse<ZRangeByScoreCommand, std::vector<std::string>>>> zRangeByScore(
        std::vector<ZRangeByScoreCommand> commands);

    std::future<bool> zAdd(std::string_view key, double score, std::string_view value);
    std::future<long long> zAdd(std::string_view key, std::vector<Tuple> tuples, ZAddFlag flag = ZAddFlag::NONE);
    std::future<long long> zRem(std::string_view key, Values values);
    std::future<double> zIncrBy(std::string_view key, double increment, std::string_view value);
    std::future<std::optional<double>> zScore(std::string_view key, std::string_view value);
    std::future<std::optional<long long>> zRank(std::string_view key, std::string_view value);
    std::future<long long> zCard(std::string_view key);
    std::future<std::vector<std::string>> zRange(std::string_view key, long long start, long long end);
    std::future<std::vector<Tuple>> zRangeWithScores(std::string_view key, long long start, long long end);
    std::future<std::vector<std::string>> zRangeByScore(std::string_view key, Range<double> range,
                                                       Limit limit = Limit::unlimited());

   private:
    ReactiveRedisConnection &owner;

    static long long add(RedisConnection &c, const ZAddCommand &cmd) {
      return c.zAdd(cmd.requireKey(), cmd.getTuples(), cmd.getFlag());
    }

    static long long remove(RedisConnection &c, const ZRemCommand &cmd) {
      return c.zRem(cmd.requireKey(), cmd.getValues());
    }

    static double incrBy(RedisConnection &c, const ZIncrByCommand &cmd) {
      return c.zIncrBy(cmd.requireKey(), cmd.getIncrement(), cmd.getValue());
    }

    static std::vector<std::string> rangeByScore(RedisConnection &c, const ZRangeByScoreCommand &cmd) {
      return c.zRangeByScore(cmd.requireKey(), cmd.getRange(), cmd.getLimit());
    }
  };

  /**
   * @brief Counters stored as strings, returning futures
   *
   */
  class ReactiveNumberCommands {
   public:
    explicit ReactiveNumberCommands(ReactiveRedisConnection &owner_) : owner{owner_} {}

    std::future<std::vector<CommandResponse<IncrByCommand<long long>, long long>>> incrBy(
        std::vector<IncrByCommand<long long>> commands);
    std::future<std::vector<CommandResponse<IncrByCommand<double>, double>>> incrByFloat(
        std::vector<IncrByCommand<double>> commands);
    std::future<std::vector<CommandResponse<IncrByCommand<long long>, long long>>> decrBy(
        std::vector<IncrByCommand<long long>> commands);

    std::future<long long> incr(std::string_view key);
    std::future<long long> incrBy(std::string_view key, long long value);
    std::future<double> incrByFloat(std::string_view key, double value);
    std::future<long long> decr(std::string_view key);
    std::future<long long> decrBy(std::string_view key, long long value);

   private:
    ReactiveRedisConnection &owner;

    static long long incrBy(RedisConnection &c, const IncrByCommand<long long> &cmd) {
      return c.incrBy(cmd.requireKey(), cmd.requireValue());
    }

    static double incrByFloat(RedisConnection &c, const IncrByCommand<double> &cmd) {
      return c.incrByFloat(cmd.requireKey(), cmd.requireValue());
    }

    static long long decrBy(RedisConnection &c, const IncrByCommand<long long> &cmd) {
      return c.decrBy(cmd.requireKey(), cmd.requireValue());
    }
  };

  /**
   * @class ReactiveRedisConnection
   *
   * @brief Asynchronous front end of a `RedisConnection`
   *
   * @details The connection is owned by a single worker thread; every command submitted through one of the
   * command groups is queued and run on that thread in submission order, and its `std::future` becomes ready
   * once the command completes. A command that throws completes its future with the exception and the worker
   * carries on with the next one.
   *
   * `close()` lets the command currently running finish, fails every command still queued with `RedisError`
   * and closes the underlying connection. It may be called from a submitted command too. The destructor calls
   * `close()`.
   *
   */
  class ReactiveRedisConnection {
   public:
    explicit ReactiveRedisConnection(std::unique_ptr<RedisConnection> connection_)
        : connection{std::move(connection_)} {
      if (!connection) throw std::invalid_argument("RedisConnection must not be null");
      worker = std::jthread([this] { run(); });
      log()->debug("reactive connection worker started");
    }

    ReactiveRedisConnection(const ReactiveRedisConnection &) = delete;
    ReactiveRedisConnection &operator=(const ReactiveRedisConnection &) = delete;

    ~ReactiveRedisConnection() {
      try {
        close();
      } catch (const std::exception &e) {
        log()->warn("error while closing reactive connection: {}", e.what());
      }
    }

    ReactiveStreamCommands &streamCommands() noexcept { return streams; }
    ReactiveHashCommands &hashCommands() noexcept { return hashes; }
    ReactiveSetCommands &setCommands() noexcept { return sets; }
    ReactiveKeyCommands &keyCommands() noexcept { return keys; }
    ReactiveStringCommands &stringCommands() noexcept { return strings; }
    ReactiveListCommands &listCommands() noexcept { return lists; }
    ReactiveZSetCommands &zSetCommands() noexcept { return zSets; }
    ReactiveNumberCommands &numberCommands() noexcept { return numbers; }

    /**
     * @brief Queue `fn(connection)` for the worker thread
     *
     * @return A future for the value `fn` returns. If the connection is closed already, the future holds a
     * `ConnectionError`.
     *
     */
    template <typename Fn>
    auto submit(Fn &&fn) -> std::future<std::invoke_result_t<std::decay_t<Fn> &, RedisConnection &>> {
      using Result = std::invoke_result_t<std::decay_t<Fn> &, RedisConnection &>;
      auto promise = std::make_shared<std::promise<Result>>();
      auto future = promise->get_future();

      Task task{[promise, fn = std::forward<Fn>(fn)](RedisConnection &conn) mutable {
                  try {
                    if constexpr (std::is_void_v<Result>) {
                      fn(conn);
                      promise->set_value();
                    } else {
                      promise->set_value(fn(conn));
                    }
                  } catch (...) {
                    promise->set_exception(std::current_exception());
                  }
                },
                [promise](std::exception_ptr error) { promise->set_exception(error); }};

      {
        auto lock = std::scoped_lock(queueMutex);
        if (closed) {
          promise->set_exception(std::make_exception_ptr(ConnectionError("Connection is closed")));
          return future;
        }
        tasks.push_back(std::move(task));
      }
      queueCondition.notify_one();
      return future;
    }

    /**
     * @brief Stop the worker, fail every queued command and close the connection
     *
     */
    void close() {
      std::deque<Task> abandoned;
      {
        auto lock = std::scoped_lock(queueMutex);
        if (closed) return;
        closed = true;
        abandoned.swap(tasks);
      }
      queueCondition.notify_all();
      // a command closing its own connection runs on the worker, which stops once that command returns
      if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) worker.join();

      if (!abandoned.empty()) log()->warn("reactive connection closed with {} pending commands", abandoned.size());
      for (auto &task : abandoned) {
        task.fail(std::make_exception_ptr(RedisError("Connection closed before the command was executed")));
      }
      connection->close();
      log()->debug("reactive connection closed");
    }

    [[nodiscard]] bool isClosed() const {
      auto lock = std::scoped_lock(queueMutex);
      return closed;
    }

    /**
     * @brief The number of commands waiting for the worker
     *
     */
    [[nodiscard]] std::size_t pending() const {
      auto lock = std::scoped_lock(queueMutex);
      return tasks.size();
    }

   private:
    struct Task {
      std::function<void(RedisConnection &)> run;
      std::function<void(std::exception_ptr)> fail;
    };

    std::unique_ptr<RedisConnection> connection;
    mutable std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::deque<Task> tasks;
    bool closed{false};

    ReactiveStreamCommands streams{*this};
    ReactiveHashCommands hashes{*this};
    ReactiveSetCommands sets{*this};
    ReactiveKeyCommands keys{*this};
    ReactiveStringCommands strings{*this};
    ReactiveListCommands lists{*this};
    ReactiveZSetCommands zSets{*this};
    ReactiveNumberCommands numbers{*this};

    std::jthread worker;

    void run() {
      while (true) {
        Task task;
        {
          auto lock = std::unique_lock(queueMutex);
          queueCondition.wait(lock, [this] { return closed || !tasks.empty(); });
          if (closed) break;
          task = std::move(tasks.front());
          tasks.pop_front();
        }
        task.run(*connection);
      }
    }
  };

  namespace Reactive {

    /**
     * @brief Run every command object on the worker as one task, pairing each with its result
     *
     */
    template <typename Cmd, typename Fn>
    auto forEach(ReactiveRedisConnection &owner, std::vector<Cmd> commands, Fn fn) {
      using Out = std::invoke_result_t<Fn &, RedisConnection &, const Cmd &>;
      return owner.submit([commands = std::move(commands), fn](RedisConnection &c) {
        std::vector<CommandResponse<Cmd, Out>> responses;
        responses.reserve(commands.size());
        for (const auto &cmd : commands) responses.emplace_back(cmd, fn(c, cmd));
        return responses;
      });
    }

    template <typename Cmd, typename Fn>
    auto single(ReactiveRedisConnection &owner, Cmd command, Fn fn) {
      return owner.submit([command = std::move(command), fn](RedisConnection &c) { return fn(c, command); });
    }
  };  // namespace Reactive

  /*
   * ReactiveStreamCommands
   */

  inline std::future<std::vector<CommandResponse<AcknowledgeCommand, long long>>> ReactiveStreamCommands::xAck(
      std::vector<AcknowledgeCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), ack);
  }

  inline std::future<std::vector<CommandResponse<AddStreamRecord, RecordId>>> ReactiveStreamCommands::xAdd(
      std::vector<AddStreamRecord> commands) {
    return Reactive::forEach(owner, std::move(commands), add);
  }

  inline std::future<std::vector<CommandResponse<DeleteCommand, long long>>> ReactiveStreamCommands::xDel(
      std::vector<DeleteCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), remove);
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, long long>>> ReactiveStreamCommands::xLen(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), length);
  }

  inline std::future<std::vector<CommandResponse<RangeCommand, ReactiveStreamCommands::Records>>>
  ReactiveStreamCommands::xRange(std::vector<RangeCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), range);
  }

  inline std::future<std::vector<CommandResponse<RangeCommand, ReactiveStreamCommands::Records>>>
  ReactiveStreamCommands::xRevRange(std::vector<RangeCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), revRange);
  }

  inline std::future<std::vector<CommandResponse<ReadCommand, ReactiveStreamCommands::Records>>>
  ReactiveStreamCommands::read(std::vector<ReadCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), readStreams);
  }

  inline std::future<std::vector<CommandResponse<TrimCommand, long long>>> ReactiveStreamCommands::xTrim(
      std::vector<TrimCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), trim);
  }

  inline std::future<std::vector<CommandResponse<GroupCommand, std::string>>> ReactiveStreamCommands::xGroup(
      std::vector<GroupCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), group);
  }

  inline std::future<std::vector<CommandResponse<PendingRecordsCommand, PendingMessages>>>
  ReactiveStreamCommands::xPending(std::vector<PendingRecordsCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), pending);
  }

  inline std::future<std::vector<CommandResponse<XClaimCommand, ReactiveStreamCommands::Records>>>
  ReactiveStreamCommands::xClaim(std::vector<XClaimCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), claim);
  }

  inline std::future<long long> ReactiveStreamCommands::xAck(std::string_view key, std::string_view group,
                                                             std::vector<RecordId> recordIds) {
    return Reactive::single(owner, AcknowledgeCommand::stream(key).inGroup(group).forRecords(std::move(recordIds)),
                            ack);
  }

  inline std::future<RecordId> ReactiveStreamCommands::xAdd(ByteRecord record) {
    return Reactive::single(owner, AddStreamRecord::of(std::move(record)), add);
  }

  inline std::future<RecordId> ReactiveStreamCommands::xAdd(std::string_view key, ByteRecord::Fields body) {
    return Reactive::single(owner, AddStreamRecord::body(std::move(body)).to(key), add);
  }

  inline std::future<long long> ReactiveStreamCommands::xDel(std::string_view key, std::vector<RecordId> recordIds) {
    return Reactive::single(owner, DeleteCommand::stream(key).records(std::move(recordIds)), remove);
  }

  inline std::future<long long> ReactiveStreamCommands::xLen(std::string_view key) {
    return Reactive::single(owner, KeyCommand(key), length);
  }

  inline std::future<ReactiveStreamCommands::Records> ReactiveStreamCommands::xRange(std::string_view key,
                                                                                     Range<std::string> range_,
                                                                                     Limit limit) {
    return Reactive::single(owner, RangeCommand::stream(key).within(std::move(range_)).limit(limit), range);
  }

  inline std::future<ReactiveStreamCommands::Records> ReactiveStreamCommands::xRevRange(std::string_view key,
                                                                                        Range<std::string> range_,
                                                                                        Limit limit) {
    return Reactive::single(owner, RangeCommand::stream(key).within(std::move(range_)).limit(limit), revRange);
  }

  inline std::future<ReactiveStreamCommands::Records> ReactiveStreamCommands::xRead(
      StreamReadOptions readOptions, std::vector<StreamOffset> streams) {
    return Reactive::single(owner, ReadCommand::from(std::move(streams)).withOptions(std::move(readOptions)),
                            readStreams);
  }

  inline std::future<ReactiveStreamCommands::Records> ReactiveStreamCommands::xReadGroup(
      Consumer consumer, StreamReadOptions readOptions, std::vector<StreamOffset> streams) {
    return Reactive::single(
        owner, ReadCommand::from(std::move(streams)).as(std::move(consumer)).withOptions(std::move(readOptions)),
        readStreams);
  }

  inline std::future<long long> ReactiveStreamCommands::xTrim(std::string_view key, long long count,
                                                              bool approximateTrimming) {
    return Reactive::single(owner, TrimCommand::stream(key).to(count).approximate(approximateTrimming), trim);
  }

  inline std::future<std::string> ReactiveStreamCommands::xGroupCreate(std::string_view key, std::string_view group_,
                                                                       ReadOffset readOffset, bool mkStream) {
    return Reactive::single(
        owner, GroupCommand::createGroup(group_).forStream(key).at(std::move(readOffset)).makeStream(mkStream), group);
  }

  inline std::future<std::string> ReactiveStreamCommands::xGroupDestroy(std::string_view key,
                                                                        std::string_view group_) {
    return Reactive::single(owner, GroupCommand::destroyGroup(group_).forStream(key), group);
  }

  inline std::future<std::string> ReactiveStreamCommands::xGroupDelConsumer(std::string_view key, Consumer consumer) {
    return Reactive::single(owner, GroupCommand::deleteConsumer(consumer).forStream(key), group);
  }

  inline std::future<PendingMessagesSummary> ReactiveStreamCommands::xPending(std::string_view key,
                                                                              std::string_view group_) {
    return owner.submit([key = std::string(key), group_ = std::string(group_)](RedisConnection &c) {
      return c.xPending(key, group_);
    });
  }

  inline std::future<PendingMessages> ReactiveStreamCommands::xPending(std::string_view key, std::string_view group_,
                                                                       XPendingOptions options) {
    return owner.submit([key = std::string(key), group_ = std::string(group_),
                         options = std::move(options)](RedisConnection &c) { return c.xPending(key, group_, options); });
  }

  inline std::future<ReactiveStreamCommands::Records> ReactiveStreamCommands::xClaim(std::string_view key,
                                                                                     std::string_view group_,
                                                                                     std::string_view newOwner,
                                                                                     XClaimOptions options) {
    return Reactive::single(owner, XClaimCommand(key, group_, newOwner, std::move(options)), claim);
  }

  /*
   * ReactiveHashCommands
   */

  inline std::future<std::vector<CommandResponse<HSetCommand, bool>>> ReactiveHashCommands::hSet(
      std::vector<HSetCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), set);
  }

  inline std::future<std::vector<CommandResponse<HGetCommand, std::vector<std::optional<std::string>>>>>
  ReactiveHashCommands::hMGet(std::vector<HGetCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), get);
  }

  inline std::future<std::vector<CommandResponse<HExistsCommand, bool>>> ReactiveHashCommands::hExists(
      std::vector<HExistsCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), exists);
  }

  inline std::future<std::vector<CommandResponse<HDelCommand, long long>>> ReactiveHashCommands::hDel(
      std::vector<HDelCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), remove);
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, long long>>> ReactiveHashCommands::hLen(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.hLen(cmd.requireKey()); });
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>> ReactiveHashCommands::hKeys(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.hKeys(cmd.requireKey()); });
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>> ReactiveHashCommands::hVals(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.hVals(cmd.requireKey()); });
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, KeyValues>>> ReactiveHashCommands::hGetAll(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.hGetAll(cmd.requireKey()); });
  }

  inline std::future<bool> ReactiveHashCommands::hSet(std::string_view key, std::string_view field,
                                                      std::string_view value) {
    return Reactive::single(owner, HSetCommand::value(field, value).forKey(key), set);
  }

  inline std::future<bool> ReactiveHashCommands::hSetNX(std::string_view key, std::string_view field,
                                                        std::string_view value) {
    return Reactive::single(owner, HSetCommand::value(field, value).forKey(key).ifValueNotExists(), set);
  }

  inline std::future<void> ReactiveHashCommands::hMSet(std::string_view key, KeyValues fieldValues) {
    auto command = HSetCommand::fieldValues(std::move(fieldValues)).forKey(key);
    return owner.submit([command = std::move(command)](RedisConnection &c) {
      c.hMSet(command.requireKey(), command.getFieldValueMap());
    });
  }

  inline std::future<std::optional<std::string>> ReactiveHashCommands::hGet(std::string_view key,
                                                                           std::string_view field) {
    return Reactive::single(owner, HGetCommand::field(field).from(key),
                            [](RedisConnection &c, const HGetCommand &cmd) {
                              return c.hGet(cmd.requireKey(), cmd.getFields().front());
                            });
  }

  inline std::future<std::vector<std::optional<std::string>>> ReactiveHashCommands::hMGet(std::string_view key,
                                                                                         Keys fields) {
    return Reactive::single(owner, HGetCommand::fields(std::move(fields)).from(key), get);
  }

  inline std::future<bool> ReactiveHashCommands::hExists(std::string_view key, std::string_view field) {
    return Reactive::single(owner, HExistsCommand::field(field).in(key), exists);
  }

  inline std::future<long long> ReactiveHashCommands::hDel(std::string_view key, Keys fields) {
    return Reactive::single(owner, HDelCommand::fields(std::move(fields)).from(key), remove);
  }

  inline std::future<long long> ReactiveHashCommands::hLen(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.hLen(key); });
  }

  inline std::future<std::vector<std::string>> ReactiveHashCommands::hKeys(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.hKeys(key); });
  }

  inline std::future<std::vector<std::string>> ReactiveHashCommands::hVals(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.hVals(key); });
  }

  inline std::future<KeyValues> ReactiveHashCommands::hGetAll(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.hGetAll(key); });
  }

  /*
   * ReactiveSetCommands
   */

  inline std::future<std::vector<CommandResponse<SAddCommand, long long>>> ReactiveSetCommands::sAdd(
      std::vector<SAddCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), add);
  }

  inline std::future<std::vector<CommandResponse<SRemCommand, long long>>> ReactiveSetCommands::sRem(
      std::vector<SRemCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), remove);
  }

  inline std::future<std::vector<CommandResponse<SIsMemberCommand, bool>>> ReactiveSetCommands::sIsMember(
      std::vector<SIsMemberCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), isMember);
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, long long>>> ReactiveSetCommands::sCard(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.sCard(cmd.requireKey()); });
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, std::vector<std::string>>>>
  ReactiveSetCommands::sMembers(std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.sMembers(cmd.requireKey()); });
  }

  inline std::future<long long> ReactiveSetCommands::sAdd(std::string_view key, Values values) {
    return Reactive::single(owner, SAddCommand::values(std::move(values)).to(key), add);
  }

  inline std::future<long long> ReactiveSetCommands::sRem(std::string_view key, Values values) {
    return Reactive::single(owner, SRemCommand::values(std::move(values)).from(key), remove);
  }

  inline std::future<std::optional<std::string>> ReactiveSetCommands::sPop(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.sPop(key); });
  }

  inline std::future<long long> ReactiveSetCommands::sCard(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.sCard(key); });
  }

  inline std::future<bool> ReactiveSetCommands::sIsMember(std::string_view key, std::string_view value) {
    return Reactive::single(owner, SIsMemberCommand::value(value).of(key), isMember);
  }

  inline std::future<std::vector<std::string>> ReactiveSetCommands::sMembers(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.sMembers(key); });
  }

  /*
   * ReactiveKeyCommands
   */

  inline std::future<std::vector<CommandResponse<KeyCommand, bool>>> ReactiveKeyCommands::exists(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const KeyCommand &cmd) {
      return c.exists(Keys{cmd.requireKey()}) > 0;
    });
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, long long>>> ReactiveKeyCommands::del(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.del(Keys{cmd.requireKey()}); });
  }

  inline std::future<bool> ReactiveKeyCommands::exists(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.exists(Keys{key}) > 0; });
  }

  inline std::future<long long> ReactiveKeyCommands::del(std::string_view key) { return del(Keys{std::string(key)}); }

  inline std::future<long long> ReactiveKeyCommands::del(Keys keys) {
    if (keys.empty()) throw std::invalid_argument("At least one key is required");
    return owner.submit([keys = std::move(keys)](RedisConnection &c) { return c.del(keys); });
  }

  inline std::future<bool> ReactiveKeyCommands::expire(std::string_view key, std::chrono::seconds timeout) {
    return owner.submit(
        [key = std::string(key), timeout](RedisConnection &c) { return c.expire(key, timeout.count()); });
  }

  inline std::future<long long> ReactiveKeyCommands::ttl(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.ttl(key); });
  }

  /*
   * ReactiveStringCommands
   */

  inline std::future<std::vector<CommandResponse<KeyCommand, std::optional<std::string>>>>
  ReactiveStringCommands::get(std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.get(cmd.requireKey()); });
  }

  inline std::future<std::vector<CommandResponse<SetCommand, bool>>> ReactiveStringCommands::set(
      std::vector<SetCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const SetCommand &cmd) {
      return ReactiveStringCommands::set(c, cmd);
    });
  }

  inline std::future<std::vector<CommandResponse<MGetCommand, std::vector<std::optional<std::string>>>>>
  ReactiveStringCommands::mGet(std::vector<MGetCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const MGetCommand &cmd) { return c.mGet(cmd.getKeys()); });
  }

  inline std::future<std::optional<std::string>> ReactiveStringCommands::get(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.get(key); });
  }

  inline std::future<bool> ReactiveStringCommands::set(std::string_view key, std::string_view value) {
    return set(key, value, Expiration::persistent(), SetOption::UPSERT);
  }

  inline std::future<bool> ReactiveStringCommands::set(std::string_view key, std::string_view value,
                                                       Expiration expiration, SetOption option) {
    auto command = SetCommand::set(key).value(value).expiring(expiration).withSetOption(option);
    return owner.submit(
        [command = std::move(command)](RedisConnection &c) { return ReactiveStringCommands::set(c, command); });
  }

  inline std::future<std::vector<std::optional<std::string>>> ReactiveStringCommands::mGet(Keys keys) {
    return Reactive::single(owner, MGetCommand(std::move(keys)),
                            [](RedisConnection &c, const MGetCommand &cmd) { return c.mGet(cmd.getKeys()); });
  }

  /*
   * ReactiveListCommands
   */

  inline std::future<std::vector<CommandResponse<PushCommand, long long>>> ReactiveListCommands::push(
      std::vector<PushCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const PushCommand &cmd) { return ReactiveListCommands::push(c, cmd); });
  }

  inline std::future<std::vector<CommandResponse<PopCommand, std::optional<std::string>>>> ReactiveListCommands::pop(
      std::vector<PopCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const PopCommand &cmd) { return ReactiveListCommands::pop(c, cmd); });
  }

  inline std::future<std::vector<CommandResponse<IndexRangeCommand, std::vector<std::string>>>>
  ReactiveListCommands::lRange(std::vector<IndexRangeCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), range);
  }

  inline std::future<std::vector<CommandResponse<KeyCommand, long long>>> ReactiveListCommands::lLen(
      std::vector<KeyCommand> commands) {
    return Reactive::forEach(owner, std::move(commands),
                             [](RedisConnection &c, const KeyCommand &cmd) { return c.lLen(cmd.requireKey()); });
  }

  inline std::future<long long> ReactiveListCommands::rPush(std::string_view key, Values values) {
    return Reactive::single(owner, PushCommand::right().values(std::move(values)).to(key),
                            [](RedisConnection &c, const PushCommand &cmd) { return ReactiveListCommands::push(c, cmd); });
  }

  inline std::future<long long> ReactiveListCommands::lPush(std::string_view key, Values values) {
    return Reactive::single(owner, PushCommand::left().values(std::move(values)).to(key),
                            [](RedisConnection &c, const PushCommand &cmd) { return ReactiveListCommands::push(c, cmd); });
  }

  inline std::future<std::optional<std::string>> ReactiveListCommands::lPop(std::string_view key) {
    return Reactive::single(owner, PopCommand::left().from(key),
                            [](RedisConnection &c, const PopCommand &cmd) { return ReactiveListCommands::pop(c, cmd); });
  }

  inline std::future<std::optional<std::string>> ReactiveListCommands::rPop(std::string_view key) {
    return Reactive::single(owner, PopCommand::right().from(key),
                            [](RedisConnection &c, const PopCommand &cmd) { return ReactiveListCommands::pop(c, cmd); });
  }

  inline std::future<std::vector<std::string>> ReactiveListCommands::lRange(std::string_view key, long long start,
                                                                           long long end) {
    return Reactive::single(owner, IndexRangeCommand::of(key).fromIndex(start).toIndex(end), range);
  }

  inline std::future<long long> ReactiveListCommands::lLen(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.lLen(key); });
  }

  inline std::future<std::optional<std::string>> ReactiveListCommands::lIndex(std::string_view key, long long index) {
    return owner.submit([key = std::string(key), index](RedisConnection &c) { return c.lIndex(key, index); });
  }

  inline std::future<void> ReactiveListCommands::lTrim(std::string_view key, long long start, long long end) {
    return owner.submit([key = std::string(key), start, end](RedisConnection &c) { c.lTrim(key, start, end); });
  }

  /*
   * ReactiveZSetCommands
   */

  inline std::future<std::vector<CommandResponse<ZAddCommand, long long>>> ReactiveZSetCommands::zAdd(
      std::vector<ZAddCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), add);
  }

  inline std::future<std::vector<CommandResponse<ZRemCommand, long long>>> ReactiveZSetCommands::zRem(
      std::vector<ZRemCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), remove);
  }

  inline std::future<std::vector<CommandResponse<ZIncrByCommand, double>>> ReactiveZSetCommands::zIncrBy(
      std::vector<ZIncrByCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), incrBy);
  }

  inline std::future<std::vector<CommandResponse<IndexRangeCommand, std::vector<Tuple>>>>
  ReactiveZSetCommands::zRangeWithScores(std::vector<IndexRangeCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const IndexRangeCommand &cmd) {
      return c.zRangeWithScores(cmd.requireKey(), cmd.getStart(), cmd.getEnd());
    });
  }

  inline std::future<std::vector<CommandResponse<ZRangeByScoreCommand, std::vector<std::string>>>>
  ReactiveZSetCommands::zRangeByScore(std::vector<ZRangeByScoreCommand> commands) {
    return Reactive::forEach(owner, std::move(commands), rangeByScore);
  }

  inline std::future<bool> ReactiveZSetCommands::zAdd(std::string_view key, double score, std::string_view value) {
    return owner.submit([key = std::string(key), score, value = std::string(value)](RedisConnection &c) {
      return c.zAdd(key, score, value);
    });
  }

  inline std::future<long long> ReactiveZSetCommands::zAdd(std::string_view key, std::vector<Tuple> tuples,
                                                           ZAddFlag flag) {
    return Reactive::single(owner, ZAddCommand::tuples(std::move(tuples)).to(key).withFlag(flag), add);
  }

  inline std::future<long long> ReactiveZSetCommands::zRem(std::string_view key, Values values) {
    return Reactive::single(owner, ZRemCommand::values(std::move(values)).from(key), remove);
  }

  inline std::future<double> ReactiveZSetCommands::zIncrBy(std::string_view key, double increment,
                                                           std::string_view value) {
    return Reactive::single(owner, ZIncrByCommand::scoreOf(value).by(increment).storedWithin(key), incrBy);
  }

  inline std::future<std::optional<double>> ReactiveZSetCommands::zScore(std::string_view key, std::string_view value) {
    return owner.submit(
        [key = std::string(key), value = std::string(value)](RedisConnection &c) { return c.zScore(key, value); });
  }

  inline std::future<std::optional<long long>> ReactiveZSetCommands::zRank(std::string_view key,
                                                                          std::string_view value) {
    return owner.submit(
        [key = std::string(key), value = std::string(value)](RedisConnection &c) { return c.zRank(key, value); });
  }

  inline std::future<long long> ReactiveZSetCommands::zCard(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.zCard(key); });
  }

  inline std::future<std::vector<std::string>> ReactiveZSetCommands::zRange(std::string_view key, long long start,
                                                                           long long end) {
    return owner.submit(
        [key = std::string(key), start, end](RedisConnection &c) { return c.zRange(key, start, end); });
  }

  inline std::future<std::vector<Tuple>> ReactiveZSetCommands::zRangeWithScores(std::string_view key, long long start,
                                                                               long long end) {
    return owner.submit(
        [key = std::string(key), start, end](RedisConnection &c) { return c.zRangeWithScores(key, start, end); });
  }

  inline std::future<std::vector<std::string>> ReactiveZSetCommands::zRangeByScore(std::string_view key,
                                                                                  Range<double> range, Limit limit) {
    return Reactive::single(owner, ZRangeByScoreCommand::scoresWithin(std::move(range)).from(key).limitTo(limit),
                            rangeByScore);
  }

  /*
   * ReactiveNumberCommands
   */

  inline std::future<std::vector<CommandResponse<IncrByCommand<long long>, long long>>>
  ReactiveNumberCommands::incrBy(std::vector<IncrByCommand<long long>> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const IncrByCommand<long long> &cmd) {
      return ReactiveNumberCommands::incrBy(c, cmd);
    });
  }

  inline std::future<std::vector<CommandResponse<IncrByCommand<double>, double>>> ReactiveNumberCommands::incrByFloat(
      std::vector<IncrByCommand<double>> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const IncrByCommand<double> &cmd) {
      return ReactiveNumberCommands::incrByFloat(c, cmd);
    });
  }

  inline std::future<std::vector<CommandResponse<IncrByCommand<long long>, long long>>>
  ReactiveNumberCommands::decrBy(std::vector<IncrByCommand<long long>> commands) {
    return Reactive::forEach(owner, std::move(commands), [](RedisConnection &c, const IncrByCommand<long long> &cmd) {
      return ReactiveNumberCommands::decrBy(c, cmd);
    });
  }

  inline std::future<long long> ReactiveNumberCommands::incr(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.incr(key); });
  }

  inline std::future<long long> ReactiveNumberCommands::incrBy(std::string_view key, long long value) {
    return Reactive::single(owner, IncrByCommand<long long>::incr(key).by(value),
                            [](RedisConnection &c, const IncrByCommand<long long> &cmd) {
                              return ReactiveNumberCommands::incrBy(c, cmd);
                            });
  }

  inline std::future<double> ReactiveNumberCommands::incrByFloat(std::string_view key, double value) {
    return Reactive::single(owner, IncrByCommand<double>::incr(key).by(value),
                            [](RedisConnection &c, const IncrByCommand<double> &cmd) {
                              return ReactiveNumberCommands::incrByFloat(c, cmd);
                            });
  }

  inline std::future<long long> ReactiveNumberCommands::decr(std::string_view key) {
    return owner.submit([key = std::string(key)](RedisConnection &c) { return c.decr(key); });
  }

  inline std::future<long long> ReactiveNumberCommands::decrBy(std::string_view key, long long value) {
    return Reactive::single(owner, IncrByCommand<long long>::incr(key).by(value),
                            [](RedisConnection &c, const IncrByCommand<long long> &cmd) {
                              return ReactiveNumberCommands::decrBy(c, cmd);
                            });
  }
};  // namespace RedisConn
