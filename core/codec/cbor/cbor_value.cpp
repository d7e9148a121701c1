/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_value.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tc::codec::cbor {
  namespace {
    /// Floats ordered numerically, NaN after all numbers
    bool lessFloat(double l, double r) {
      if (std::isnan(l)) {
        return false;
      }
      if (std::isnan(r)) {
        return true;
      }
      return l < r;
    }

    bool equalFloat(double l, double r) {
      return !lessFloat(l, r) && !lessFloat(r, l);
    }

    /// Builds Value from any item, keeps tags
    class ValueBuilder : public CborVisitor {
     public:
      explicit ValueBuilder(Value &value) : value_{value} {}

      outcome::result<void> visitNull() override {
        value_ = Value{};
        return outcome::success();
      }

      outcome::result<void> visitBool(bool value) override {
        value_ = Value{value};
        return outcome::success();
      }

      outcome::result<void> visitUint(uint64_t value) override {
        OUTCOME_TRYA(value_, Value::fromUint(value));
        return outcome::success();
      }

      outcome::result<void> visitInt(int64_t value) override {
        value_ = Value{value};
        return outcome::success();
      }

      outcome::result<void> visitFloat(double value) override {
        value_ = Value{value};
        return outcome::success();
      }

      outcome::result<void> visitBytes(Bytes value) override {
        value_ = Value{std::move(value)};
        return outcome::success();
      }

      outcome::result<void> visitStr(std::string value) override {
        value_ = Value{std::move(value)};
        return outcome::success();
      }

      outcome::result<void> visitList(CborSeqAccess &list) override {
        Value::Array array;
        if (auto count{list.count()}) {
          array.reserve(std::min<uint64_t>(*count, kMaxReserve));
        }
        while (true) {
          OUTCOME_TRY(more, list.next());
          if (!more) {
            break;
          }
          Value item;
          ValueBuilder builder{item};
          OUTCOME_TRY(list.decoder().decodeAny(builder));
          array.push_back(std::move(item));
        }
        value_ = Value{std::move(array)};
        return outcome::success();
      }

      outcome::result<void> visitMap(CborSeqAccess &map) override {
        Value::Map entries;
        while (true) {
          OUTCOME_TRY(more, map.next());
          if (!more) {
            break;
          }
          Value key;
          ValueBuilder key_builder{key};
          OUTCOME_TRY(map.decoder().decodeAny(key_builder));
          Value item;
          ValueBuilder item_builder{item};
          OUTCOME_TRY(map.decoder().decodeAny(item_builder));
          entries.insert_or_assign(std::move(key), std::move(item));
        }
        value_ = Value{std::move(entries)};
        return outcome::success();
      }

      outcome::result<void> visitTag(uint64_t tag,
                                     CborDecoder &decoder) override {
        Value item;
        ValueBuilder builder{item};
        OUTCOME_TRY(decoder.decodeAny(builder));
        value_ = Value::tag(tag, std::move(item));
        return outcome::success();
      }

     private:
      Value &value_;
    };
  }  // namespace

  Value::Value() : variant_{Null{}} {}

  Value::Value(std::nullptr_t) : variant_{Null{}} {}

  Value::Value(bool value) : variant_{value} {}

  Value::Value(Integer value) : variant_{value} {}

  Value::Value(double value) : variant_{value} {}

  Value::Value(Bytes value) : variant_{std::move(value)} {}

  Value::Value(std::string value) : variant_{std::move(value)} {}

  Value::Value(const char *value) : variant_{std::string{value}} {}

  Value::Value(Array value) : variant_{std::move(value)} {}

  Value::Value(Map value) : variant_{std::move(value)} {}

  Value::Value(Tag value) : variant_{std::move(value)} {}

  outcome::result<Value> Value::fromUint(uint64_t value) {
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return CborDecodeError::kIntOverflow;
    }
    return Value{Integer{static_cast<int64_t>(value)}};
  }

  Value Value::tag(uint64_t number, Value value) {
    return Value{Tag{number, std::move(value)}};
  }

  Value::Kind Value::kind() const {
    return static_cast<Kind>(variant_.which());
  }

  bool Value::isNull() const {
    return kind() == Kind::kNull;
  }

  bool Value::isBool() const {
    return kind() == Kind::kBool;
  }

  bool Value::isInteger() const {
    return kind() == Kind::kInteger;
  }

  bool Value::isFloat() const {
    return kind() == Kind::kFloat;
  }

  bool Value::isBytes() const {
    return kind() == Kind::kBytes;
  }

  bool Value::isText() const {
    return kind() == Kind::kText;
  }

  bool Value::isArray() const {
    return kind() == Kind::kArray;
  }

  bool Value::isMap() const {
    return kind() == Kind::kMap;
  }

  bool Value::isTag() const {
    return kind() == Kind::kTag;
  }

  boost::optional<bool> Value::asBool() const {
    if (const auto *value{boost::get<bool>(&variant_)}) {
      return *value;
    }
    return boost::none;
  }

  boost::optional<int64_t> Value::asInteger() const {
    if (const auto *value{boost::get<Integer>(&variant_)}) {
      return value->value;
    }
    return boost::none;
  }

  boost::optional<double> Value::asFloat() const {
    if (const auto *value{boost::get<double>(&variant_)}) {
      return *value;
    }
    return boost::none;
  }

  const Bytes *Value::asBytes() const {
    return boost::get<Bytes>(&variant_);
  }

  const std::string *Value::asText() const {
    return boost::get<std::string>(&variant_);
  }

  const Value::Array *Value::asArray() const {
    return boost::get<Array>(&variant_);
  }

  Value::Array *Value::asArray() {
    return boost::get<Array>(&variant_);
  }

  const Value::Map *Value::asMap() const {
    return boost::get<Map>(&variant_);
  }

  Value::Map *Value::asMap() {
    return boost::get<Map>(&variant_);
  }

  const Value::Tag *Value::asTag() const {
    return boost::get<Tag>(&variant_);
  }

  bool operator==(const Value &l, const Value &r) {
    if (l.kind() != r.kind()) {
      return false;
    }
    switch (l.kind()) {
      case Value::Kind::kNull:
        return true;
      case Value::Kind::kBool:
        return *l.asBool() == *r.asBool();
      case Value::Kind::kInteger:
        return *l.asInteger() == *r.asInteger();
      case Value::Kind::kFloat:
        return equalFloat(*l.asFloat(), *r.asFloat());
      case Value::Kind::kBytes:
        return *l.asBytes() == *r.asBytes();
      case Value::Kind::kText:
        return *l.asText() == *r.asText();
      case Value::Kind::kArray:
        return *l.asArray() == *r.asArray();
      case Value::Kind::kMap:
        return *l.asMap() == *r.asMap();
      case Value::Kind::kTag:
        return *l.asTag() == *r.asTag();
    }
    return false;
  }

  bool operator<(const Value &l, const Value &r) {
    if (l.kind() != r.kind()) {
      return l.kind() < r.kind();
    }
    switch (l.kind()) {
      case Value::Kind::kNull:
        return false;
      case Value::Kind::kBool:
        return *l.asBool() < *r.asBool();
      case Value::Kind::kInteger:
        return *l.asInteger() < *r.asInteger();
      case Value::Kind::kFloat:
        return lessFloat(*l.asFloat(), *r.asFloat());
      case Value::Kind::kBytes:
        return *l.asBytes() < *r.asBytes();
      case Value::Kind::kText:
        return *l.asText() < *r.asText();
      case Value::Kind::kArray:
        return *l.asArray() < *r.asArray();
      case Value::Kind::kMap:
        return *l.asMap() < *r.asMap();
      case Value::Kind::kTag: {
        const auto &lt{*l.asTag()};
        const auto &rt{*r.asTag()};
        if (lt.number != rt.number) {
          return lt.number < rt.number;
        }
        return lt.value < rt.value;
      }
    }
    return false;
  }

  outcome::result<void> cborEncode(CborEncoder &e, const Value &value) {
    switch (value.kind()) {
      case Value::Kind::kNull:
        return e.writeNull();
      case Value::Kind::kBool:
        return e.writeBool(*value.asBool());
      case Value::Kind::kInteger:
        return e.writeInt(*value.asInteger());
      case Value::Kind::kFloat:
        return e.writeFloat64(*value.asFloat());
      case Value::Kind::kBytes:
        return e.writeBytes(*value.asBytes());
      case Value::Kind::kText:
        return e.writeStr(*value.asText());
      case Value::Kind::kArray:
        return e.encode(*value.asArray());
      case Value::Kind::kMap:
        return e.encode(*value.asMap());
      case Value::Kind::kTag: {
        const auto &tag{*value.asTag()};
        OUTCOME_TRY(e.writeTag(tag.number));
        return e.encode(tag.value);
      }
    }
    return CborEncodeError::kUnrepresentable;
  }

  outcome::result<void> cborDecode(CborDecoder &d, Value &value) {
    ValueBuilder builder{value};
    return d.decodeAny(builder);
  }
}  // namespace tc::codec::cbor
