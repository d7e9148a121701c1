/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "codec/cbor/cbor_shape.hpp"
#include "common/cmp.hpp"

namespace tc::codec::cbor {
  /**
   * Any CBOR item without static type.
   * Integers are signed 64-bit, floats are 64-bit.
   * Values are totally ordered: by kind first, then by payload.
   */
  class Value {
   public:
    enum class Kind {
      kNull,
      kBool,
      kInteger,
      kFloat,
      kBytes,
      kText,
      kArray,
      kMap,
      kTag,
    };

    struct Null {};
    struct Tag;
    using Array = std::vector<Value>;
    using Map = std::map<Value, Value>;

    Value();
    Value(std::nullptr_t);
    Value(bool value);
    Value(double value);
    Value(Bytes value);
    Value(std::string value);
    Value(const char *value);
    Value(Array value);
    Value(Map value);
    Value(Tag value);

    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T>
                                    && !std::is_same_v<T, bool>
                                    && sizeof(T) <= sizeof(int64_t)
                                    && !(std::is_unsigned_v<T>
                                         && sizeof(T) == sizeof(int64_t))>>
    Value(T value) : Value{Integer{static_cast<int64_t>(value)}} {}

    /** Checked construction from unsigned 64-bit integer */
    static outcome::result<Value> fromUint(uint64_t value);
    static Value tag(uint64_t number, Value value);

    Kind kind() const;

    bool isNull() const;
    bool isBool() const;
    bool isInteger() const;
    bool isFloat() const;
    bool isBytes() const;
    bool isText() const;
    bool isArray() const;
    bool isMap() const;
    bool isTag() const;

    boost::optional<bool> asBool() const;
    boost::optional<int64_t> asInteger() const;
    boost::optional<double> asFloat() const;
    const Bytes *asBytes() const;
    const std::string *asText() const;
    const Array *asArray() const;
    Array *asArray();
    const Map *asMap() const;
    Map *asMap();
    const Tag *asTag() const;

    friend bool operator==(const Value &l, const Value &r);
    friend bool operator<(const Value &l, const Value &r);

   private:
    struct Integer {
      int64_t value;
    };

    explicit Value(Integer value);

    using Variant = boost::variant<Null,
                                   bool,
                                   Integer,
                                   double,
                                   Bytes,
                                   std::string,
                                   boost::recursive_wrapper<Array>,
                                   boost::recursive_wrapper<Map>,
                                   boost::recursive_wrapper<Tag>>;

    Variant variant_;
  };

  /** Tag number and tagged item */
  struct Value::Tag {
    uint64_t number{};
    Value value;
  };

  TC_OPERATOR_NOT_EQUAL(Value)
  TC_OPERATOR_GREATER(Value)

  inline bool operator==(const Value::Tag &l, const Value::Tag &r) {
    return l.number == r.number && l.value == r.value;
  }
  TC_OPERATOR_NOT_EQUAL(Value::Tag)

  /** Tag is written back as tag framing */
  outcome::result<void> cborEncode(CborEncoder &e, const Value &value);
  /**
   * Decodes any item, capturing tags.
   * @return CborDecodeError::kIntOverflow for unsigned integer above int64
   * maximum
   */
  outcome::result<void> cborDecode(CborDecoder &d, Value &value);

  template <>
  struct CborKeepsTag<Value> : std::true_type {};

  /** Converts value into typed shape by re-encoding it */
  template <typename T>
  outcome::result<T> fromValue(const Value &value,
                               const CborDecoderConfig &config = {}) {
    Bytes bytes;
    BytesSink sink{bytes};
    CborEncoder encoder{sink};
    OUTCOME_TRY(encoder.encode(value));
    BytesSource source{bytes};
    CborDecoder decoder{source, config};
    T result{};
    OUTCOME_TRY(decoder.decode(result));
    return result;
  }
}  // namespace tc::codec::cbor
