/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_value.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include <boost/optional/optional_io.hpp>

#include "testutil/cbor.hpp"

namespace tc::codec::cbor {
  /// Kind follows constructor argument
  TEST(CborValue, Kinds) {
    EXPECT_TRUE(Value{}.isNull());
    EXPECT_TRUE(Value{nullptr}.isNull());
    EXPECT_TRUE(Value{true}.isBool());
    EXPECT_TRUE(Value{1}.isInteger());
    EXPECT_TRUE(Value{uint32_t{1}}.isInteger());
    EXPECT_TRUE(Value{1.5}.isFloat());
    EXPECT_TRUE(Value{Bytes{1}}.isBytes());
    EXPECT_TRUE(Value{"a"}.isText());
    EXPECT_TRUE(Value{Value::Array{}}.isArray());
    EXPECT_TRUE(Value{Value::Map{}}.isMap());
    EXPECT_TRUE(Value::tag(1, 2).isTag());
    EXPECT_EQ(Value{"a"}.kind(), Value::Kind::kText);
  }

  /// Accessors return nothing for other kinds
  TEST(CborValue, Accessors) {
    Value value{5};
    EXPECT_EQ(value.asInteger(), boost::make_optional<int64_t>(5));
    EXPECT_FALSE(value.asBool().has_value());
    EXPECT_FALSE(value.asFloat().has_value());
    EXPECT_EQ(value.asText(), nullptr);
    EXPECT_EQ(value.asArray(), nullptr);

    Value array{Value::Array{1}};
    array.asArray()->push_back(Value{"x"});
    EXPECT_EQ(array, (Value{Value::Array{1, "x"}}));

    auto tagged{Value::tag(32, "a")};
    ASSERT_NE(tagged.asTag(), nullptr);
    EXPECT_EQ(tagged.asTag()->number, 32u);
    EXPECT_EQ(tagged.asTag()->value, Value{"a"});
  }

  /**
   * @given Unsigned integers
   * @when Convert to value
   * @then Values above int64 maximum are rejected
   */
  TEST(CborValue, FromUint) {
    EXPECT_OUTCOME_EQ(
        Value::fromUint(std::numeric_limits<int64_t>::max()),
        Value{std::numeric_limits<int64_t>::max()});
    EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                         Value::fromUint(uint64_t{1} << 63));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                         decode<Value>("1BFFFFFFFFFFFFFFFF"_unhex));
    EXPECT_OUTCOME_EQ(decode<Value>("3B7FFFFFFFFFFFFFFF"_unhex),
                      Value{std::numeric_limits<int64_t>::min()});
  }

  /**
   * @given Values of different kinds
   * @when Compare
   * @then Ordered by kind first, integer and float are never equal
   */
  TEST(CborValue, Ordering) {
    EXPECT_LT(Value{}, Value{false});
    EXPECT_LT(Value{true}, Value{0});
    EXPECT_LT(Value{1}, Value{2});
    EXPECT_LT(Value{100}, Value{0.5});
    EXPECT_LT(Value{"b"}, Value{Value::Array{}});
    EXPECT_LT(Value::tag(1, 5), Value::tag(2, 0));
    EXPECT_LT(Value::tag(1, 4), Value::tag(1, 5));
    EXPECT_NE(Value{1}, Value{1.0});
    EXPECT_GT(Value{"b"}, Value{"a"});

    const auto nan{std::numeric_limits<double>::quiet_NaN()};
    EXPECT_EQ(Value{nan}, Value{nan});
    EXPECT_LT(Value{1e300}, Value{nan});
  }

  /**
   * @given Map with keys of different kinds
   * @when Encode
   * @then Keys are written in value order
   */
  TEST(CborValue, MapOrder) {
    Value::Map map;
    map.emplace("a", 1);
    map.emplace(1, 2);
    map.emplace(false, 3);
    EXPECT_OUTCOME_EQ(encode(Value{map}), "A3F4030102616101"_unhex);
  }

  /**
   * @given Nested and tagged CBOR
   * @when Decode to value and encode back
   * @then Same bytes, tags are kept
   */
  TEST(CborValue, Reencode) {
    expectEncodeAndReencode(Value{Value::Array{1, Value::Array{2, 3}, "a"}},
                            "83018202036161"_unhex);
    expectEncodeAndReencode(Value::tag(1, 1363896240), "C11A514B67B0"_unhex);
    expectEncodeAndReencode(Value{Bytes{1, 2}}, "420102"_unhex);
    expectEncodeAndReencode(Value{-1000}, "3903E7"_unhex);
    expectEncodeAndReencode(Value{}, "F6"_unhex);

    // indefinite and short forms are normalized
    EXPECT_OUTCOME_EQ(encode(decode<Value>("9F01FF"_unhex).value()),
                      "8101"_unhex);
    EXPECT_OUTCOME_EQ(encode(decode<Value>("F93E00"_unhex).value()),
                      "FB3FF8000000000000"_unhex);
    EXPECT_OUTCOME_EQ(decode<Value>("F7"_unhex), Value{});
  }

  /// Later duplicate key wins
  TEST(CborValue, DuplicateKey) {
    Value::Map expected;
    expected.emplace("a", 2);
    EXPECT_OUTCOME_EQ(decode<Value>("A2616101616102"_unhex), Value{expected});
  }

  /**
   * @given Dynamic value
   * @when Convert to typed shape
   * @then Converted if shapes match
   */
  TEST(CborValue, FromValue) {
    Value::Map map;
    map.emplace("a", 1);
    EXPECT_OUTCOME_EQ((fromValue<std::map<std::string, int>>(Value{map})),
                      (std::map<std::string, int>{{"a", 1}}));
    EXPECT_OUTCOME_EQ(fromValue<int>(Value::tag(1, 5)), 5);
    EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType,
                         fromValue<int>(Value{"a"}));
  }
}  // namespace tc::codec::cbor
