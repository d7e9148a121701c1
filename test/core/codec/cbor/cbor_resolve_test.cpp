/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_resolve.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "testutil/cbor.hpp"

namespace tc::codec::cbor {
  struct CborResolveTest : testing::Test {
    void SetUp() override {
      // {"a": [1, {"b": 2}], 1: "one"}
      value = decode<Value>("A261618201A161620201636F6E65"_unhex).value();
    }

    outcome::result<Value> get(std::vector<std::string> path) {
      OUTCOME_TRY(found, resolve(value, path));
      return *found;
    }

    Value value;
  };

  /**
   * @given Nested maps and arrays
   * @when Resolve path
   * @then Subvalue is found
   */
  TEST_F(CborResolveTest, Found) {
    EXPECT_OUTCOME_EQ(get({}), value);
    EXPECT_OUTCOME_EQ(get({"a", "0"}), Value{1});
    EXPECT_OUTCOME_EQ(get({"a", "1", "b"}), Value{2});
    // integer key of map
    EXPECT_OUTCOME_EQ(get({"1"}), Value{"one"});
  }

  /**
   * @given Paths which do not match value
   * @when Resolve path
   * @then Error names mismatch
   */
  TEST_F(CborResolveTest, NotFound) {
    EXPECT_OUTCOME_ERROR(CborResolveError::kKeyNotFound, get({"c"}));
    EXPECT_OUTCOME_ERROR(CborResolveError::kKeyNotFound, get({"a", "2"}));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyExpected, get({"a", "x"}));
    EXPECT_OUTCOME_ERROR(CborResolveError::kContainerExpected,
                         get({"a", "0", "z"}));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyTooBig,
                         get({"a", "99999999999999999999999"}));
  }

  /// Tags are looked through
  TEST_F(CborResolveTest, Tag) {
    auto tagged{Value::tag(32, Value{Value::Array{5}})};
    EXPECT_OUTCOME_EQ(resolve(tagged, "0"),
                      &tagged.asTag()->value.asArray()->at(0));
  }

  /// Map key above int64 maximum is never an integer key
  TEST_F(CborResolveTest, BigMapKey) {
    Value::Map map;
    map.emplace(1, 2);
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyTooBig,
                         resolve(Value{map}, "9223372036854775808"));
  }

  /// Index is decimal digits only
  TEST(CborResolve, ParseIndex) {
    EXPECT_OUTCOME_EQ(parseIndex("0"), 0u);
    EXPECT_OUTCOME_EQ(parseIndex("18446744073709551615"),
                      std::numeric_limits<uint64_t>::max());
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyTooBig,
                         parseIndex("18446744073709551616"));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyExpected, parseIndex(""));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyExpected, parseIndex("-1"));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyExpected, parseIndex(" 1"));
    EXPECT_OUTCOME_ERROR(CborResolveError::kIntKeyExpected, parseIndex("1a"));
  }
}  // namespace tc::codec::cbor
