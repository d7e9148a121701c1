/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_tagged.hpp"

#include <gtest/gtest.h>
#include <limits>

#include <boost/optional/optional_io.hpp>

#include "codec/cbor/cbor_value.hpp"
#include "codec/cbor/streams_annotation.hpp"
#include "testutil/cbor.hpp"

namespace tc::codec::cbor {
  using IntMap = std::map<std::string, int64_t>;
  using UintMap = std::map<std::string, uint64_t>;

  struct Meters {
    int64_t value{};
  };
  inline bool operator==(const Meters &l, const Meters &r) {
    return l.value == r.value;
  }
  CBOR_NEWTYPE(Meters, value)

  constexpr auto kMaxUint{std::numeric_limits<uint64_t>::max()};

  /**
   * @given Values with and without tag
   * @when Encode
   * @then Tag header is written only when tag is present
   */
  TEST(CborTagged, Encode) {
    expectEncodeAndReencode(Tagged<int>{boost::none, 5}, "05"_unhex);
    expectEncodeAndReencode(Tagged<int>{1, 5}, "C105"_unhex);
    expectEncodeAndReencode(Tagged<std::string>{32, "a"}, "D8206161"_unhex);
    expectEncodeAndReencode(
        std::vector<Tagged<int>>{{1, 1}, {boost::none, 5}}, "82C10105"_unhex);
  }

  /**
   * @given Whole input with optional tag header
   * @when Decode tag aware
   * @then Tag is kept, input must hold single item
   */
  TEST(CborTagged, FromTaggedBytes) {
    EXPECT_OUTCOME_EQ(Tagged<int>::fromTaggedBytes("C105"_unhex),
                      (Tagged<int>{1, 5}));
    EXPECT_OUTCOME_EQ(Tagged<int>::fromTaggedBytes("05"_unhex),
                      (Tagged<int>{boost::none, 5}));
    EXPECT_OUTCOME_EQ(
        Tagged<std::string>::fromTaggedBytes(
            "C074323031332D30332D32315432303A30343A30305A"_unhex),
        (Tagged<std::string>{0, "2013-03-21T20:04:00Z"}));
    // only outer tag is kept, inner one is skipped by value decode
    EXPECT_OUTCOME_EQ(Tagged<int>::fromTaggedBytes("C1C205"_unhex),
                      (Tagged<int>{1, 5}));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kEmptyInput,
                         Tagged<int>::fromTaggedBytes(Bytes{}));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kTrailingData,
                         Tagged<int>::fromTaggedBytes("C10500"_unhex));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType,
                         Tagged<int>::fromTaggedBytes("C16161"_unhex));
  }

  /**
   * @given Explicit tag record map
   * @when Decode shape inferred
   * @then Tag and value are taken from record
   */
  TEST(CborTagged, Record) {
    EXPECT_OUTCOME_EQ(
        decode<Tagged<IntMap>>("A263746167016576616C7565A1616101"_unhex),
        (Tagged<IntMap>{1, IntMap{{"a", 1}}}));
    EXPECT_OUTCOME_EQ(
        decode<Tagged<int>>("A263746167F66576616C756505"_unhex),
        (Tagged<int>{boost::none, 5}));
  }

  /**
   * @given Map which looks like tag record, but its value does not fit
   * @when Decode shape inferred
   * @then Whole map is value without tag
   */
  TEST(CborTagged, RecordFallback) {
    using AnyMap = std::map<std::string, Value>;
    AnyMap expected{{"tag", Value{1}}, {"value", Value{7}}};
    EXPECT_OUTCOME_EQ(
        decode<Tagged<AnyMap>>("A263746167016576616C756507"_unhex),
        (Tagged<AnyMap>{boost::none, expected}));

    // negative tag number is not a tag record
    EXPECT_OUTCOME_EQ(
        decode<Tagged<IntMap>>("A263746167206576616C756507"_unhex),
        (Tagged<IntMap>{boost::none, IntMap{{"tag", -1}, {"value", 7}}}));

    EXPECT_OUTCOME_ERROR(
        CborDecodeError::kWrongType,
        decode<Tagged<int>>("A263746167016576616C75656161"_unhex));
  }

  /**
   * @given Scalars, lists, plain maps and tag headers
   * @when Decode shape inferred
   * @then Tag only from header
   */
  TEST(CborTagged, Inferred) {
    expectDecodeOne("05"_unhex, Tagged<int>{boost::none, 5});
    expectDecodeOne("C105"_unhex, Tagged<int>{1, 5});
    expectDecodeOne("820102"_unhex,
                    Tagged<std::vector<int>>{boost::none, {1, 2}});
    expectDecodeOne("A1616101"_unhex,
                    Tagged<IntMap>{boost::none, IntMap{{"a", 1}}});
    expectDecodeOne("D820A1616101"_unhex, Tagged<IntMap>{32, IntMap{{"a", 1}}});
  }

  /**
   * @given Record with "value" key and optional "tag" key
   * @when Decode shape inferred
   * @then Missing tag is no tag, other keys are ignored
   */
  TEST(CborTagged, RecordWithoutTag) {
    expectDecodeOne("A16576616C756505"_unhex, Tagged<int>{boost::none, 5});
    expectDecodeOne("A26576616C756505617801"_unhex,
                    Tagged<int>{boost::none, 5});
    // map without "value" is the value itself
    expectDecodeOne("A16374616703"_unhex,
                    Tagged<IntMap>{boost::none, IntMap{{"tag", 3}}});
  }

  /**
   * @given Maps with integers above int64 maximum
   * @when Decode shape inferred
   * @then Result is same as decode of bare value, tag number keeps full range
   */
  TEST(CborTagged, LargeUint) {
    const auto map_bytes{"A161611BFFFFFFFFFFFFFFFF"_unhex};
    EXPECT_OUTCOME_EQ(decode<UintMap>(map_bytes), (UintMap{{"a", kMaxUint}}));
    expectDecodeOne(map_bytes,
                    Tagged<UintMap>{boost::none, UintMap{{"a", kMaxUint}}});
    expectDecodeOne("A2637461671BFFFFFFFFFFFFFFFF6576616C756505"_unhex,
                    Tagged<int>{kMaxUint, 5});
  }

  /// Nesting limit of caller applies to map read as record
  TEST(CborTagged, RecordDepth) {
    CborDecoderConfig config;
    config.max_depth = 1;
    EXPECT_OUTCOME_ERROR(
        CborDecodeError::kDepthLimit,
        decode<Tagged<IntMap>>("A263746167016576616C7565A1616101"_unhex,
                               config));
    config.max_depth = 2;
    EXPECT_OUTCOME_EQ(
        decode<Tagged<IntMap>>("A263746167016576616C7565A1616101"_unhex,
                               config),
        (Tagged<IntMap>{1, IntMap{{"a", 1}}}));
  }

  /**
   * @given Tagged newtype and optional tagged value
   * @when Encode and decode
   * @then Tag framing comes before wrapper list
   */
  TEST(CborTagged, Wrappers) {
    expectEncodeAndReencode(Tagged<Meters>{5, Meters{1}}, "C58101"_unhex);
    expectDecodeOne("C58101"_unhex, Meters{1});
    expectDecodeOne("8101"_unhex, Meters{1});

    using OptionalTagged = boost::optional<Tagged<int>>;
    expectDecodeOne("C501"_unhex, OptionalTagged{Tagged<int>{5, 1}});
    expectDecodeOne("F6"_unhex, OptionalTagged{});
  }

  /// "value" is required, "tag" is uint or null, other keys are ignored
  TEST(CborTagged, AsTagRecord) {
    auto record{
        asTagRecord("A363746167036576616C75656178656F7468657201"_unhex)};
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->tag, boost::make_optional<uint64_t>(3));
    EXPECT_EQ(record->value, "6178"_unhex);

    record = asTagRecord("A16576616C7565820102"_unhex);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->tag.has_value());
    EXPECT_EQ(record->value, "820102"_unhex);

    EXPECT_FALSE(asTagRecord("A16374616703"_unhex).has_value());
    EXPECT_FALSE(asTagRecord("01"_unhex).has_value());
    EXPECT_FALSE(
        asTagRecord("A26374616761336576616C756501"_unhex).has_value());
    EXPECT_FALSE(
        asTagRecord("A3637461670363746167046576616C756501"_unhex).has_value());
    EXPECT_FALSE(asTagRecord("A201026576616C756503"_unhex).has_value());
  }
}  // namespace tc::codec::cbor
